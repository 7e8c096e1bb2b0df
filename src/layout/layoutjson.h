/*
 * layoutjson.h — JSON view of a layout result
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_LAYOUTJSON_H
#define PAGEFLOW_LAYOUTJSON_H

#include <QJsonObject>

#include "layoutengine.h"
#include "pagecursor.h"

namespace LayoutJson {

QJsonObject fragmentToJson(const Layout::Fragment &fragment);
QJsonObject pageToJson(const Layout::Page &page);

// { "pageCount": n, "pages": [...] }
QJsonObject resultToJson(const Layout::LayoutResult &result);

} // namespace LayoutJson

#endif // PAGEFLOW_LAYOUTJSON_H
