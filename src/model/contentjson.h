/*
 * contentjson.h — Read measured documents from JSON fixtures
 *
 * Fixture layout:
 *   { "pageLayout": {...}, "maxHeaderContentHeight": n, "maxFooterContentHeight": n,
 *     "balancing": {...},
 *     "blocks": [ { "kind": "paragraph" | "table" | "image" | "sectionBreak", ... } ] }
 *
 * Paragraph lines are either plain heights or { "h", "pmStart", "pmEnd" }
 * objects. Table cells carry "lines" (one paragraph) or "blocks".
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_CONTENTJSON_H
#define PAGEFLOW_CONTENTJSON_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "contentmodel.h"

namespace ContentJson {

struct Result {
    Content::Document document;
    bool valid = true;
    QString errorMessage; // non-empty if invalid
    QJsonObject balancing; // host's balancing options, read by Balancing::Config::fromJson
};

Result parse(const QByteArray &json);
Result parseObject(const QJsonObject &root);
Result load(const QString &path);

// Block readers, exposed for tests and hosts that build documents piecemeal
Content::Paragraph paragraphFromJson(const QJsonObject &obj);
Content::Table tableFromJson(const QJsonObject &obj);
Content::SectionBreak sectionBreakFromJson(const QJsonObject &obj);

} // namespace ContentJson

#endif // PAGEFLOW_CONTENTJSON_H
