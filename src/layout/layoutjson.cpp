/*
 * layoutjson.cpp — JSON view of a layout result
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutjson.h"

#include <QJsonArray>

namespace LayoutJson {

namespace {

void writePm(QJsonObject &obj, const Content::PmRange &pm)
{
    if (pm.hasStart())
        obj[QLatin1String("pmStart")] = pm.pmStart;
    if (pm.hasEnd())
        obj[QLatin1String("pmEnd")] = pm.pmEnd;
}

QJsonArray intArray(const QList<int> &values)
{
    QJsonArray arr;
    for (int v : values)
        arr.append(v);
    return arr;
}

QJsonObject partialRowToJson(const Layout::PartialRowInfo &partial)
{
    QJsonObject obj;
    obj[QLatin1String("rowIndex")] = partial.rowIndex;
    obj[QLatin1String("fromLineByCell")] = intArray(partial.fromLineByCell);
    obj[QLatin1String("toLineByCell")] = intArray(partial.toLineByCell);
    obj[QLatin1String("isFirstPart")] = partial.isFirstPart;
    obj[QLatin1String("isLastPart")] = partial.isLastPart;
    obj[QLatin1String("partialHeight")] = partial.partialHeight;
    return obj;
}

} // anonymous namespace

QJsonObject fragmentToJson(const Layout::Fragment &fragment)
{
    QJsonObject obj;
    std::visit([&](const auto &f) {
        using T = std::decay_t<decltype(f)>;
        obj[QLatin1String("blockId")] = f.blockId;
        obj[QLatin1String("x")] = f.x;
        obj[QLatin1String("y")] = f.y;
        obj[QLatin1String("width")] = f.width;
        obj[QLatin1String("height")] = f.height;
        writePm(obj, f.pm);

        if constexpr (std::is_same_v<T, Layout::ParagraphFragment>) {
            obj[QLatin1String("kind")] = QStringLiteral("paragraph");
            obj[QLatin1String("fromLine")] = f.fromLine;
            obj[QLatin1String("toLine")] = f.toLine;
            if (f.continuesFromPrev)
                obj[QLatin1String("continuesFromPrev")] = true;
            if (f.continuesOnNext)
                obj[QLatin1String("continuesOnNext")] = true;
        } else if constexpr (std::is_same_v<T, Layout::ImageFragment>) {
            obj[QLatin1String("kind")] = QStringLiteral("image");
        } else if constexpr (std::is_same_v<T, Layout::TableFragment>) {
            obj[QLatin1String("kind")] = QStringLiteral("table");
            obj[QLatin1String("fromRow")] = f.fromRow;
            obj[QLatin1String("toRow")] = f.toRow;
            if (f.repeatHeaderCount > 0)
                obj[QLatin1String("repeatHeaderCount")] = f.repeatHeaderCount;
            if (f.continuesFromPrev)
                obj[QLatin1String("continuesFromPrev")] = true;
            if (f.continuesOnNext)
                obj[QLatin1String("continuesOnNext")] = true;
            if (f.partialRow)
                obj[QLatin1String("partialRow")] = partialRowToJson(*f.partialRow);

            QJsonArray boundaries;
            for (const auto &b : f.columnBoundaries) {
                QJsonObject bo;
                bo[QLatin1String("index")] = b.index;
                bo[QLatin1String("x")] = b.x;
                bo[QLatin1String("width")] = b.width;
                bo[QLatin1String("minWidth")] = b.minWidth;
                bo[QLatin1String("resizable")] = b.resizable;
                boundaries.append(bo);
            }
            if (!boundaries.isEmpty())
                obj[QLatin1String("columnBoundaries")] = boundaries;
        }
    }, fragment);
    return obj;
}

QJsonObject pageToJson(const Layout::Page &page)
{
    QJsonObject obj;
    obj[QLatin1String("pageNumber")] = page.pageNumber;

    QJsonObject size;
    size[QLatin1String("w")] = page.size.width();
    size[QLatin1String("h")] = page.size.height();
    obj[QLatin1String("size")] = size;
    obj[QLatin1String("orientation")] = PageGeometry::orientationToString(page.orientation);

    QJsonObject margins;
    margins[QLatin1String("left")] = page.margins.left();
    margins[QLatin1String("top")] = page.margins.top();
    margins[QLatin1String("right")] = page.margins.right();
    margins[QLatin1String("bottom")] = page.margins.bottom();
    obj[QLatin1String("margins")] = margins;
    obj[QLatin1String("columns")] = PageGeometry::columnsToJson(page.columns);
    if (page.isBlank)
        obj[QLatin1String("blank")] = true;

    QJsonArray fragments;
    for (const auto &f : page.fragments)
        fragments.append(fragmentToJson(f));
    obj[QLatin1String("fragments")] = fragments;
    return obj;
}

QJsonObject resultToJson(const Layout::LayoutResult &result)
{
    QJsonArray pages;
    for (const auto &page : result.pages)
        pages.append(pageToJson(page));

    QJsonObject obj;
    obj[QLatin1String("pageCount")] = result.pages.size();
    obj[QLatin1String("pages")] = pages;
    return obj;
}

} // namespace LayoutJson
