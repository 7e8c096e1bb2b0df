/*
 * contentjson.cpp — Read measured documents from JSON fixtures
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentjson.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ContentJson {

namespace {

std::optional<qreal> optionalNumber(const QJsonValue &value)
{
    if (!value.isDouble() || !std::isfinite(value.toDouble()))
        return std::nullopt;
    return value.toDouble();
}

qreal length(const QJsonObject &obj, const char *key, qreal fallback = 0)
{
    const auto v = optionalNumber(obj.value(QLatin1String(key)));
    return v ? std::max<qreal>(0.0, *v) : fallback;
}

int pmValue(const QJsonObject &obj, const char *key)
{
    const auto v = optionalNumber(obj.value(QLatin1String(key)));
    if (!v || *v < 0)
        return -1;
    return static_cast<int>(qBound<qreal>(0.0, *v, std::numeric_limits<int>::max()));
}

Content::PmRange pmRangeFromJson(const QJsonObject &obj)
{
    return Content::PmRange{pmValue(obj, "pmStart"), pmValue(obj, "pmEnd")};
}

QList<Content::LineMeasure> linesFromJson(const QJsonArray &arr)
{
    QList<Content::LineMeasure> lines;
    for (const auto &v : arr) {
        Content::LineMeasure line;
        if (v.isObject()) {
            const QJsonObject o = v.toObject();
            line.lineHeight = length(o, "h");
            line.pm = pmRangeFromJson(o);
        } else {
            line.lineHeight = std::max<qreal>(0.0, optionalNumber(v).value_or(0.0));
        }
        lines.append(line);
    }
    return lines;
}

std::optional<QSizeF> pageSizeFromJson(const QJsonValue &value)
{
    if (value.isString()) {
        bool ok = false;
        const QSizeF size = PageLayout::standardPageSize(value.toString(), &ok);
        if (!ok) {
            qWarning() << "ContentJson: unknown page size" << value.toString();
            return std::nullopt;
        }
        return size;
    }
    if (value.isObject()) {
        const QJsonObject s = value.toObject();
        return QSizeF(length(s, "w"), length(s, "h"));
    }
    return std::nullopt;
}

Content::Image imageFromJson(const QJsonObject &obj)
{
    Content::Image img;
    img.id = obj.value(QLatin1String("id")).toString();
    img.width = length(obj, "width");
    img.height = length(obj, "height");
    img.keepWithNext = obj.value(QLatin1String("keepWithNext")).toBool();
    img.pm = pmRangeFromJson(obj);
    return img;
}

Content::TableCell cellFromJson(const QJsonObject &obj)
{
    Content::TableCell cell;
    if (obj.contains(QLatin1String("blocks"))) {
        for (const auto &b : obj.value(QLatin1String("blocks")).toArray())
            cell.blocks.append(paragraphFromJson(b.toObject()));
    } else if (obj.contains(QLatin1String("lines"))) {
        Content::Paragraph para;
        para.lines = linesFromJson(obj.value(QLatin1String("lines")).toArray());
        para.pm = pmRangeFromJson(obj);
        cell.blocks.append(para);
    }

    const QJsonObject padding = obj.value(QLatin1String("padding")).toObject();
    cell.padding.top = length(padding, "top", cell.padding.top);
    cell.padding.bottom = length(padding, "bottom", cell.padding.bottom);
    cell.padding.left = length(padding, "left", cell.padding.left);
    cell.padding.right = length(padding, "right", cell.padding.right);

    cell.colSpan = std::max(1, obj.value(QLatin1String("colSpan")).toInt(1));
    cell.rowSpan = std::max(1, obj.value(QLatin1String("rowSpan")).toInt(1));
    return cell;
}

std::optional<Content::TableJustification> justificationFromString(const QString &str)
{
    if (str == QLatin1String("left"))
        return Content::TableJustification::Left;
    if (str == QLatin1String("center"))
        return Content::TableJustification::Center;
    if (str == QLatin1String("right"))
        return Content::TableJustification::Right;
    if (str == QLatin1String("end"))
        return Content::TableJustification::End;
    return std::nullopt;
}

std::optional<Content::SectionType> sectionTypeFromString(const QString &str, bool *ok)
{
    *ok = true;
    if (str == QLatin1String("continuous"))
        return Content::SectionType::Continuous;
    if (str == QLatin1String("nextPage"))
        return Content::SectionType::NextPage;
    if (str == QLatin1String("evenPage"))
        return Content::SectionType::EvenPage;
    if (str == QLatin1String("oddPage"))
        return Content::SectionType::OddPage;
    *ok = str.isEmpty();
    return std::nullopt;
}

} // anonymous namespace

// --- Blocks ---

Content::Paragraph paragraphFromJson(const QJsonObject &obj)
{
    Content::Paragraph para;
    para.id = obj.value(QLatin1String("id")).toString();
    para.lines = linesFromJson(obj.value(QLatin1String("lines")).toArray());
    para.spaceBefore = length(obj, "spaceBefore");
    para.spaceAfter = length(obj, "spaceAfter");
    para.canBreak = obj.value(QLatin1String("canBreak")).toBool(true);
    para.keepWithNext = obj.value(QLatin1String("keepWithNext")).toBool();
    para.keepTogether = obj.value(QLatin1String("keepTogether")).toBool();
    para.orphanLines = std::max(0, obj.value(QLatin1String("orphanLines")).toInt(para.orphanLines));
    para.widowLines = std::max(0, obj.value(QLatin1String("widowLines")).toInt(para.widowLines));
    para.pm = pmRangeFromJson(obj);
    return para;
}

Content::Table tableFromJson(const QJsonObject &obj)
{
    Content::Table table;
    table.id = obj.value(QLatin1String("id")).toString();

    for (const auto &rv : obj.value(QLatin1String("rows")).toArray()) {
        const QJsonObject ro = rv.toObject();
        Content::TableRow row;
        for (const auto &cv : ro.value(QLatin1String("cells")).toArray())
            row.cells.append(cellFromJson(cv.toObject()));
        row.explicitHeight = optionalNumber(ro.value(QLatin1String("explicitHeight")));
        row.cantSplit = ro.value(QLatin1String("cantSplit")).toBool();
        row.repeatHeader = ro.value(QLatin1String("repeatHeader")).toBool();

        // Measured height defaults to the tallest cell, stretched by an explicit height
        qreal content = 0;
        for (const auto &cell : row.cells) {
            qreal lines = 0;
            for (const auto &line : cell.lines())
                lines += line.lineHeight;
            content = std::max(content, lines + cell.padding.top + cell.padding.bottom);
        }
        if (row.explicitHeight)
            content = std::max(content, *row.explicitHeight);
        row.height = length(ro, "height", content);

        table.rows.append(row);
    }

    for (const auto &w : obj.value(QLatin1String("columnWidths")).toArray())
        table.columnWidths.append(std::max<qreal>(0.0, optionalNumber(w).value_or(0.0)));

    qreal widthSum = 0;
    for (qreal w : table.columnWidths)
        widthSum += w;
    qreal heightSum = 0;
    for (const auto &row : table.rows)
        heightSum += row.height;
    table.totalWidth = length(obj, "totalWidth", widthSum);
    table.totalHeight = length(obj, "totalHeight", heightSum);

    Content::TableAttrs &attrs = table.attrs;
    if (obj.value(QLatin1String("borderCollapse")).toString() == QLatin1String("separate"))
        attrs.borderCollapse = Content::BorderCollapse::Separate;
    attrs.cellSpacing = length(obj, "cellSpacing");
    attrs.justification = justificationFromString(obj.value(QLatin1String("justification")).toString());
    attrs.tableIndent = optionalNumber(obj.value(QLatin1String("tableIndent"))).value_or(0.0);
    attrs.floating = obj.value(QLatin1String("floating")).toBool();
    attrs.anchored = obj.value(QLatin1String("anchored")).toBool();

    table.keepWithNext = obj.value(QLatin1String("keepWithNext")).toBool();
    table.pm = pmRangeFromJson(obj);
    return table;
}

Content::SectionBreak sectionBreakFromJson(const QJsonObject &obj)
{
    Content::SectionBreak sb;
    sb.id = obj.value(QLatin1String("id")).toString();

    bool ok = true;
    sb.type = sectionTypeFromString(obj.value(QLatin1String("type")).toString(), &ok);
    if (!ok)
        qWarning() << "ContentJson: unknown section type" << obj.value(QLatin1String("type")).toString();

    // Raw values; the section state machine clamps them
    const QJsonObject m = obj.value(QLatin1String("margins")).toObject();
    sb.margins.top = optionalNumber(m.value(QLatin1String("top")));
    sb.margins.bottom = optionalNumber(m.value(QLatin1String("bottom")));
    sb.margins.left = optionalNumber(m.value(QLatin1String("left")));
    sb.margins.right = optionalNumber(m.value(QLatin1String("right")));
    sb.margins.header = optionalNumber(m.value(QLatin1String("header")));
    sb.margins.footer = optionalNumber(m.value(QLatin1String("footer")));

    sb.pageSize = pageSizeFromJson(obj.value(QLatin1String("pageSize")));
    if (obj.contains(QLatin1String("orientation"))) {
        bool orientationOk = false;
        const auto orientation = PageGeometry::orientationFromString(
            obj.value(QLatin1String("orientation")).toString(), &orientationOk);
        if (orientationOk)
            sb.orientation = orientation;
        else
            qWarning() << "ContentJson: unknown orientation" << obj.value(QLatin1String("orientation")).toString();
    }
    if (obj.contains(QLatin1String("columns")))
        sb.columns = PageGeometry::columnsFromJson(obj.value(QLatin1String("columns")).toObject());
    if (obj.value(QLatin1String("balanceColumns")).isBool())
        sb.balanceColumns = obj.value(QLatin1String("balanceColumns")).toBool();

    sb.isFirstSection = obj.value(QLatin1String("isFirstSection")).toBool();
    sb.requirePageBoundary = obj.value(QLatin1String("requirePageBoundary")).toBool();
    return sb;
}

// --- Documents ---

Result parseObject(const QJsonObject &root)
{
    Result result;
    Content::Document &doc = result.document;

    if (root.contains(QLatin1String("pageLayout")))
        doc.pageLayout = PageLayout::fromJson(root.value(QLatin1String("pageLayout")).toObject());
    doc.maxHeaderContentHeight = length(root, "maxHeaderContentHeight");
    doc.maxFooterContentHeight = length(root, "maxFooterContentHeight");
    result.balancing = root.value(QLatin1String("balancing")).toObject();

    const QJsonValue blocks = root.value(QLatin1String("blocks"));
    if (!blocks.isArray()) {
        result.valid = false;
        result.errorMessage = QStringLiteral("missing \"blocks\" array");
        return result;
    }

    QSet<QString> seenIds;
    const QJsonArray arr = blocks.toArray();
    for (int i = 0; i < arr.size(); ++i) {
        const QJsonObject obj = arr.at(i).toObject();
        const QString kind = obj.value(QLatin1String("kind")).toString();

        Content::BlockNode node;
        if (kind == QLatin1String("paragraph")) {
            node = paragraphFromJson(obj);
        } else if (kind == QLatin1String("table")) {
            node = tableFromJson(obj);
        } else if (kind == QLatin1String("image")) {
            node = imageFromJson(obj);
        } else if (kind == QLatin1String("sectionBreak")) {
            node = sectionBreakFromJson(obj);
        } else {
            result.valid = false;
            result.errorMessage = QStringLiteral("block %1: unknown kind \"%2\"").arg(i).arg(kind);
            return result;
        }

        // Every block needs an id; balancing and fragments key on it
        std::visit([&](auto &b) {
            if (b.id.isEmpty())
                b.id = QStringLiteral("block-%1").arg(i);
            if (seenIds.contains(b.id))
                qWarning() << "ContentJson: duplicate block id" << b.id;
            seenIds.insert(b.id);
        }, node);

        doc.blocks.append(node);
    }

    return result;
}

Result parse(const QByteArray &json)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (doc.isNull()) {
        Result result;
        result.valid = false;
        result.errorMessage = error.errorString();
        return result;
    }
    if (!doc.isObject()) {
        Result result;
        result.valid = false;
        result.errorMessage = QStringLiteral("document root must be an object");
        return result;
    }
    return parseObject(doc.object());
}

Result load(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        Result result;
        result.valid = false;
        result.errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "ContentJson:" << result.errorMessage;
        return result;
    }

    Result result = parse(file.readAll());
    if (!result.valid)
        qWarning() << "ContentJson:" << path << result.errorMessage;
    return result;
}

} // namespace ContentJson
