/*
 * pagelayout.cpp — JSON serialization for PageLayout
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"

#include <QDebug>
#include <QJsonValue>
#include <QPageSize>

#include <cmath>

namespace {

// Finite, non-negative number or the fallback
qreal nonNegative(const QJsonValue &value, qreal fallback)
{
    if (!value.isDouble())
        return fallback;
    const qreal v = value.toDouble();
    if (!std::isfinite(v))
        return fallback;
    return std::max<qreal>(0.0, v);
}

} // anonymous namespace

QSizeF PageLayout::standardPageSize(const QString &name, bool *ok)
{
    QPageSize::PageSizeId id = QPageSize::Letter;
    bool known = true;
    if (name.compare(QLatin1String("Letter"), Qt::CaseInsensitive) == 0)     id = QPageSize::Letter;
    else if (name.compare(QLatin1String("A4"), Qt::CaseInsensitive) == 0)    id = QPageSize::A4;
    else if (name.compare(QLatin1String("A5"), Qt::CaseInsensitive) == 0)    id = QPageSize::A5;
    else if (name.compare(QLatin1String("Legal"), Qt::CaseInsensitive) == 0) id = QPageSize::Legal;
    else if (name.compare(QLatin1String("B5"), Qt::CaseInsensitive) == 0)    id = QPageSize::B5;
    else known = false;

    if (ok)
        *ok = known;

    // Points are 1/72 inch
    const QSizeF pt = QPageSize(id).size(QPageSize::Point);
    constexpr qreal ptToPx = kPixelsPerInch / 72.0;
    return QSizeF(pt.width() * ptToPx, pt.height() * ptToPx);
}

// ---------------------------------------------------------------------------
// fromJson / toJson for page layout
// ---------------------------------------------------------------------------

PageLayout PageLayout::fromJson(const QJsonObject &obj)
{
    PageLayout pl;

    const QJsonValue size = obj.value(QLatin1String("pageSize"));
    if (size.isString()) {
        bool ok = false;
        pl.pageSize = standardPageSize(size.toString(), &ok);
        if (!ok)
            qWarning() << "PageLayout: unknown page size" << size.toString() << "- using Letter";
    } else if (size.isObject()) {
        const QJsonObject s = size.toObject();
        pl.pageSize = QSizeF(nonNegative(s.value(QLatin1String("w")), pl.pageSize.width()),
                             nonNegative(s.value(QLatin1String("h")), pl.pageSize.height()));
    }

    if (obj.contains(QLatin1String("orientation"))) {
        pl.orientation = PageGeometry::orientationFromString(
            obj.value(QLatin1String("orientation")).toString());
    }
    // A named landscape size is stored rotated
    if (pl.orientation == QPageLayout::Landscape && size.isString()
        && pl.pageSize.height() > pl.pageSize.width()) {
        pl.pageSize.transpose();
    }

    if (obj.contains(QLatin1String("margins"))) {
        const QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        pl.margins = QMarginsF(
            nonNegative(m.value(QLatin1String("left")), pl.margins.left()),
            nonNegative(m.value(QLatin1String("top")), pl.margins.top()),
            nonNegative(m.value(QLatin1String("right")), pl.margins.right()),
            nonNegative(m.value(QLatin1String("bottom")), pl.margins.bottom()));
        pl.headerDistance = nonNegative(m.value(QLatin1String("header")), pl.headerDistance);
        pl.footerDistance = nonNegative(m.value(QLatin1String("footer")), pl.footerDistance);
    }

    if (obj.contains(QLatin1String("columns")))
        pl.columns = PageGeometry::columnsFromJson(obj.value(QLatin1String("columns")).toObject());

    return pl;
}

QJsonObject PageLayout::toJson() const
{
    QJsonObject obj;

    QJsonObject s;
    s[QLatin1String("w")] = pageSize.width();
    s[QLatin1String("h")] = pageSize.height();
    obj[QLatin1String("pageSize")] = s;
    obj[QLatin1String("orientation")] = PageGeometry::orientationToString(orientation);

    QJsonObject m;
    m[QLatin1String("left")]   = margins.left();
    m[QLatin1String("top")]    = margins.top();
    m[QLatin1String("right")]  = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    m[QLatin1String("header")] = headerDistance;
    m[QLatin1String("footer")] = footerDistance;
    obj[QLatin1String("margins")] = m;

    obj[QLatin1String("columns")] = PageGeometry::columnsToJson(columns);
    return obj;
}

namespace PageGeometry {

QJsonObject columnsToJson(const ColumnLayout &columns)
{
    QJsonObject c;
    c[QLatin1String("count")] = columns.count;
    c[QLatin1String("gap")] = columns.gap;
    return c;
}

ColumnLayout columnsFromJson(const QJsonObject &obj)
{
    ColumnLayout cols;
    const QJsonValue count = obj.value(QLatin1String("count"));
    if (count.isDouble() && std::isfinite(count.toDouble()) && count.toDouble() >= 1.0) {
        const qreal n = qBound<qreal>(1.0, count.toDouble(), ColumnLayout::kMaxCount);
        if (n < count.toDouble())
            qWarning() << "PageLayout: column count" << count.toDouble() << "clamped to" << ColumnLayout::kMaxCount;
        cols.count = static_cast<int>(n);
    }
    cols.gap = nonNegative(obj.value(QLatin1String("gap")), 0.0);
    return cols;
}

QString orientationToString(QPageLayout::Orientation orientation)
{
    return orientation == QPageLayout::Landscape ? QStringLiteral("landscape")
                                                 : QStringLiteral("portrait");
}

QPageLayout::Orientation orientationFromString(const QString &str, bool *ok)
{
    if (ok)
        *ok = true;
    if (str == QLatin1String("landscape"))
        return QPageLayout::Landscape;
    if (str != QLatin1String("portrait") && ok)
        *ok = false;
    return QPageLayout::Portrait;
}

} // namespace PageGeometry
