/*
 * pagelayout.h — Page geometry: size, orientation, margins, columns
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_PAGELAYOUT_H
#define PAGEFLOW_PAGELAYOUT_H

#include <QJsonObject>
#include <QMarginsF>
#include <QPageLayout>
#include <QSizeF>
#include <QString>

#include <algorithm>

// All geometry is in layout units (CSS pixels, 96 per inch).

struct ColumnLayout
{
    int count = 1;
    qreal gap = 0;

    // Word refuses more columns than this
    static constexpr int kMaxCount = 45;

    bool isMultiColumn() const { return count > 1; }

    bool operator==(const ColumnLayout &other) const
    {
        return count == other.count && gap == other.gap;
    }
    bool operator!=(const ColumnLayout &other) const { return !(*this == other); }

    static ColumnLayout singleColumn() { return ColumnLayout{}; }
};

struct PageLayout
{
    QSizeF pageSize{816.0, 1056.0}; // US Letter
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QMarginsF margins{96.0, 96.0, 96.0, 96.0}; // left, top, right, bottom

    // Distance from the page edge to the header / footer band
    qreal headerDistance = 48.0;
    qreal footerDistance = 48.0;

    ColumnLayout columns;

    static constexpr qreal kPixelsPerInch = 96.0;

    qreal contentWidth() const
    {
        return std::max<qreal>(0.0, pageSize.width() - margins.left() - margins.right());
    }

    qreal contentHeight() const
    {
        return std::max<qreal>(0.0, pageSize.height() - margins.top() - margins.bottom());
    }

    // Width of one column when contentWidth is shared by cols.count columns.
    static qreal columnWidthFor(qreal contentWidth, const ColumnLayout &cols)
    {
        const int count = std::max(1, cols.count);
        const qreal gaps = cols.gap * (count - 1);
        return std::max<qreal>(0.0, (contentWidth - gaps) / count);
    }

    // Standard paper names ("A4", "Letter", "Legal", "A5", "B5") in layout units.
    // Unknown names yield Letter and set *ok to false.
    static QSizeF standardPageSize(const QString &name, bool *ok = nullptr);

    static PageLayout fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

namespace PageGeometry {

QJsonObject columnsToJson(const ColumnLayout &columns);
ColumnLayout columnsFromJson(const QJsonObject &obj);

QString orientationToString(QPageLayout::Orientation orientation);
QPageLayout::Orientation orientationFromString(const QString &str, bool *ok = nullptr);

} // namespace PageGeometry

#endif // PAGEFLOW_PAGELAYOUT_H
