/*
 * contentmodel.h — Measured content node types (header-only, std::variant)
 *
 * Defines the block stream handed to the pagination core. Text shaping and
 * line breaking happen upstream; paragraphs arrive as per-line heights and
 * tables as per-row heights with per-cell line heights.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_CONTENTMODEL_H
#define PAGEFLOW_CONTENTMODEL_H

#include <QList>
#include <QPageLayout>
#include <QSizeF>
#include <QString>

#include <algorithm>
#include <optional>
#include <variant>

#include "pagelayout.h"

namespace Content {

// --- Document position tracking ---

// Opaque editor position range. Copied through to fragments, never interpreted.
struct PmRange {
    int pmStart = -1; // inclusive, -1 = unknown
    int pmEnd = -1;   // exclusive, -1 = unknown

    bool hasStart() const { return pmStart >= 0; }
    bool hasEnd() const { return pmEnd >= 0; }
    bool isEmpty() const { return !hasStart() && !hasEnd(); }

    // Expand this range to include other
    void merge(const PmRange &other)
    {
        if (other.hasStart())
            pmStart = hasStart() ? std::min(pmStart, other.pmStart) : other.pmStart;
        if (other.hasEnd())
            pmEnd = hasEnd() ? std::max(pmEnd, other.pmEnd) : other.pmEnd;
    }
};

struct LineMeasure {
    qreal lineHeight = 0;
    PmRange pm;
};

// --- Block nodes ---

struct Paragraph {
    QString id;
    QList<LineMeasure> lines;
    qreal spaceBefore = 0;
    qreal spaceAfter = 0;

    // Break constraints
    bool canBreak = true;
    bool keepWithNext = false;
    bool keepTogether = false;
    int orphanLines = 2; // min lines left at the bottom of a column
    int widowLines = 2;  // min lines carried to the top of the next column

    PmRange pm;

    qreal linesHeight(int from = 0, int to = -1) const
    {
        const int end = (to < 0 || to > lines.size()) ? int(lines.size()) : to;
        qreal h = 0;
        for (int i = std::max(0, from); i < end; ++i)
            h += lines[i].lineHeight;
        return h;
    }

    qreal measuredHeight() const { return linesHeight(); }
};

struct Image {
    QString id;
    qreal width = 0;
    qreal height = 0;
    bool keepWithNext = false;
    PmRange pm;
};

struct CellPadding {
    qreal top = 2;
    qreal bottom = 2;
    qreal left = 4;
    qreal right = 4;
};

struct TableCell {
    QList<Paragraph> blocks; // cell content in document order
    CellPadding padding;
    int colSpan = 1;
    int rowSpan = 1;

    // All lines across the cell's paragraphs
    QList<LineMeasure> lines() const
    {
        QList<LineMeasure> all;
        for (const auto &b : blocks)
            all.append(b.lines);
        return all;
    }

    int lineCount() const
    {
        int n = 0;
        for (const auto &b : blocks)
            n += b.lines.size();
        return n;
    }
};

struct TableRow {
    QList<TableCell> cells;
    qreal height = 0;                 // measured height, padding included
    std::optional<qreal> explicitHeight; // row height rule from the document
    bool cantSplit = false;
    bool repeatHeader = false;
};

enum class BorderCollapse { Collapse, Separate };
enum class TableJustification { Left, Center, Right, End };

struct TableAttrs {
    BorderCollapse borderCollapse = BorderCollapse::Collapse;
    qreal cellSpacing = 0;
    std::optional<TableJustification> justification;
    // May hold NaN or infinity from a malformed source; see Tables::tableIndentWidth()
    qreal tableIndent = 0;
    bool floating = false; // positioned table properties present
    bool anchored = false; // placed by the host's float manager
};

struct Table {
    QString id;
    QList<TableRow> rows;
    QList<qreal> columnWidths;
    qreal totalWidth = 0;
    qreal totalHeight = 0;
    TableAttrs attrs;
    bool keepWithNext = false;
    PmRange pm;
};

enum class SectionType { Continuous, NextPage, EvenPage, OddPage };

// Optional per-field overrides carried by a section break.
struct SectionMargins {
    std::optional<qreal> top;
    std::optional<qreal> bottom;
    std::optional<qreal> left;
    std::optional<qreal> right;
    std::optional<qreal> header;
    std::optional<qreal> footer;

    bool isEmpty() const
    {
        return !top && !bottom && !left && !right && !header && !footer;
    }
};

struct SectionBreak {
    QString id;
    std::optional<SectionType> type; // absent = continuous
    SectionMargins margins;
    std::optional<QSizeF> pageSize;
    std::optional<QPageLayout::Orientation> orientation;
    std::optional<ColumnLayout> columns; // absent = single column
    std::optional<bool> balanceColumns;
    bool isFirstSection = false;
    bool requirePageBoundary = false;
};

using BlockNode = std::variant<
    Paragraph,
    Table,
    Image,
    SectionBreak
>;

// --- Document ---

struct Document {
    QList<BlockNode> blocks;
    PageLayout pageLayout;              // base geometry before any section break
    qreal maxHeaderContentHeight = 0;   // tallest header across variants
    qreal maxFooterContentHeight = 0;
};

inline QString blockId(const BlockNode &node)
{
    return std::visit([](const auto &b) { return b.id; }, node);
}

} // namespace Content

#endif // PAGEFLOW_CONTENTMODEL_H
