/*
 * tablefragmenter.h — Row-level table pagination with mid-row splits
 *
 * Turns one measured table into TableFragments placed through a PageCursor.
 * Rows flow until the column is full; rows that may split are cut mid-row,
 * each cell keeping its own line window, and the remainder continues in the
 * next column or page behind repeated header rows.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_TABLEFRAGMENTER_H
#define PAGEFLOW_TABLEFRAGMENTER_H

#include <QList>

#include <optional>

#include "contentmodel.h"
#include "pagecursor.h"

namespace Tables {

// Smallest leftover height worth starting a partial row in
constexpr qreal kMinPartialRowHeight = 20.0;
// Tolerance when comparing an explicit row height against its content
constexpr qreal kRowHeightEpsilon = 0.1;

constexpr qreal kMinColumnResizeWidth = 25.0;
constexpr qreal kMaxColumnResizeWidth = 200.0;

struct TableLayoutContext {
    const Content::Table &table;
    qreal columnWidth;
    Layout::PageCursor &cursor;
};

struct Frame {
    qreal x = 0;
    qreal width = 0;
};

struct SplitPoint {
    int endRow = 0; // exclusive
    std::optional<Layout::PartialRowInfo> partialRow;
};

// --- Frame geometry ---

// Finite indent from the table attributes, 0 otherwise. Negative indents
// pull the table into the left margin.
qreal tableIndentWidth(const Content::TableAttrs &attrs);
Frame applyTableIndent(qreal x, qreal width, qreal indent);
Frame resolveTableFrame(qreal baseX, qreal columnWidth, qreal tableWidth,
                        const Content::TableAttrs &attrs);

// Spacing between cells; only "separate" borders have any.
qreal tableCellSpacing(const Content::TableAttrs &attrs);

// --- Row measurement ---

// Contiguous leading rows flagged repeatHeader
int countHeaderRows(const Content::Table &table);
qreal sumRowHeights(const QList<Content::TableRow> &rows, int fromRow, int toRow);
// Tallest cell: its lines plus its vertical padding
qreal rowContentHeight(const Content::TableRow &row);
// Row has an explicit height rule that leaves room beyond its content
bool hasExplicitRowHeightSlack(const Content::TableRow &row);

// Lines each cell of rowIndex can show within availableHeight, starting at
// fromLineByCell (empty = from the top). Throws std::out_of_range for a row
// index outside the table.
Layout::PartialRowInfo computePartialRow(const Content::Table &table,
                                         int rowIndex,
                                         qreal availableHeight,
                                         const QList<int> &fromLineByCell = {});

// Where the fragment starting at startRow has to end. fullPageHeight <= 0
// disables the over-tall row check.
SplitPoint findSplitPoint(const Content::Table &table,
                          int startRow,
                          qreal availableHeight,
                          qreal fullPageHeight,
                          qreal cellSpacing,
                          bool isContinuation);

qreal calculateFragmentHeight(const Content::Table &table,
                              int fromRow, int toRow,
                              int repeatHeaderCount,
                              qreal cellSpacing,
                              bool includeTopSpacing);

// --- Fragment metadata ---

QList<Layout::ColumnBoundary> generateColumnBoundaries(const Content::Table &table);
Content::PmRange computeTableFragmentPmRange(const Content::Table &table,
                                             int fromRow, int toRow,
                                             const std::optional<Layout::PartialRowInfo> &partialRow);

// --- Placement ---

void layoutTableBlock(const TableLayoutContext &ctx);

// Whole-table fragment at a position chosen by the host (anchored tables)
Layout::TableFragment createAnchoredTableFragment(const Content::Table &table, qreal x, qreal y);

} // namespace Tables

#endif // PAGEFLOW_TABLEFRAGMENTER_H
