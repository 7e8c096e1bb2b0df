/*
 * tablefragmenter.cpp — Row-level table pagination with mid-row splits
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tablefragmenter.h"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Tables {

using Content::Table;
using Content::TableAttrs;
using Content::TableRow;
using Layout::PartialRowInfo;
using Layout::TableFragment;

namespace {

qreal cellLinesHeight(const QList<Content::LineMeasure> &lines, int from, int to)
{
    qreal h = 0;
    for (int i = std::max(0, from); i < to && i < lines.size(); ++i)
        h += lines[i].lineHeight;
    return h;
}

qreal verticalPadding(const Content::TableCell &cell)
{
    return cell.padding.top + cell.padding.bottom;
}

bool madeProgress(const PartialRowInfo &partial)
{
    for (int i = 0; i < partial.toLineByCell.size(); ++i) {
        if (partial.toLineByCell[i] > partial.fromLineByCell.value(i, 0))
            return true;
    }
    return false;
}

bool rowExhausted(const TableRow &row, const PartialRowInfo &partial)
{
    for (int i = 0; i < row.cells.size(); ++i) {
        if (partial.toLineByCell.value(i, 0) < row.cells[i].lineCount())
            return false;
    }
    return true;
}

// Advance every unfinished cell by one line regardless of the space left.
// Used when a fresh column cannot take even a single line of the row.
void forceOneLinePerCell(const TableRow &row, PartialRowInfo &partial)
{
    qreal height = 0;
    for (int i = 0; i < row.cells.size(); ++i) {
        const auto &cell = row.cells[i];
        const int from = partial.fromLineByCell.value(i, 0);
        const int total = cell.lineCount();
        const int to = std::min(from + 1, total);
        partial.toLineByCell[i] = std::max(to, from);
        height = std::max(height, cellLinesHeight(cell.lines(), from, partial.toLineByCell[i]) + verticalPadding(cell));
    }
    partial.partialHeight = height;
    partial.isLastPart = rowExhausted(row, partial);
}

qreal baseTableWidth(const Table &table, qreal columnWidth)
{
    return std::min(columnWidth, table.totalWidth > 0 ? table.totalWidth : columnWidth);
}

TableFragment makeFragment(const TableLayoutContext &ctx, const Layout::PageState &state,
                           int fromRow, int toRow, qreal height)
{
    const Frame frame = resolveTableFrame(ctx.cursor.columnX(state.columnIndex), ctx.columnWidth,
                                          baseTableWidth(ctx.table, ctx.columnWidth), ctx.table.attrs);
    TableFragment fragment;
    fragment.blockId = ctx.table.id;
    fragment.fromRow = fromRow;
    fragment.toRow = toRow;
    fragment.x = frame.x;
    fragment.y = state.cursorY;
    fragment.width = frame.width;
    fragment.height = height;
    fragment.columnBoundaries = generateColumnBoundaries(ctx.table);
    return fragment;
}

void place(Layout::PageState &state, TableFragment fragment, const Table &table)
{
    fragment.pm = computeTableFragmentPmRange(table, fragment.fromRow, fragment.toRow, fragment.partialRow);
    state.cursorY += fragment.height;
    state.page->fragments.append(std::move(fragment));
}

bool treatAsCantSplit(const TableRow &row, qreal fullPageHeight)
{
    if (row.cantSplit)
        return true;
    return hasExplicitRowHeightSlack(row) && (fullPageHeight <= 0 || row.height <= fullPageHeight);
}

void layoutMonolithicTable(const TableLayoutContext &ctx)
{
    Layout::PageState *state = &ctx.cursor.ensurePage();
    if (state->cursorY + ctx.table.totalHeight > state->contentBottom && !state->columnIsEmpty())
        state = &ctx.cursor.advanceColumn(*state);
    state = &ctx.cursor.ensurePage();

    const qreal height = std::min(ctx.table.totalHeight, state->contentBottom - state->cursorY);
    place(*state, makeFragment(ctx, *state, 0, ctx.table.rows.size(), height), ctx.table);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Frame geometry
// ---------------------------------------------------------------------------

qreal tableIndentWidth(const TableAttrs &attrs)
{
    if (!std::isfinite(attrs.tableIndent))
        return 0;
    return attrs.tableIndent;
}

Frame applyTableIndent(qreal x, qreal width, qreal indent)
{
    return {x + indent, std::max<qreal>(0.0, width - indent)};
}

Frame resolveTableFrame(qreal baseX, qreal columnWidth, qreal tableWidth, const TableAttrs &attrs)
{
    const qreal width = std::min(columnWidth, tableWidth);

    if (attrs.justification) {
        switch (*attrs.justification) {
        case Content::TableJustification::Center:
            return {baseX + std::max<qreal>(0.0, (columnWidth - width) / 2), width};
        case Content::TableJustification::Right:
        case Content::TableJustification::End:
            return {baseX + std::max<qreal>(0.0, columnWidth - width), width};
        case Content::TableJustification::Left:
            break;
        }
    }

    return applyTableIndent(baseX, width, tableIndentWidth(attrs));
}

qreal tableCellSpacing(const TableAttrs &attrs)
{
    if (attrs.borderCollapse != Content::BorderCollapse::Separate)
        return 0;
    return attrs.cellSpacing > 0 ? attrs.cellSpacing : 0;
}

// ---------------------------------------------------------------------------
// Row measurement
// ---------------------------------------------------------------------------

int countHeaderRows(const Table &table)
{
    int count = 0;
    for (const auto &row : table.rows) {
        if (!row.repeatHeader)
            break;
        ++count;
    }
    return count;
}

qreal sumRowHeights(const QList<TableRow> &rows, int fromRow, int toRow)
{
    qreal total = 0;
    for (int i = std::max(0, fromRow); i < toRow && i < rows.size(); ++i)
        total += rows[i].height;
    return total;
}

qreal rowContentHeight(const TableRow &row)
{
    qreal content = 0;
    for (const auto &cell : row.cells) {
        const auto lines = cell.lines();
        content = std::max(content, cellLinesHeight(lines, 0, lines.size()) + verticalPadding(cell));
    }
    return content;
}

bool hasExplicitRowHeightSlack(const TableRow &row)
{
    if (!row.explicitHeight || !std::isfinite(*row.explicitHeight))
        return false;
    return row.height > rowContentHeight(row) + kRowHeightEpsilon;
}

PartialRowInfo computePartialRow(const Table &table, int rowIndex, qreal availableHeight,
                                 const QList<int> &fromLineByCell)
{
    if (rowIndex < 0 || rowIndex >= table.rows.size()) {
        throw std::out_of_range("Tables::computePartialRow: row " + std::to_string(rowIndex)
                                + " outside table with " + std::to_string(table.rows.size()) + " rows");
    }
    const TableRow &row = table.rows[rowIndex];
    const int cellCount = row.cells.size();

    PartialRowInfo partial;
    partial.rowIndex = rowIndex;
    for (int i = 0; i < cellCount; ++i)
        partial.fromLineByCell.append(std::max(0, fromLineByCell.value(i, 0)));

    qreal height = 0;
    qreal maxPadding = 0;

    // Each cell fills independently; cells do not advance in lockstep
    for (int c = 0; c < cellCount; ++c) {
        const auto &cell = row.cells[c];
        const qreal padding = verticalPadding(cell);
        const qreal availableForLines = std::max<qreal>(0.0, availableHeight - padding);
        const auto lines = cell.lines();

        const int startLine = partial.fromLineByCell[c];
        int cutLine = startLine;
        qreal used = 0;
        for (int i = startLine; i < lines.size(); ++i) {
            if (used + lines[i].lineHeight > availableForLines)
                break;
            used += lines[i].lineHeight;
            cutLine = i + 1;
        }

        partial.toLineByCell.append(cutLine);
        maxPadding = std::max(maxPadding, padding);
        height = std::max(height, used + padding);
    }

    partial.isFirstPart = std::all_of(partial.fromLineByCell.cbegin(), partial.fromLineByCell.cend(),
                                      [](int l) { return l == 0; });
    partial.isLastPart = rowExhausted(row, partial) || !madeProgress(partial);

    if (height == 0 && partial.isFirstPart)
        height = maxPadding;
    partial.partialHeight = height;

    return partial;
}

SplitPoint findSplitPoint(const Table &table, int startRow, qreal availableHeight,
                          qreal fullPageHeight, qreal cellSpacing, bool isContinuation)
{
    qreal accumulated = isContinuation ? 0 : cellSpacing;
    int lastFitRow = startRow;

    for (int i = startRow; i < table.rows.size(); ++i) {
        const TableRow &row = table.rows[i];
        const qreal rowWithSpacing = row.height + cellSpacing;

        if (accumulated + rowWithSpacing <= availableHeight) {
            accumulated += rowWithSpacing;
            lastFitRow = i + 1;
            continue;
        }

        const qreal remaining = availableHeight - accumulated;

        // Taller than any page: has to be cut wherever it lands, once a line fits
        if (fullPageHeight > 0 && row.height > fullPageHeight) {
            PartialRowInfo partial = computePartialRow(table, i, remaining);
            if (!madeProgress(partial))
                return {lastFitRow, std::nullopt};
            qDebug() << "TableFragmenter:" << table.id << "row" << i << "exceeds a full page, splitting";
            return {i + 1, partial};
        }

        if (treatAsCantSplit(row, fullPageHeight))
            return {lastFitRow, std::nullopt};

        if (remaining >= kMinPartialRowHeight) {
            PartialRowInfo partial = computePartialRow(table, i, remaining);
            if (madeProgress(partial))
                return {i + 1, partial};
        }

        return {lastFitRow, std::nullopt};
    }

    return {int(table.rows.size()), std::nullopt};
}

qreal calculateFragmentHeight(const Table &table, int fromRow, int toRow, int repeatHeaderCount,
                              qreal cellSpacing, bool includeTopSpacing)
{
    qreal height = 0;
    if (repeatHeaderCount > 0)
        height += sumRowHeights(table.rows, 0, repeatHeaderCount);

    height += sumRowHeights(table.rows, fromRow, toRow);

    if (cellSpacing > 0) {
        const int totalRows = repeatHeaderCount + std::max(0, toRow - fromRow);
        if (totalRows > 0) {
            height += cellSpacing * totalRows;
            if (includeTopSpacing)
                height += cellSpacing;
        }
    }
    return height;
}

// ---------------------------------------------------------------------------
// Fragment metadata
// ---------------------------------------------------------------------------

QList<Layout::ColumnBoundary> generateColumnBoundaries(const Table &table)
{
    QList<Layout::ColumnBoundary> boundaries;
    qreal x = 0;
    for (int i = 0; i < table.columnWidths.size(); ++i) {
        const qreal width = table.columnWidths[i];
        Layout::ColumnBoundary b;
        b.index = i;
        b.x = x;
        b.width = width;
        b.minWidth = width > 0 ? std::clamp(width, kMinColumnResizeWidth, kMaxColumnResizeWidth)
                               : kMinColumnResizeWidth;
        b.resizable = true;
        boundaries.append(b);
        x += width;
    }
    return boundaries;
}

Content::PmRange computeTableFragmentPmRange(const Table &table, int fromRow, int toRow,
                                             const std::optional<PartialRowInfo> &partialRow)
{
    Content::PmRange range;

    for (int r = std::max(0, fromRow); r < toRow && r < table.rows.size(); ++r) {
        const TableRow &row = table.rows[r];
        const bool isPartial = partialRow && partialRow->rowIndex == r;

        for (int c = 0; c < row.cells.size(); ++c) {
            const auto &cell = row.cells[c];
            const int totalLines = cell.lineCount();
            int from = 0;
            int to = totalLines;
            if (isPartial) {
                from = partialRow->fromLineByCell.value(c, 0);
                to = partialRow->toLineByCell.value(c, totalLines);
            }
            from = std::clamp(from, 0, totalLines);
            to = std::clamp(to, from, totalLines);

            // Line window mapped onto the cell's paragraphs
            int blockStart = 0;
            for (const auto &para : cell.blocks) {
                const int blockEnd = blockStart + para.lines.size();
                const int localFrom = std::max(from, blockStart) - blockStart;
                const int localTo = std::min(to, blockEnd) - blockStart;

                Content::PmRange paraRange;
                for (int l = localFrom; l < localTo; ++l)
                    paraRange.merge(para.lines[l].pm);
                if (paraRange.isEmpty())
                    paraRange = para.pm;
                range.merge(paraRange);

                blockStart = blockEnd;
            }
        }
    }

    if (range.isEmpty() && fromRow == 0 && toRow >= table.rows.size())
        range = table.pm;
    return range;
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

void layoutTableBlock(const TableLayoutContext &ctx)
{
    const Table &table = ctx.table;
    Layout::PageCursor &cursor = ctx.cursor;

    // Positioned by the host's float manager
    if (table.attrs.anchored)
        return;

    if (table.attrs.floating) {
        layoutMonolithicTable(ctx);
        return;
    }

    const int rowCount = table.rows.size();
    const int headerCount = countHeaderRows(table);
    const qreal headerHeight = headerCount > 0 ? sumRowHeights(table.rows, 0, headerCount) : 0;
    const qreal cellSpacing = tableCellSpacing(table.attrs);

    Layout::PageState *state = &cursor.ensurePage();

    // --- Start preflight: begin here or in the next column ---
    {
        const qreal available = state->remainingHeight();
        if (rowCount > 0 && !state->columnIsEmpty()) {
            const TableRow &first = table.rows.first();
            const qreal fullPage = state->contentBottom - state->page->margins.top();
            if (treatAsCantSplit(first, fullPage)) {
                if (first.height > available)
                    state = &cursor.advanceColumn(*state);
            } else {
                const PartialRowInfo partial = computePartialRow(table, 0, available);
                if (!madeProgress(partial) || partial.partialHeight <= 0)
                    state = &cursor.advanceColumn(*state);
            }
        } else if (!state->columnIsEmpty()) {
            if (table.totalHeight > available)
                state = &cursor.advanceColumn(*state);
        }
    }

    // --- Zero-row placeholder ---
    if (rowCount == 0) {
        if (table.totalHeight > 0) {
            const qreal height = std::min(table.totalHeight, state->remainingHeight());
            place(*state, makeFragment(ctx, *state, 0, 0, height), table);
        }
        return;
    }

    int currentRow = 0;
    bool isContinuation = false;
    std::optional<PartialRowInfo> pending;
    bool advancedWithoutProgress = false;

    while (currentRow < rowCount || pending) {
        state = &cursor.ensurePage();
        const qreal available = state->remainingHeight();

        // First fragment never repeats headers
        int repeatHeaderCount = 0;
        if ((currentRow > 0 || pending) && headerCount > 0 && headerHeight <= available)
            repeatHeaderCount = headerCount;

        const qreal repeatedHeaderHeight = repeatHeaderCount > 0 ? headerHeight : 0;
        const qreal availableForBody = available - repeatedHeaderHeight;
        const qreal fullPageHeight = state->contentBottom - state->page->margins.top();

        // --- Continue a row split in an earlier column ---
        if (pending) {
            const int rowIndex = pending->rowIndex;
            const TableRow &row = table.rows[rowIndex];
            const QList<int> fromLineByCell = pending->toLineByCell;

            PartialRowInfo cont = computePartialRow(table, rowIndex, availableForBody, fromLineByCell);
            bool progress = madeProgress(cont);

            if (!progress && advancedWithoutProgress) {
                qWarning() << "TableFragmenter:" << table.id << "row" << rowIndex
                           << "line does not fit an empty column, forcing it";
                forceOneLinePerCell(row, cont);
                progress = madeProgress(cont);
            }

            const bool exhausted = rowExhausted(row, cont);
            const qreal height = cont.partialHeight + repeatedHeaderHeight;

            if (height > 0 && progress) {
                TableFragment fragment = makeFragment(ctx, *state, rowIndex, rowIndex + 1, height);
                fragment.continuesFromPrev = true;
                fragment.continuesOnNext = !exhausted || rowIndex + 1 < rowCount;
                fragment.repeatHeaderCount = repeatHeaderCount;
                fragment.partialRow = cont;
                place(*state, std::move(fragment), table);
            }

            if (exhausted) {
                currentRow = rowIndex + 1;
                pending.reset();
                advancedWithoutProgress = false;
            } else if (!progress) {
                state = &cursor.advanceColumn(*state);
                advancedWithoutProgress = true;
            } else {
                pending = cont;
                advancedWithoutProgress = false;
            }

            isContinuation = true;
            continue;
        }

        const int startRow = currentRow;
        const SplitPoint split = findSplitPoint(table, startRow, availableForBody, fullPageHeight,
                                                cellSpacing, isContinuation);

        // Nothing fits here
        if (split.endRow == startRow && !split.partialRow) {
            if (!state->columnIsEmpty()) {
                state = &cursor.advanceColumn(*state);
                continue;
            }

            // Empty column: cut the row anyway
            PartialRowInfo forced = computePartialRow(table, startRow, availableForBody);
            if (!madeProgress(forced)) {
                qWarning() << "TableFragmenter:" << table.id << "row" << startRow
                           << "line does not fit an empty column, forcing it";
                forceOneLinePerCell(table.rows[startRow], forced);
            }
            qreal spacing = 0;
            if (cellSpacing > 0) {
                spacing += isContinuation ? 0 : cellSpacing;
                spacing += repeatHeaderCount * cellSpacing;
                spacing += forced.isLastPart ? cellSpacing : 0;
            }
            const bool exhausted = rowExhausted(table.rows[startRow], forced);

            TableFragment fragment = makeFragment(ctx, *state, startRow, startRow + 1,
                                                  forced.partialHeight + repeatedHeaderHeight + spacing);
            fragment.continuesFromPrev = isContinuation;
            fragment.continuesOnNext = !exhausted || startRow + 1 < rowCount;
            fragment.repeatHeaderCount = repeatHeaderCount;
            fragment.partialRow = forced;
            place(*state, std::move(fragment), table);

            if (exhausted) {
                currentRow = startRow + 1;
            } else {
                pending = forced;
                advancedWithoutProgress = false;
            }
            isContinuation = true;
            continue;
        }

        const bool includeTopSpacing = !isContinuation;
        qreal height = 0;
        if (split.partialRow) {
            const PartialRowInfo &partial = *split.partialRow;
            const int fullRows = std::max(0, split.endRow - startRow - 1);
            qreal spacing = 0;
            if (cellSpacing > 0) {
                spacing += includeTopSpacing ? cellSpacing : 0;
                spacing += (repeatHeaderCount + fullRows) * cellSpacing;
                spacing += partial.isLastPart ? cellSpacing : 0;
            }
            height = repeatedHeaderHeight
                + sumRowHeights(table.rows, startRow, std::max(startRow, split.endRow - 1))
                + partial.partialHeight + spacing;
        } else {
            height = calculateFragmentHeight(table, startRow, split.endRow, repeatHeaderCount,
                                             cellSpacing, includeTopSpacing);
        }

        const bool partialExhausted = split.partialRow
            && rowExhausted(table.rows[split.partialRow->rowIndex], *split.partialRow);

        TableFragment fragment = makeFragment(ctx, *state, startRow, split.endRow, height);
        fragment.continuesFromPrev = isContinuation;
        fragment.continuesOnNext = split.endRow < rowCount || (split.partialRow && !partialExhausted);
        fragment.repeatHeaderCount = repeatHeaderCount;
        fragment.partialRow = split.partialRow;
        place(*state, std::move(fragment), table);

        if (split.partialRow && !partialExhausted) {
            pending = split.partialRow;
            currentRow = split.partialRow->rowIndex;
            advancedWithoutProgress = false;
        } else {
            currentRow = split.endRow;
        }

        isContinuation = true;
    }
}

TableFragment createAnchoredTableFragment(const Table &table, qreal x, qreal y)
{
    TableFragment fragment;
    fragment.blockId = table.id;
    fragment.fromRow = 0;
    fragment.toRow = table.rows.size();
    fragment.x = x;
    fragment.y = y;
    fragment.width = table.totalWidth;
    fragment.height = table.totalHeight;
    fragment.columnBoundaries = generateColumnBoundaries(table);
    fragment.pm = computeTableFragmentPmRange(table, 0, fragment.toRow, std::nullopt);
    return fragment;
}

} // namespace Tables
