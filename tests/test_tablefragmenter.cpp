/*
 * test_tablefragmenter.cpp — Table row pagination and mid-row splits
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "stubcursor.h"
#include "tablefragmenter.h"

namespace {

QList<qreal> lines(int count, qreal height)
{
    QList<qreal> out;
    for (int i = 0; i < count; ++i)
        out.append(height);
    return out;
}

Content::TableCell makeCell(const QList<qreal> &lineHeights)
{
    Content::Paragraph para;
    for (qreal h : lineHeights)
        para.lines.append(Content::LineMeasure{h, {}});
    Content::TableCell cell;
    cell.blocks.append(para);
    return cell;
}

Content::TableRow makeRow(const QList<Content::TableCell> &cells)
{
    Content::TableRow row;
    row.cells = cells;
    row.height = Tables::rowContentHeight(row);
    return row;
}

Content::Table makeTable(const QList<Content::TableRow> &rows)
{
    Content::Table table;
    table.id = QStringLiteral("t1");
    table.rows = rows;
    if (!rows.isEmpty()) {
        for (int i = 0; i < rows.first().cells.size(); ++i)
            table.columnWidths.append(100);
    }
    for (qreal w : table.columnWidths)
        table.totalWidth += w;
    for (const auto &row : rows)
        table.totalHeight += row.height;
    return table;
}

// N rows of one cell holding one line
Content::Table simpleTable(int rowCount, qreal lineHeight)
{
    QList<Content::TableRow> rows;
    for (int i = 0; i < rowCount; ++i)
        rows.append(makeRow({makeCell({lineHeight})}));
    return makeTable(rows);
}

void layout(const Content::Table &table, StubCursor &cursor)
{
    Tables::layoutTableBlock(Tables::TableLayoutContext{table, cursor.columnWidth(), cursor});
}

// Every body line of every cell must appear in exactly one fragment, in
// order. Repeated header rows are copies and are not counted.
void expectEachLineOnce(const Content::Table &table,
                        const QList<QPair<int, Layout::TableFragment>> &fragments)
{
    QList<QList<int>> nextLine; // per row, per cell
    for (const auto &row : table.rows)
        nextLine.append(QList<int>(row.cells.size(), 0));

    for (const auto &[page, f] : fragments) {
        for (int r = f.fromRow; r < f.toRow; ++r) {
            const auto &cells = table.rows[r].cells;
            for (int c = 0; c < cells.size(); ++c) {
                int from = 0;
                int to = cells[c].lineCount();
                if (f.partialRow && f.partialRow->rowIndex == r) {
                    from = f.partialRow->fromLineByCell[c];
                    to = f.partialRow->toLineByCell[c];
                }
                EXPECT_EQ(from, nextLine[r][c]) << "page " << page << " row " << r << " cell " << c;
                EXPECT_GE(to, from);
                nextLine[r][c] = to;
            }
        }
    }

    for (int r = 0; r < table.rows.size(); ++r) {
        for (int c = 0; c < table.rows[r].cells.size(); ++c)
            EXPECT_EQ(nextLine[r][c], table.rows[r].cells[c].lineCount()) << "row " << r << " cell " << c;
    }
}

} // anonymous namespace

// --- computePartialRow ---

TEST(ComputePartialRow, CellsAdvanceIndependently)
{
    const auto table = makeTable({makeRow({makeCell(lines(5, 20)), makeCell({60})})});

    const auto partial = Tables::computePartialRow(table, 0, 70);

    EXPECT_EQ(partial.toLineByCell, (QList<int>{3, 1}));
    EXPECT_EQ(partial.fromLineByCell, (QList<int>{0, 0}));
    EXPECT_TRUE(partial.isFirstPart);
    EXPECT_FALSE(partial.isLastPart);
    EXPECT_DOUBLE_EQ(partial.partialHeight, 64.0);
}

TEST(ComputePartialRow, ContinuesFromCarriedLines)
{
    const auto table = makeTable({makeRow({makeCell(lines(5, 20)), makeCell({60})})});

    const auto partial = Tables::computePartialRow(table, 0, 100, {3, 1});

    EXPECT_EQ(partial.toLineByCell, (QList<int>{5, 1}));
    EXPECT_FALSE(partial.isFirstPart);
    EXPECT_TRUE(partial.isLastPart);
    EXPECT_DOUBLE_EQ(partial.partialHeight, 44.0);
}

TEST(ComputePartialRow, NothingFitsKeepsPaddingHeight)
{
    const auto table = makeTable({makeRow({makeCell({50})})});

    const auto partial = Tables::computePartialRow(table, 0, 30);

    EXPECT_EQ(partial.toLineByCell, (QList<int>{0}));
    EXPECT_TRUE(partial.isLastPart);
    EXPECT_DOUBLE_EQ(partial.partialHeight, 4.0);
}

TEST(ComputePartialRow, RowOutsideTableThrows)
{
    const auto table = simpleTable(2, 20);
    EXPECT_THROW(Tables::computePartialRow(table, 5, 100), std::out_of_range);
    EXPECT_THROW(Tables::computePartialRow(table, -1, 100), std::out_of_range);
}

// --- Row measurement ---

TEST(RowMeasurement, ExplicitHeightSlack)
{
    auto row = makeRow({makeCell({20})});
    EXPECT_FALSE(Tables::hasExplicitRowHeightSlack(row));

    row.explicitHeight = 24;
    EXPECT_FALSE(Tables::hasExplicitRowHeightSlack(row));

    row.explicitHeight = 60;
    row.height = 60;
    EXPECT_TRUE(Tables::hasExplicitRowHeightSlack(row));

    row.explicitHeight = std::numeric_limits<qreal>::quiet_NaN();
    EXPECT_FALSE(Tables::hasExplicitRowHeightSlack(row));
}

TEST(RowMeasurement, HeaderRowsAreLeadingRunOnly)
{
    auto table = simpleTable(4, 20);
    table.rows[0].repeatHeader = true;
    table.rows[1].repeatHeader = true;
    table.rows[3].repeatHeader = true;
    EXPECT_EQ(Tables::countHeaderRows(table), 2);
}

TEST(RowMeasurement, FragmentHeightWithSeparateSpacing)
{
    const auto table = simpleTable(3, 20);
    EXPECT_DOUBLE_EQ(Tables::calculateFragmentHeight(table, 0, 3, 0, 2, true), 80.0);
    EXPECT_DOUBLE_EQ(Tables::calculateFragmentHeight(table, 1, 3, 1, 2, false), 78.0);
    EXPECT_DOUBLE_EQ(Tables::calculateFragmentHeight(table, 0, 3, 0, 0, true), 72.0);
}

TEST(RowMeasurement, SpacingOnlyForSeparateBorders)
{
    Content::TableAttrs attrs;
    attrs.cellSpacing = 4;
    EXPECT_DOUBLE_EQ(Tables::tableCellSpacing(attrs), 0.0);

    attrs.borderCollapse = Content::BorderCollapse::Separate;
    EXPECT_DOUBLE_EQ(Tables::tableCellSpacing(attrs), 4.0);

    attrs.cellSpacing = -3;
    EXPECT_DOUBLE_EQ(Tables::tableCellSpacing(attrs), 0.0);
}

// --- findSplitPoint ---

TEST(FindSplitPoint, FirstFragmentStartsWithSpacing)
{
    auto table = simpleTable(3, 20);
    for (auto &row : table.rows)
        row.cantSplit = true;

    EXPECT_EQ(Tables::findSplitPoint(table, 0, 53, 100, 2, false).endRow, 1);
    EXPECT_EQ(Tables::findSplitPoint(table, 0, 53, 100, 2, true).endRow, 2);
}

TEST(FindSplitPoint, CantSplitRowEndsFragmentBeforeIt)
{
    auto table = makeTable({makeRow({makeCell({20})}), makeRow({makeCell(lines(4, 20))})});
    table.rows[1].cantSplit = true;

    const auto split = Tables::findSplitPoint(table, 0, 100, 100, 0, false);
    EXPECT_EQ(split.endRow, 1);
    EXPECT_FALSE(split.partialRow.has_value());

    const auto none = Tables::findSplitPoint(table, 1, 76, 100, 0, true);
    EXPECT_EQ(none.endRow, 1);
    EXPECT_FALSE(none.partialRow.has_value());
}

TEST(FindSplitPoint, SplittableRowIsCutMidRow)
{
    const auto table = makeTable({makeRow({makeCell({20})}), makeRow({makeCell(lines(4, 20))})});

    const auto split = Tables::findSplitPoint(table, 0, 100, 100, 0, false);
    EXPECT_EQ(split.endRow, 2);
    ASSERT_TRUE(split.partialRow.has_value());
    EXPECT_EQ(split.partialRow->rowIndex, 1);
    EXPECT_EQ(split.partialRow->toLineByCell, (QList<int>{3}));
}

TEST(FindSplitPoint, ShortRemainderIsNotWorthAPartialRow)
{
    const auto table = simpleTable(3, 30);
    // Two rows use 68 of 80; 12 left is under the partial-row minimum
    const auto split = Tables::findSplitPoint(table, 0, 80, 100, 0, false);
    EXPECT_EQ(split.endRow, 2);
    EXPECT_FALSE(split.partialRow.has_value());
}

// --- layoutTableBlock ---

TEST(LayoutTableBlock, RowsAreCoveredInOrder)
{
    const auto table = simpleTable(10, 30);
    StubCursor cursor(100);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 5);
    for (int i = 0; i < fragments.size(); ++i) {
        const auto &[page, f] = fragments[i];
        EXPECT_EQ(page, i);
        EXPECT_EQ(f.fromRow, i * 2);
        EXPECT_EQ(f.toRow, i * 2 + 2);
        EXPECT_FALSE(f.partialRow.has_value());
        EXPECT_EQ(f.continuesFromPrev, i > 0);
        EXPECT_EQ(f.continuesOnNext, i < 4);
        EXPECT_DOUBLE_EQ(f.height, 68.0);
    }
}

TEST(LayoutTableBlock, OverTallRowTakesOneFragmentPerPage)
{
    const auto table = makeTable({makeRow({makeCell(lines(30, 20))})});
    StubCursor cursor(250);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 3);
    EXPECT_EQ(cursor.pages.size(), 3u);

    const QList<int> expectedFrom{0, 12, 24};
    const QList<int> expectedTo{12, 24, 30};
    for (int i = 0; i < 3; ++i) {
        const auto &[page, f] = fragments[i];
        EXPECT_EQ(page, i);
        EXPECT_EQ(f.fromRow, 0);
        EXPECT_EQ(f.toRow, 1);
        ASSERT_TRUE(f.partialRow.has_value());
        EXPECT_EQ(f.partialRow->fromLineByCell, (QList<int>{expectedFrom[i]}));
        EXPECT_EQ(f.partialRow->toLineByCell, (QList<int>{expectedTo[i]}));
        EXPECT_EQ(f.continuesFromPrev, i > 0);
        EXPECT_EQ(f.continuesOnNext, i < 2);
    }
}

TEST(LayoutTableBlock, LineTallerThanPageIsForcedInOneFragment)
{
    const auto table = makeTable({makeRow({makeCell({300})})});
    StubCursor cursor(250);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(cursor.pages.size(), 1u);
    EXPECT_EQ(cursor.advanceCount, 0);

    const auto &[page, f] = fragments.first();
    EXPECT_EQ(page, 0);
    EXPECT_EQ(f.fromRow, 0);
    EXPECT_EQ(f.toRow, 1);
    ASSERT_TRUE(f.partialRow.has_value());
    EXPECT_EQ(f.partialRow->fromLineByCell, (QList<int>{0}));
    EXPECT_EQ(f.partialRow->toLineByCell, (QList<int>{1}));
    EXPECT_TRUE(f.partialRow->isLastPart);
    EXPECT_DOUBLE_EQ(f.height, 304.0);
    EXPECT_FALSE(f.continuesFromPrev);
    EXPECT_FALSE(f.continuesOnNext);
}

TEST(LayoutTableBlock, TallLinesInOneCellAreForcedOnePerPage)
{
    // Second cell's lines never fit a page; each page takes one of them
    const auto table = makeTable({makeRow({makeCell(lines(3, 20)), makeCell({260, 260})})});
    StubCursor cursor(250);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 3);

    const QList<QList<int>> expectedFrom{{0, 0}, {3, 0}, {3, 1}};
    const QList<QList<int>> expectedTo{{3, 0}, {3, 1}, {3, 2}};
    for (int i = 0; i < 3; ++i) {
        const auto &[page, f] = fragments[i];
        EXPECT_EQ(page, i);
        ASSERT_TRUE(f.partialRow.has_value());
        EXPECT_EQ(f.partialRow->fromLineByCell, expectedFrom[i]);
        EXPECT_EQ(f.partialRow->toLineByCell, expectedTo[i]);
        EXPECT_EQ(f.continuesOnNext, i < 2);
    }
    EXPECT_DOUBLE_EQ(fragments[0].second.height, 64.0);
    EXPECT_DOUBLE_EQ(fragments[1].second.height, 264.0);

    expectEachLineOnce(table, fragments);
}

TEST(LayoutTableBlock, OverTallRowWaitsForRoomForItsFirstLine)
{
    // 26px left under the first row; the tall row's 30px lines need a new page
    const auto table = makeTable({makeRow({makeCell(lines(11, 20))}), makeRow({makeCell(lines(20, 30))})});
    StubCursor cursor(250);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 4);

    const auto &head = fragments[0].second;
    EXPECT_EQ(fragments[0].first, 0);
    EXPECT_EQ(head.fromRow, 0);
    EXPECT_EQ(head.toRow, 1);
    EXPECT_FALSE(head.partialRow.has_value());
    EXPECT_DOUBLE_EQ(head.height, 224.0);
    EXPECT_TRUE(head.continuesOnNext);

    const QList<int> expectedFrom{0, 8, 16};
    const QList<int> expectedTo{8, 16, 20};
    for (int i = 1; i < 4; ++i) {
        const auto &[page, f] = fragments[i];
        EXPECT_EQ(page, i);
        EXPECT_EQ(f.fromRow, 1);
        ASSERT_TRUE(f.partialRow.has_value());
        EXPECT_EQ(f.partialRow->fromLineByCell, (QList<int>{expectedFrom[i - 1]}));
        EXPECT_EQ(f.partialRow->toLineByCell, (QList<int>{expectedTo[i - 1]}));
        EXPECT_GT(f.partialRow->toLineByCell[0], f.partialRow->fromLineByCell[0]);
    }

    expectEachLineOnce(table, fragments);
}

TEST(LayoutTableBlock, SplitRowContinuesInNextColumn)
{
    const auto table = makeTable({makeRow({makeCell({20})}), makeRow({makeCell(lines(4, 20))})});
    StubCursor cursor(100, 2);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 2);
    EXPECT_EQ(cursor.pages.size(), 1u);

    const auto &first = fragments[0].second;
    EXPECT_EQ(first.fromRow, 0);
    EXPECT_EQ(first.toRow, 2);
    EXPECT_DOUBLE_EQ(first.height, 88.0);
    EXPECT_TRUE(first.continuesOnNext);

    const auto &second = fragments[1].second;
    EXPECT_EQ(second.fromRow, 1);
    EXPECT_EQ(second.toRow, 2);
    ASSERT_TRUE(second.partialRow.has_value());
    EXPECT_EQ(second.partialRow->fromLineByCell, (QList<int>{3}));
    EXPECT_EQ(second.partialRow->toLineByCell, (QList<int>{4}));
    EXPECT_DOUBLE_EQ(second.x, cursor.columnX(1));
    EXPECT_DOUBLE_EQ(second.y, 0.0);
    EXPECT_FALSE(second.continuesOnNext);
}

TEST(LayoutTableBlock, CantSplitRowMovesWhole)
{
    auto table = makeTable({makeRow({makeCell({20})}), makeRow({makeCell(lines(4, 20))})});
    table.rows[1].cantSplit = true;
    StubCursor cursor(100);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 2);
    EXPECT_EQ(fragments[1].first, 1);
    EXPECT_EQ(fragments[1].second.fromRow, 1);
    EXPECT_EQ(fragments[1].second.toRow, 2);
    EXPECT_FALSE(fragments[1].second.partialRow.has_value());
}

TEST(LayoutTableBlock, HeaderRowsRepeatOnContinuations)
{
    auto table = simpleTable(7, 20);
    table.rows[0].repeatHeader = true;
    StubCursor cursor(100);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 2);

    EXPECT_EQ(fragments[0].second.repeatHeaderCount, 0);
    EXPECT_EQ(fragments[0].second.fromRow, 0);
    EXPECT_EQ(fragments[0].second.toRow, 4);

    const auto &cont = fragments[1].second;
    EXPECT_EQ(fragments[1].first, 1);
    EXPECT_EQ(cont.repeatHeaderCount, 1);
    EXPECT_EQ(cont.fromRow, 4);
    EXPECT_EQ(cont.toRow, 7);
    EXPECT_DOUBLE_EQ(cont.height, 96.0);
    EXPECT_TRUE(cont.continuesFromPrev);
}

TEST(LayoutTableBlock, HeadersTallerThanAColumnAreNotRepeated)
{
    auto table = makeTable({makeRow({makeCell(lines(3, 20))}), makeRow({makeCell(lines(3, 20))}),
                            makeRow({makeCell({20})}), makeRow({makeCell({20})}),
                            makeRow({makeCell({20})}), makeRow({makeCell({20})})});
    for (int i = 0; i < 2; ++i) {
        table.rows[i].repeatHeader = true;
        table.rows[i].cantSplit = true;
    }
    StubCursor cursor(100);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 3);
    for (const auto &[page, f] : fragments)
        EXPECT_EQ(f.repeatHeaderCount, 0) << "page " << page;

    EXPECT_EQ(fragments[0].second.toRow, 1);
    EXPECT_DOUBLE_EQ(fragments[0].second.height, 64.0);

    EXPECT_EQ(fragments[1].first, 1);
    EXPECT_EQ(fragments[1].second.fromRow, 1);
    EXPECT_EQ(fragments[1].second.toRow, 3);
    EXPECT_DOUBLE_EQ(fragments[1].second.height, 88.0);

    EXPECT_EQ(fragments[2].first, 2);
    EXPECT_EQ(fragments[2].second.fromRow, 3);
    EXPECT_EQ(fragments[2].second.toRow, 6);
    EXPECT_DOUBLE_EQ(fragments[2].second.height, 72.0);
}

TEST(LayoutTableBlock, SplitRowsCoverEveryLineOnce)
{
    const auto table = makeTable({makeRow({makeCell({20}), makeCell({20})}),
                                  makeRow({makeCell(lines(9, 20)), makeCell(lines(3, 20))}),
                                  makeRow({makeCell(lines(2, 20)), makeCell(lines(5, 20))}),
                                  makeRow({makeCell({20}), makeCell({20})})});
    StubCursor cursor(100, 2);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 6);
    expectEachLineOnce(table, fragments);

    for (const auto &[page, f] : fragments) {
        if (f.partialRow)
            EXPECT_GT(f.partialRow->partialHeight, 0.0);
    }
    EXPECT_FALSE(fragments.last().second.continuesOnNext);
    EXPECT_EQ(fragments.last().second.toRow, 4);
}

TEST(LayoutTableBlock, PreflightAdvancesWhenNoLineFits)
{
    const auto table = simpleTable(1, 20);
    StubCursor cursor(100);
    cursor.fill(90);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(fragments[0].first, 1);
    EXPECT_DOUBLE_EQ(fragments[0].second.y, 0.0);
}

TEST(LayoutTableBlock, PreflightKeepsFittingCantSplitRow)
{
    auto table = simpleTable(1, 20);
    table.rows[0].cantSplit = true;
    StubCursor cursor(100);
    cursor.fill(70);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(fragments[0].first, 0);
    EXPECT_DOUBLE_EQ(fragments[0].second.y, 70.0);
}

TEST(LayoutTableBlock, FloatingTableIsOneClippedFragment)
{
    auto table = makeTable({makeRow({makeCell({296})})});
    table.attrs.floating = true;
    StubCursor cursor(250);
    cursor.fill(50);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(fragments[0].first, 1);
    EXPECT_EQ(fragments[0].second.fromRow, 0);
    EXPECT_EQ(fragments[0].second.toRow, 1);
    EXPECT_DOUBLE_EQ(fragments[0].second.height, 250.0);
}

TEST(LayoutTableBlock, AnchoredTableIsLeftToTheHost)
{
    auto table = simpleTable(2, 20);
    table.attrs.anchored = true;
    StubCursor cursor(100);

    layout(table, cursor);
    EXPECT_TRUE(cursor.tableFragments().isEmpty());

    const auto fragment = Tables::createAnchoredTableFragment(table, 10, 20);
    EXPECT_DOUBLE_EQ(fragment.x, 10.0);
    EXPECT_DOUBLE_EQ(fragment.y, 20.0);
    EXPECT_DOUBLE_EQ(fragment.width, table.totalWidth);
    EXPECT_DOUBLE_EQ(fragment.height, table.totalHeight);
    EXPECT_EQ(fragment.toRow, 2);
}

TEST(LayoutTableBlock, ZeroRowTableGetsPlaceholder)
{
    Content::Table table;
    table.id = QStringLiteral("empty");
    table.totalHeight = 40;
    StubCursor cursor(100);

    layout(table, cursor);

    const auto fragments = cursor.tableFragments();
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(fragments[0].second.fromRow, 0);
    EXPECT_EQ(fragments[0].second.toRow, 0);
    EXPECT_DOUBLE_EQ(fragments[0].second.height, 40.0);
}

// --- Frame and metadata ---

TEST(TableFrame, JustificationAndIndent)
{
    Content::TableAttrs attrs;

    attrs.justification = Content::TableJustification::Center;
    auto frame = Tables::resolveTableFrame(10, 400, 200, attrs);
    EXPECT_DOUBLE_EQ(frame.x, 110.0);
    EXPECT_DOUBLE_EQ(frame.width, 200.0);

    attrs.justification = Content::TableJustification::End;
    frame = Tables::resolveTableFrame(10, 400, 200, attrs);
    EXPECT_DOUBLE_EQ(frame.x, 210.0);

    attrs.justification.reset();
    attrs.tableIndent = 30;
    frame = Tables::resolveTableFrame(10, 400, 200, attrs);
    EXPECT_DOUBLE_EQ(frame.x, 40.0);
    EXPECT_DOUBLE_EQ(frame.width, 170.0);

    attrs.tableIndent = -20;
    frame = Tables::resolveTableFrame(10, 400, 200, attrs);
    EXPECT_DOUBLE_EQ(frame.x, -10.0);
    EXPECT_DOUBLE_EQ(frame.width, 220.0);

    attrs.tableIndent = std::numeric_limits<qreal>::quiet_NaN();
    frame = Tables::resolveTableFrame(10, 400, 600, attrs);
    EXPECT_DOUBLE_EQ(frame.x, 10.0);
    EXPECT_DOUBLE_EQ(frame.width, 400.0);

    attrs.tableIndent = std::numeric_limits<qreal>::infinity();
    EXPECT_DOUBLE_EQ(Tables::tableIndentWidth(attrs), 0.0);
}

TEST(TableFrame, IndentNeverMakesWidthNegative)
{
    const auto frame = Tables::applyTableIndent(100, 200, 250);
    EXPECT_DOUBLE_EQ(frame.x, 350.0);
    EXPECT_DOUBLE_EQ(frame.width, 0.0);
}

TEST(TableMetadata, ColumnBoundaries)
{
    Content::Table table;
    table.columnWidths = {10, 100, 300};

    const auto boundaries = Tables::generateColumnBoundaries(table);
    ASSERT_EQ(boundaries.size(), 3);
    EXPECT_DOUBLE_EQ(boundaries[0].x, 0.0);
    EXPECT_DOUBLE_EQ(boundaries[1].x, 10.0);
    EXPECT_DOUBLE_EQ(boundaries[2].x, 110.0);
    EXPECT_DOUBLE_EQ(boundaries[0].minWidth, 25.0);
    EXPECT_DOUBLE_EQ(boundaries[1].minWidth, 100.0);
    EXPECT_DOUBLE_EQ(boundaries[2].minWidth, 200.0);
    EXPECT_TRUE(boundaries[2].resizable);
}

TEST(TableMetadata, PmRangeFollowsPartialRowWindow)
{
    Content::Paragraph para;
    para.lines = {Content::LineMeasure{20, {10, 15}},
                  Content::LineMeasure{20, {15, 20}},
                  Content::LineMeasure{20, {20, 25}}};
    Content::TableCell cell;
    cell.blocks.append(para);
    const auto table = makeTable({makeRow({cell})});

    const auto whole = Tables::computeTableFragmentPmRange(table, 0, 1, std::nullopt);
    EXPECT_EQ(whole.pmStart, 10);
    EXPECT_EQ(whole.pmEnd, 25);

    Layout::PartialRowInfo partial;
    partial.rowIndex = 0;
    partial.fromLineByCell = {1};
    partial.toLineByCell = {2};
    const auto window = Tables::computeTableFragmentPmRange(table, 0, 1, partial);
    EXPECT_EQ(window.pmStart, 15);
    EXPECT_EQ(window.pmEnd, 20);
}
