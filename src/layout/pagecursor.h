/*
 * pagecursor.h — Positioned fragments, pages, and the page cursor capability
 *
 * The pagination core is written against PageCursor only. A host page
 * builder (Layout::Engine, or a test stub) owns the pages and decides what
 * "next column" and "new page" mean.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_PAGECURSOR_H
#define PAGEFLOW_PAGECURSOR_H

#include <QList>
#include <QMarginsF>
#include <QPageLayout>
#include <QSizeF>
#include <QString>

#include <optional>
#include <variant>

#include "contentmodel.h"
#include "pagelayout.h"

namespace Layout {

// --- Fragments ---

struct ParagraphFragment {
    QString blockId;
    int fromLine = 0;
    int toLine = 0; // exclusive
    qreal x = 0;
    qreal y = 0;
    qreal width = 0;
    qreal height = 0;
    bool continuesFromPrev = false;
    bool continuesOnNext = false;
    Content::PmRange pm;
};

struct ImageFragment {
    QString blockId;
    qreal x = 0;
    qreal y = 0;
    qreal width = 0;
    qreal height = 0;
    Content::PmRange pm;
};

// Lines of one row rendered by a fragment when the row is split mid-row.
// Each cell keeps its own window; cells do not advance in lockstep.
struct PartialRowInfo {
    int rowIndex = 0;
    QList<int> fromLineByCell;
    QList<int> toLineByCell; // exclusive
    bool isFirstPart = true;
    bool isLastPart = true;
    qreal partialHeight = 0;
};

// Resize handle metadata for one table grid column
struct ColumnBoundary {
    int index = 0;
    qreal x = 0;
    qreal width = 0;
    qreal minWidth = 0;
    bool resizable = true;
};

struct TableFragment {
    QString blockId;
    int fromRow = 0;
    int toRow = 0; // exclusive
    std::optional<PartialRowInfo> partialRow;
    int repeatHeaderCount = 0;
    bool continuesFromPrev = false;
    bool continuesOnNext = false;
    qreal x = 0;
    qreal y = 0;
    qreal width = 0;
    qreal height = 0;
    QList<ColumnBoundary> columnBoundaries;
    Content::PmRange pm;
};

using Fragment = std::variant<ParagraphFragment, ImageFragment, TableFragment>;

// Geometry accessors shared by all fragment kinds
inline qreal fragmentY(const Fragment &f) { return std::visit([](const auto &e) { return e.y; }, f); }
inline qreal fragmentHeight(const Fragment &f) { return std::visit([](const auto &e) { return e.height; }, f); }

// --- Pages ---

struct Page {
    int pageNumber = 0; // 0-based
    QSizeF size;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QMarginsF margins;
    ColumnLayout columns;
    bool isBlank = false; // inserted to satisfy an even/odd section start
    QList<Fragment> fragments;
};

// Cursor into the current column. contentTop is the top of the current
// column region (the top margin, or the start of a mid-page region).
struct PageState {
    Page *page = nullptr;
    int columnIndex = 0;
    qreal cursorY = 0;
    qreal contentTop = 0;
    qreal contentBottom = 0;

    qreal remainingHeight() const { return contentBottom - cursorY; }
    bool columnIsEmpty() const { return cursorY <= contentTop; }
};

class PageCursor
{
public:
    virtual ~PageCursor() = default;

    // Current page/column cursor, creating the page when none is open.
    virtual PageState &ensurePage() = 0;

    // Next column, wrapping to a new page once the columns are exhausted.
    virtual PageState &advanceColumn(PageState &state) = 0;

    virtual qreal columnX(int columnIndex) const = 0;
};

} // namespace Layout

#endif // PAGEFLOW_PAGECURSOR_H
