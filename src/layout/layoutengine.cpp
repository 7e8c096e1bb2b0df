/*
 * layoutengine.cpp — Measured blocks → pages, columns and fragments
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutengine.h"
#include "tablefragmenter.h"

#include <QDebug>

#include <algorithm>

namespace Layout {

namespace {

// Rounding slack when checking a balanced column against the page bottom
constexpr qreal kOverflowTolerance = 0.01;

// Height needed to start a block at the top of a column
qreal leadingHeight(const Content::BlockNode &node)
{
    return std::visit([](const auto &b) -> qreal {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Content::Paragraph>) {
            const int lines = std::min<int>(b.lines.size(), std::max(1, b.orphanLines));
            return b.spaceBefore + b.linesHeight(0, lines);
        } else if constexpr (std::is_same_v<T, Content::Table>) {
            return b.rows.isEmpty() ? b.totalHeight : b.rows.first().height;
        } else if constexpr (std::is_same_v<T, Content::Image>) {
            return b.height;
        } else {
            return 0;
        }
    }, node);
}

Content::PmRange linesPmRange(const Content::Paragraph &para, int from, int to)
{
    Content::PmRange range;
    for (int i = from; i < to; ++i)
        range.merge(para.lines[i].pm);
    return range.isEmpty() ? para.pm : range;
}

Balancing::MeasureMap collectMeasures(const Content::Document &doc)
{
    Balancing::MeasureMap measures;
    for (const auto &node : doc.blocks) {
        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Content::Paragraph>) {
                Balancing::Measure m;
                for (const auto &line : b.lines)
                    m.lineHeights.append(line.lineHeight);
                measures.insert(b.id, m);
            } else if constexpr (std::is_same_v<T, Content::Table>) {
                measures.insert(b.id, Balancing::Measure{{}, b.totalHeight});
            } else if constexpr (std::is_same_v<T, Content::Image>) {
                measures.insert(b.id, Balancing::Measure{{}, b.height});
            }
        }, node);
    }
    return measures;
}

} // anonymous namespace

// --- Entry point ---

LayoutResult Engine::layout(const Content::Document &doc)
{
    reset(doc);

    for (int idx = 0; idx < doc.blocks.size(); ++idx) {
        const auto &node = doc.blocks[idx];
        const Content::BlockNode *next = idx + 1 < doc.blocks.size() ? &doc.blocks[idx + 1] : nullptr;

        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Content::Paragraph>)
                layoutParagraph(b, next);
            else if constexpr (std::is_same_v<T, Content::Image>)
                layoutImage(b, next);
            else if constexpr (std::is_same_v<T, Content::Table>)
                layoutTable(b, next);
            else if constexpr (std::is_same_v<T, Content::SectionBreak>)
                handleSectionBreak(b);
        }, node);
    }

    // Final section
    if (m_pageOpen) {
        balanceRegion(Balancing::shouldBalanceColumns(
            m_sectionStart ? m_sectionStart->type : std::nullopt,
            m_sectionStart ? m_sectionStart->balanceColumns : std::nullopt,
            true));
        finishPage();
    }

    // Ensure at least one empty page
    if (m_pages.isEmpty()) {
        ensurePage();
        finishPage();
    }

    LayoutResult result;
    result.pages = m_pages;
    m_doc = nullptr;
    return result;
}

void Engine::reset(const Content::Document &doc)
{
    m_doc = &doc;
    m_measures = collectMeasures(doc);
    m_section = Sections::initialSectionState(doc.pageLayout);
    m_baseMargins = Sections::BaseMargins{doc.pageLayout.margins.top(), doc.pageLayout.margins.bottom(),
                                          doc.pageLayout.margins.left(), doc.pageLayout.margins.right()};
    m_sectionStart.reset();
    m_pages.clear();
    m_currentPage = Page{};
    m_pageOpen = false;
    m_state = PageState{};
    m_regionColumns = ColumnLayout{};
    m_regionStart = 0;
    m_anchoredFragments.clear();
}

// --- PageCursor ---

PageState &Engine::ensurePage()
{
    if (m_pageOpen)
        return m_state;

    // Page boundary: scheduled geometry takes effect
    m_section = Sections::applyPendingToActive(m_section);
    m_section.hasAnyPages = true;

    m_currentPage = Page{};
    m_currentPage.pageNumber = m_pages.size();
    m_currentPage.size = m_section.activePageSize;
    m_currentPage.orientation = m_section.activeOrientation.value_or(QPageLayout::Portrait);
    m_currentPage.margins = QMarginsF(m_section.activeLeftMargin, m_section.activeTopMargin,
                                      m_section.activeRightMargin, m_section.activeBottomMargin);
    m_currentPage.columns = m_section.activeColumns;
    m_pageOpen = true;

    m_regionColumns = m_section.activeColumns;
    m_regionStart = 0;
    m_anchoredFragments.clear();

    m_state = PageState{};
    m_state.page = &m_currentPage;
    m_state.columnIndex = 0;
    m_state.contentTop = m_section.activeTopMargin;
    m_state.cursorY = m_state.contentTop;
    m_state.contentBottom = std::max(m_state.contentTop,
                                     m_currentPage.size.height() - m_section.activeBottomMargin);
    return m_state;
}

PageState &Engine::advanceColumn(PageState &state)
{
    if (&state != &m_state)
        qWarning() << "Engine: advanceColumn called with a foreign page state";

    if (m_pageOpen && m_state.columnIndex + 1 < std::max(1, m_regionColumns.count)) {
        ++m_state.columnIndex;
        m_state.cursorY = m_state.contentTop;
        return m_state;
    }

    if (m_pageOpen)
        finishPage();
    return ensurePage();
}

qreal Engine::columnX(int columnIndex) const
{
    return m_currentPage.margins.left() + columnIndex * (columnWidth() + m_regionColumns.gap);
}

qreal Engine::columnWidth() const
{
    const qreal contentWidth = std::max<qreal>(0.0, m_currentPage.size.width()
                                                   - m_currentPage.margins.left()
                                                   - m_currentPage.margins.right());
    return PageLayout::columnWidthFor(contentWidth, m_regionColumns);
}

qreal Engine::columnHeight() const
{
    return m_state.contentBottom - m_state.contentTop;
}

// --- Page and region bookkeeping ---

void Engine::finishPage()
{
    if (!m_pageOpen)
        return;
    m_pages.append(m_currentPage);
    m_pageOpen = false;
}

qreal Engine::regionBottom() const
{
    qreal bottom = m_state.contentTop;
    for (int i = m_regionStart; i < m_currentPage.fragments.size(); ++i) {
        if (m_anchoredFragments.contains(i))
            continue;
        const auto &f = m_currentPage.fragments[i];
        bottom = std::max(bottom, fragmentY(f) + Layout::fragmentHeight(f));
    }
    return bottom;
}

void Engine::balanceRegion(bool enabled)
{
    if (!enabled || !m_pageOpen || m_regionColumns.count <= 1)
        return;

    QList<int> indices;
    for (int i = m_regionStart; i < m_currentPage.fragments.size(); ++i) {
        if (!m_anchoredFragments.contains(i))
            indices.append(i);
    }
    if (indices.isEmpty())
        return;

    // Fragments were appended in flow order; stack them into one virtual
    // column so rows from different columns cannot share a y
    QList<Fragment> region;
    region.reserve(indices.size());
    qreal y = m_state.contentTop;
    for (int index : indices) {
        Fragment fragment = m_currentPage.fragments[index];
        const qreal h = Balancing::fragmentHeight(fragment, m_measures);
        std::visit([&](auto &f) { f.y = y; }, fragment);
        y += h;
        region.append(fragment);
    }

    const Balancing::ColumnSpec spec{m_regionColumns.count, m_regionColumns.gap, columnWidth()};
    if (!Balancing::rebalancePositionedContent(region, spec, m_currentPage.margins, m_state.contentTop,
                                               m_measures, m_balancing))
        return;

    // Rows move whole, so a rebalanced column can outgrow the region
    for (const auto &fragment : region) {
        const qreal bottom = fragmentY(fragment) + Balancing::fragmentHeight(fragment, m_measures);
        if (bottom > m_state.contentBottom + kOverflowTolerance) {
            qDebug() << "Engine: balanced columns overflow page" << m_currentPage.pageNumber
                     << "- keeping flow placement";
            return;
        }
    }

    for (int i = 0; i < region.size(); ++i)
        m_currentPage.fragments[indices[i]] = region[i];

    m_state.cursorY = regionBottom();
    qDebug() << "Engine: balanced region on page" << m_currentPage.pageNumber
             << "into" << m_regionColumns.count << "columns, bottom" << m_state.cursorY;
}

// --- Section breaks ---

void Engine::handleSectionBreak(const Content::SectionBreak &markerIn)
{
    Content::SectionBreak marker = markerIn;
    if (m_sectionStart && Sections::shouldRequirePageBoundary(*m_sectionStart, marker))
        marker.requirePageBoundary = true;

    const Sections::ScheduleResult scheduled = Sections::scheduleSectionBreak(
        marker, m_section, m_baseMargins,
        m_doc->maxHeaderContentHeight, m_doc->maxFooterContentHeight);
    m_section = scheduled.state;
    const Sections::BreakDecision &decision = scheduled.decision;

    // The ending section's own flag decides; the break type says how it ends
    const std::optional<bool> endingFlag = m_sectionStart ? m_sectionStart->balanceColumns : std::nullopt;

    if (decision.forcePageBreak) {
        if (m_pageOpen) {
            balanceRegion(Balancing::shouldBalanceColumns(marker.type, endingFlag, false));
            if (m_currentPage.fragments.isEmpty())
                m_pageOpen = false; // reopened with the new geometry
            else
                finishPage();
        }

        // Blank page so the section starts on the required parity
        if (decision.requiredParity && !m_pages.isEmpty()) {
            const int nextNumber = m_pages.size() + 1; // 1-based
            const bool even = nextNumber % 2 == 0;
            if (even != (*decision.requiredParity == Sections::Parity::Even)) {
                ensurePage();
                m_currentPage.isBlank = true;
                finishPage();
            }
        }
    } else if (decision.forceMidPageRegion && m_pageOpen) {
        balanceRegion(Balancing::shouldBalanceColumns(marker.type, endingFlag, false));
        const qreal top = regionBottom();

        m_section = Sections::applyPendingColumns(m_section);
        m_regionColumns = m_section.activeColumns;
        m_regionStart = m_currentPage.fragments.size();
        m_state.columnIndex = 0;
        m_state.contentTop = std::min(top, m_state.contentBottom);
        m_state.cursorY = m_state.contentTop;
    }

    m_sectionStart = marker;
}

// --- Blocks ---

void Engine::keepWithNextBlock(qreal blockHeight, const Content::BlockNode *next)
{
    if (!next)
        return;
    PageState &state = ensurePage();
    if (state.columnIsEmpty())
        return;

    const qreal needed = blockHeight + leadingHeight(*next);
    // Moving only helps when the pair fits an empty column
    if (needed > state.remainingHeight() && needed <= columnHeight())
        advanceColumn(state);
}

void Engine::layoutParagraph(const Content::Paragraph &para, const Content::BlockNode *next)
{
    PageState *state = &ensurePage();
    const int lineCount = para.lines.size();

    if (lineCount == 0) {
        if (!state->columnIsEmpty())
            state->cursorY += para.spaceBefore;
        state->cursorY = std::min(state->cursorY + para.spaceAfter, state->contentBottom);
        return;
    }

    const qreal total = para.measuredHeight();
    const bool atomic = para.keepTogether || !para.canBreak;

    if (para.keepWithNext)
        keepWithNextBlock(para.spaceBefore + total, next);

    state = &ensurePage();
    if (atomic && !state->columnIsEmpty()
        && para.spaceBefore + total > state->remainingHeight() && total <= columnHeight()) {
        state = &advanceColumn(*state);
    }

    int line = 0;
    while (line < lineCount) {
        state = &ensurePage();
        const bool emptyColumn = state->columnIsEmpty();
        const qreal spaceBefore = (line == 0 && !emptyColumn) ? para.spaceBefore : 0;
        const qreal available = state->remainingHeight() - spaceBefore;

        int rawFit = 0;
        qreal used = 0;
        while (line + rawFit < lineCount && used + para.lines[line + rawFit].lineHeight <= available) {
            used += para.lines[line + rawFit].lineHeight;
            ++rawFit;
        }

        const int remaining = lineCount - line;
        int fit = rawFit;
        if (fit < remaining) {
            if (atomic) {
                fit = 0;
            } else {
                // Widows: carry at least widowLines to the next column
                if (remaining - fit < para.widowLines)
                    fit = std::max(0, remaining - para.widowLines);
                // Orphans: leave at least orphanLines at the bottom
                if (line == 0 && fit < para.orphanLines)
                    fit = 0;
            }
        }

        if (fit == 0) {
            if (!emptyColumn) {
                advanceColumn(*state);
                continue;
            }
            // Empty column: place what fits, at least one line
            fit = std::max(1, rawFit);
        }

        ParagraphFragment fragment;
        fragment.blockId = para.id;
        fragment.fromLine = line;
        fragment.toLine = line + fit;
        fragment.x = columnX(state->columnIndex);
        fragment.y = state->cursorY + spaceBefore;
        fragment.width = columnWidth();
        fragment.height = para.linesHeight(line, line + fit);
        fragment.continuesFromPrev = line > 0;
        fragment.continuesOnNext = line + fit < lineCount;
        fragment.pm = linesPmRange(para, line, line + fit);

        state->cursorY = fragment.y + fragment.height;
        state->page->fragments.append(fragment);

        line += fit;
        if (line < lineCount)
            advanceColumn(*state);
    }

    state = &ensurePage();
    state->cursorY = std::min(state->cursorY + para.spaceAfter, state->contentBottom);
}

void Engine::layoutImage(const Content::Image &image, const Content::BlockNode *next)
{
    if (image.keepWithNext)
        keepWithNextBlock(image.height, next);

    PageState *state = &ensurePage();
    if (image.height > state->remainingHeight() && !state->columnIsEmpty())
        state = &advanceColumn(*state);

    ImageFragment fragment;
    fragment.blockId = image.id;
    fragment.x = columnX(state->columnIndex);
    fragment.y = state->cursorY;
    fragment.width = std::min(image.width, columnWidth());
    fragment.height = image.height;
    fragment.pm = image.pm;

    state->cursorY += fragment.height;
    state->page->fragments.append(fragment);
}

void Engine::layoutTable(const Content::Table &table, const Content::BlockNode *next)
{
    if (table.keepWithNext && !table.attrs.anchored)
        keepWithNextBlock(table.totalHeight, next);

    PageState &state = ensurePage();

    if (table.attrs.anchored) {
        // Anchored tables sit at the anchor point without taking flow space
        m_anchoredFragments.insert(state.page->fragments.size());
        state.page->fragments.append(
            Tables::createAnchoredTableFragment(table, columnX(state.columnIndex), state.cursorY));
        return;
    }

    Tables::layoutTableBlock(Tables::TableLayoutContext{table, columnWidth(), *this});
}

} // namespace Layout
