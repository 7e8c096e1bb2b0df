/*
 * layoutengine.h — Measured blocks → pages, columns and fragments
 *
 * Reference page-building loop for the pagination core. Walks a
 * Content::Document in order, applies section breaks through the section
 * state machine, places paragraphs and images itself and hands tables to
 * the table fragmenter. Engine is the PageCursor those components see.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_LAYOUTENGINE_H
#define PAGEFLOW_LAYOUTENGINE_H

#include <QList>
#include <QSet>

#include <optional>

#include "columnbalancer.h"
#include "contentmodel.h"
#include "pagecursor.h"
#include "sectionstate.h"

namespace Layout {

struct LayoutResult {
    QList<Page> pages;
};

// --- Layout Engine ---

class Engine : public PageCursor {
public:
    Engine() = default;

    LayoutResult layout(const Content::Document &doc);

    void setBalancingConfig(const Balancing::Config &config) { m_balancing = config; }
    const Balancing::Config &balancingConfig() const { return m_balancing; }

    // PageCursor
    PageState &ensurePage() override;
    PageState &advanceColumn(PageState &state) override;
    qreal columnX(int columnIndex) const override;

private:
    void reset(const Content::Document &doc);

    // Block placement
    void layoutParagraph(const Content::Paragraph &para, const Content::BlockNode *next);
    void layoutImage(const Content::Image &image, const Content::BlockNode *next);
    void layoutTable(const Content::Table &table, const Content::BlockNode *next);
    void handleSectionBreak(const Content::SectionBreak &marker);

    // Keep-with-next: move to the next column when this block and the
    // start of the next one do not both fit here
    void keepWithNextBlock(qreal blockHeight, const Content::BlockNode *next);

    // Page and region bookkeeping
    void finishPage();
    void balanceRegion(bool enabled);
    qreal regionBottom() const;
    qreal columnWidth() const;
    qreal columnHeight() const;

    Balancing::Config m_balancing;
    Balancing::MeasureMap m_measures;

    const Content::Document *m_doc = nullptr;
    Sections::SectionState m_section;
    Sections::BaseMargins m_baseMargins;

    // Break that opened the current section, if any
    std::optional<Content::SectionBreak> m_sectionStart;

    QList<Page> m_pages;
    Page m_currentPage; // PageState::page points here while m_pageOpen
    bool m_pageOpen = false;
    PageState m_state;

    // Column region on the current page: columns, and first fragment index
    ColumnLayout m_regionColumns;
    int m_regionStart = 0;

    // Indices of anchored table fragments on the current page; they keep
    // the host's position and take no part in flow or balancing
    QSet<int> m_anchoredFragments;
};

} // namespace Layout

#endif // PAGEFLOW_LAYOUTENGINE_H
