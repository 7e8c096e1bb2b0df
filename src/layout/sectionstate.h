/*
 * sectionstate.h — Section geometry state machine
 *
 * Tracks the active page geometry of the current section together with the
 * geometry scheduled (pending) for the next page boundary, and turns each
 * section break into a break decision. All functions are pure: they take a
 * state value and return a new one.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_SECTIONSTATE_H
#define PAGEFLOW_SECTIONSTATE_H

#include <QPageLayout>
#include <QSizeF>

#include <optional>

#include "contentmodel.h"
#include "pagelayout.h"

namespace Sections {

struct SectionState {
    qreal activeTopMargin = 0;
    qreal activeBottomMargin = 0;
    qreal activeLeftMargin = 0;
    qreal activeRightMargin = 0;
    std::optional<qreal> pendingTopMargin;
    std::optional<qreal> pendingBottomMargin;
    std::optional<qreal> pendingLeftMargin;
    std::optional<qreal> pendingRightMargin;

    qreal activeHeaderDistance = 0;
    qreal activeFooterDistance = 0;
    std::optional<qreal> pendingHeaderDistance;
    std::optional<qreal> pendingFooterDistance;

    QSizeF activePageSize;
    std::optional<QSizeF> pendingPageSize;

    ColumnLayout activeColumns;
    std::optional<ColumnLayout> pendingColumns;

    std::optional<QPageLayout::Orientation> activeOrientation;
    std::optional<QPageLayout::Orientation> pendingOrientation;

    bool hasAnyPages = false;

    bool hasPending() const
    {
        return pendingTopMargin || pendingBottomMargin || pendingLeftMargin
            || pendingRightMargin || pendingHeaderDistance || pendingFooterDistance
            || pendingPageSize || pendingColumns || pendingOrientation;
    }

    bool operator==(const SectionState &o) const;
    bool operator!=(const SectionState &o) const { return !(*this == o); }
};

enum class Parity { Even, Odd };

struct BreakDecision {
    bool forcePageBreak = false;
    bool forceMidPageRegion = false;
    std::optional<Parity> requiredParity;
};

struct ScheduleResult {
    BreakDecision decision;
    SectionState state;
};

struct BaseMargins {
    qreal top = 0;
    qreal bottom = 0;
    qreal left = 0;
    qreal right = 0;
};

// Starting state for a document whose base geometry is pageLayout.
SectionState initialSectionState(const PageLayout &pageLayout);

// Schedule the effects of a section break. maxHeaderContentHeight and
// maxFooterContentHeight reserve room for the tallest header/footer; pass 0
// when there is none.
ScheduleResult scheduleSectionBreak(const Content::SectionBreak &marker,
                                    const SectionState &state,
                                    const BaseMargins &baseMargins,
                                    qreal maxHeaderContentHeight = 0,
                                    qreal maxFooterContentHeight = 0);

// Page boundary transition: every pending field becomes active and all
// pending fields are cleared. Applying twice is a no-op the second time.
SectionState applyPendingToActive(const SectionState &state);

// Mid-page region start: only the pending column configuration becomes
// active. Other pending geometry still waits for the next page boundary.
SectionState applyPendingColumns(const SectionState &state);

// Orientation or page size changes between two sections force a page
// boundary even for continuous breaks. Only fields both sides specify count.
bool shouldRequirePageBoundary(const Content::SectionBreak &current,
                               const Content::SectionBreak &next);

// Explicit column spec, or the single-column default when absent.
ColumnLayout effectiveColumns(const std::optional<ColumnLayout> &columns);

bool isColumnConfigChanging(const std::optional<ColumnLayout> &columns,
                            const ColumnLayout &activeColumns);

} // namespace Sections

#endif // PAGEFLOW_SECTIONSTATE_H
