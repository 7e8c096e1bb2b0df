/*
 * sectionstate.cpp — Section geometry state machine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionstate.h"

#include <algorithm>
#include <cmath>

namespace Sections {

namespace {

// Finite lengths are clamped to >= 0; anything else counts as absent.
std::optional<qreal> validLength(const std::optional<qreal> &value)
{
    if (!value || !std::isfinite(*value))
        return std::nullopt;
    return std::max<qreal>(0.0, *value);
}

// Body top must clear the tallest header, which sits headerDistance from the
// page top. Without header content the section margin is used unmodified.
qreal requiredTopMargin(qreal headerDistance, qreal baseTop, qreal maxHeaderContentHeight)
{
    if (maxHeaderContentHeight > 0)
        return std::max(baseTop, headerDistance + maxHeaderContentHeight);
    return baseTop;
}

qreal requiredBottomMargin(qreal footerDistance, qreal baseBottom, qreal maxFooterContentHeight)
{
    if (maxFooterContentHeight > 0)
        return std::max(baseBottom, footerDistance + maxFooterContentHeight);
    return baseBottom;
}

template <typename T>
void promote(T &active, std::optional<T> &pending)
{
    if (pending)
        active = *pending;
    pending.reset();
}

} // anonymous namespace

bool SectionState::operator==(const SectionState &o) const
{
    return activeTopMargin == o.activeTopMargin
        && activeBottomMargin == o.activeBottomMargin
        && activeLeftMargin == o.activeLeftMargin
        && activeRightMargin == o.activeRightMargin
        && pendingTopMargin == o.pendingTopMargin
        && pendingBottomMargin == o.pendingBottomMargin
        && pendingLeftMargin == o.pendingLeftMargin
        && pendingRightMargin == o.pendingRightMargin
        && activeHeaderDistance == o.activeHeaderDistance
        && activeFooterDistance == o.activeFooterDistance
        && pendingHeaderDistance == o.pendingHeaderDistance
        && pendingFooterDistance == o.pendingFooterDistance
        && activePageSize == o.activePageSize
        && pendingPageSize == o.pendingPageSize
        && activeColumns == o.activeColumns
        && pendingColumns == o.pendingColumns
        && activeOrientation == o.activeOrientation
        && pendingOrientation == o.pendingOrientation
        && hasAnyPages == o.hasAnyPages;
}

SectionState initialSectionState(const PageLayout &pageLayout)
{
    SectionState s;
    s.activeTopMargin = pageLayout.margins.top();
    s.activeBottomMargin = pageLayout.margins.bottom();
    s.activeLeftMargin = pageLayout.margins.left();
    s.activeRightMargin = pageLayout.margins.right();
    s.activeHeaderDistance = pageLayout.headerDistance;
    s.activeFooterDistance = pageLayout.footerDistance;
    s.activePageSize = pageLayout.pageSize;
    s.activeColumns = pageLayout.columns;
    s.activeOrientation = pageLayout.orientation;
    return s;
}

ColumnLayout effectiveColumns(const std::optional<ColumnLayout> &columns)
{
    // Absence means single column, never "inherit the previous section"
    return columns ? *columns : ColumnLayout::singleColumn();
}

bool isColumnConfigChanging(const std::optional<ColumnLayout> &columns,
                            const ColumnLayout &activeColumns)
{
    if (columns)
        return *columns != activeColumns;
    return activeColumns.isMultiColumn();
}

ScheduleResult scheduleSectionBreak(const Content::SectionBreak &marker,
                                    const SectionState &state,
                                    const BaseMargins &baseMargins,
                                    qreal maxHeaderContentHeight,
                                    qreal maxFooterContentHeight)
{
    SectionState next = state;

    const auto headerPx = validLength(marker.margins.header);
    const auto footerPx = validLength(marker.margins.footer);
    const auto topPx = validLength(marker.margins.top);
    const auto bottomPx = validLength(marker.margins.bottom);
    const auto leftPx = validLength(marker.margins.left);
    const auto rightPx = validLength(marker.margins.right);

    // --- First section: no page boundary to defer to, write active directly ---
    if (marker.isFirstSection && !next.hasAnyPages) {
        if (marker.pageSize) {
            next.activePageSize = *marker.pageSize;
            next.pendingPageSize.reset();
        }
        if (marker.orientation) {
            next.activeOrientation = *marker.orientation;
            next.pendingOrientation.reset();
        }

        const qreal headerDistance = headerPx.value_or(next.activeHeaderDistance);
        const qreal footerDistance = footerPx.value_or(next.activeFooterDistance);
        const qreal sectionTop = topPx.value_or(baseMargins.top);
        const qreal sectionBottom = bottomPx.value_or(baseMargins.bottom);

        if (headerPx)
            next.activeHeaderDistance = headerDistance;
        if (footerPx)
            next.activeFooterDistance = footerDistance;
        if (topPx || headerPx)
            next.activeTopMargin = requiredTopMargin(headerDistance, sectionTop, maxHeaderContentHeight);
        if (bottomPx || footerPx)
            next.activeBottomMargin = requiredBottomMargin(footerDistance, sectionBottom, maxFooterContentHeight);
        if (leftPx)
            next.activeLeftMargin = *leftPx;
        if (rightPx)
            next.activeRightMargin = *rightPx;

        next.activeColumns = effectiveColumns(marker.columns);
        next.pendingColumns.reset();
        return {BreakDecision{}, next};
    }

    // --- Margins and header/footer distances, scheduled as pending ---
    const qreal nextTop = next.pendingTopMargin.value_or(next.activeTopMargin);
    const qreal nextBottom = next.pendingBottomMargin.value_or(next.activeBottomMargin);
    const qreal nextLeft = next.pendingLeftMargin.value_or(next.activeLeftMargin);
    const qreal nextRight = next.pendingRightMargin.value_or(next.activeRightMargin);
    const qreal nextHeader = next.pendingHeaderDistance.value_or(next.activeHeaderDistance);
    const qreal nextFooter = next.pendingFooterDistance.value_or(next.activeFooterDistance);

    if (headerPx || topPx) {
        const qreal headerDistance = headerPx.value_or(nextHeader);
        next.pendingHeaderDistance = headerDistance;
        next.pendingTopMargin = requiredTopMargin(headerDistance, topPx.value_or(baseMargins.top),
                                                  maxHeaderContentHeight);
    } else {
        next.pendingTopMargin = nextTop;
        next.pendingHeaderDistance = nextHeader;
    }

    if (footerPx || bottomPx) {
        const qreal footerDistance = footerPx.value_or(nextFooter);
        next.pendingFooterDistance = footerDistance;
        next.pendingBottomMargin = requiredBottomMargin(footerDistance, bottomPx.value_or(baseMargins.bottom),
                                                        maxFooterContentHeight);
    } else {
        next.pendingBottomMargin = nextBottom;
        next.pendingFooterDistance = nextFooter;
    }

    next.pendingLeftMargin = leftPx.value_or(nextLeft);
    next.pendingRightMargin = rightPx.value_or(nextRight);

    if (marker.pageSize)
        next.pendingPageSize = *marker.pageSize;
    if (marker.orientation)
        next.pendingOrientation = *marker.orientation;

    // The column target is always scheduled so the next boundary has one
    next.pendingColumns = effectiveColumns(marker.columns);
    const bool columnsChanging = isColumnConfigChanging(marker.columns, next.activeColumns);

    BreakDecision decision;
    if (marker.requirePageBoundary) {
        decision.forcePageBreak = true;
        return {decision, next};
    }

    switch (marker.type.value_or(Content::SectionType::Continuous)) {
    case Content::SectionType::NextPage:
        decision.forcePageBreak = true;
        break;
    case Content::SectionType::EvenPage:
        decision.forcePageBreak = true;
        decision.requiredParity = Parity::Even;
        break;
    case Content::SectionType::OddPage:
        decision.forcePageBreak = true;
        decision.requiredParity = Parity::Odd;
        break;
    case Content::SectionType::Continuous:
        decision.forceMidPageRegion = columnsChanging;
        break;
    }

    return {decision, next};
}

SectionState applyPendingToActive(const SectionState &state)
{
    SectionState next = state;
    promote(next.activeTopMargin, next.pendingTopMargin);
    promote(next.activeBottomMargin, next.pendingBottomMargin);
    promote(next.activeLeftMargin, next.pendingLeftMargin);
    promote(next.activeRightMargin, next.pendingRightMargin);
    promote(next.activeHeaderDistance, next.pendingHeaderDistance);
    promote(next.activeFooterDistance, next.pendingFooterDistance);
    promote(next.activePageSize, next.pendingPageSize);
    promote(next.activeColumns, next.pendingColumns);
    if (next.pendingOrientation)
        next.activeOrientation = next.pendingOrientation;
    next.pendingOrientation.reset();
    return next;
}

SectionState applyPendingColumns(const SectionState &state)
{
    SectionState next = state;
    promote(next.activeColumns, next.pendingColumns);
    return next;
}

bool shouldRequirePageBoundary(const Content::SectionBreak &current,
                               const Content::SectionBreak &next)
{
    if (current.orientation && next.orientation && *current.orientation != *next.orientation)
        return true;

    if (current.pageSize && next.pageSize && *current.pageSize != *next.pageSize)
        return true;

    return false;
}

} // namespace Sections
