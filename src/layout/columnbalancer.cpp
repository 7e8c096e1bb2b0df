/*
 * columnbalancer.cpp — Column balancing for multi-column sections
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "columnbalancer.h"

#include <QDebug>
#include <QJsonValue>
#include <QMap>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>
#include <vector>

namespace Balancing {

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

Config Config::fromJson(const QJsonObject &obj)
{
    Config c;
    if (obj.contains(QLatin1String("enabled")))
        c.enabled = obj.value(QLatin1String("enabled")).toBool(c.enabled);

    const qreal tolerance = obj.value(QLatin1String("tolerance")).toDouble(c.tolerance);
    if (std::isfinite(tolerance) && tolerance >= 0)
        c.tolerance = tolerance;

    const int maxIterations = obj.value(QLatin1String("maxIterations")).toInt(c.maxIterations);
    if (maxIterations >= 0)
        c.maxIterations = maxIterations;

    const qreal minColumnHeight = obj.value(QLatin1String("minColumnHeight")).toDouble(c.minColumnHeight);
    if (std::isfinite(minColumnHeight) && minColumnHeight >= 0)
        c.minColumnHeight = minColumnHeight;

    return c;
}

QJsonObject Config::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("enabled")] = enabled;
    obj[QLatin1String("tolerance")] = tolerance;
    obj[QLatin1String("maxIterations")] = maxIterations;
    obj[QLatin1String("minColumnHeight")] = minColumnHeight;
    return obj;
}

// ---------------------------------------------------------------------------
// Pre-placement balancing
// ---------------------------------------------------------------------------

namespace {

struct Simulation {
    QHash<QString, int> assignments;
    std::vector<qreal> columnHeights;
    QHash<QString, BreakPoint> breakPoints;
};

qreal totalHeight(const QList<Block> &blocks)
{
    qreal total = 0;
    for (const auto &b : blocks)
        total += b.measuredHeight;
    return total;
}

std::vector<qreal> nonEmpty(const std::vector<qreal> &heights)
{
    std::vector<qreal> out;
    std::copy_if(heights.begin(), heights.end(), std::back_inserter(out),
                 [](qreal h) { return h > 0; });
    return out;
}

Result singleColumnResult(const Context &ctx)
{
    Result r;
    r.targetColumnHeight = ctx.availableHeight;
    for (const auto &block : ctx.contentBlocks)
        r.columnAssignments.insert(block.blockId, 0);
    return r;
}

// Plain fill: move on only when the available height is exhausted.
Result sequentialResult(const Context &ctx)
{
    Result r;
    r.success = false;
    std::vector<qreal> heights(std::max(1, ctx.columnCount), 0.0);
    int column = 0;

    for (const auto &block : ctx.contentBlocks) {
        if (heights[column] + block.measuredHeight > ctx.availableHeight
            && column < int(heights.size()) - 1) {
            ++column;
        }
        r.columnAssignments.insert(block.blockId, column);
        heights[column] += block.measuredHeight;
    }

    r.targetColumnHeight = *std::max_element(heights.begin(), heights.end());
    return r;
}

Simulation simulate(const Context &ctx, qreal targetHeight)
{
    Simulation sim;
    sim.columnHeights.assign(ctx.columnCount, 0.0);
    int column = 0;

    for (int i = 0; i < ctx.contentBlocks.size(); ++i) {
        const Block &block = ctx.contentBlocks[i];
        const Block *nextBlock = (i + 1 < ctx.contentBlocks.size()) ? &ctx.contentBlocks[i + 1] : nullptr;

        const bool wouldExceed = sim.columnHeights[column] + block.measuredHeight > targetHeight;

        if (wouldExceed && column < ctx.columnCount - 1) {
            // Keep-with-next: stay when this block and the next both still fit
            if (block.keepWithNext && nextBlock) {
                const qreal combined = block.measuredHeight + nextBlock->measuredHeight;
                if (sim.columnHeights[column] + combined <= targetHeight) {
                    sim.assignments.insert(block.blockId, column);
                    sim.columnHeights[column] += block.measuredHeight;
                    continue;
                }
            }

            // Line-level split of a breakable paragraph
            if (block.canBreak && !block.keepTogether && block.lineHeights.size() > 1) {
                const ParagraphCut cut = findParagraphBreakPoint(
                    block.lineHeights, targetHeight - sim.columnHeights[column],
                    block.orphanLines, block.widowLines);

                if (cut.canBreak && cut.breakAfterLine >= 0) {
                    qreal before = 0;
                    for (int l = 0; l <= cut.breakAfterLine; ++l)
                        before += block.lineHeights[l];
                    const qreal after = block.measuredHeight - before;

                    sim.breakPoints.insert(block.blockId,
                                           BreakPoint{block.blockId, cut.breakAfterLine, before, after});
                    sim.assignments.insert(block.blockId, column);
                    sim.columnHeights[column] += before;

                    ++column;
                    sim.columnHeights[column] += after;
                    continue;
                }
            }

            ++column;
        }

        sim.assignments.insert(block.blockId, column);
        sim.columnHeights[column] += block.measuredHeight;
    }

    return sim;
}

bool isBalanced(const std::vector<qreal> &heights, qreal tolerance)
{
    const auto filled = nonEmpty(heights);
    if (filled.size() <= 1)
        return true;
    const auto [lo, hi] = std::minmax_element(filled.begin(), filled.end());
    return *hi - *lo <= tolerance;
}

// Variance of the non-empty columns plus a penalty per empty column. Lower is better.
qreal balanceScore(const std::vector<qreal> &heights, qreal tolerance)
{
    const auto filled = nonEmpty(heights);
    if (filled.size() <= 1)
        return 0;

    const qreal mean = std::accumulate(filled.begin(), filled.end(), qreal(0)) / filled.size();
    qreal variance = 0;
    for (qreal h : filled)
        variance += (h - mean) * (h - mean);

    const qreal emptyPenalty = qreal(heights.size() - filled.size()) * tolerance * 10;
    return variance + emptyPenalty;
}

qreal adjustTarget(const Simulation &sim, qreal target, const Context &ctx, const Config &config)
{
    const auto &heights = sim.columnHeights;
    const qreal maxHeight = *std::max_element(heights.begin(), heights.end());
    const auto filled = nonEmpty(heights);
    const qreal minHeight = filled.empty() ? 0 : *std::min_element(filled.begin(), filled.end());
    const qreal last = heights.back();

    // Last column carries the overflow: raise the target
    if (last > maxHeight * 0.9 && last > target)
        return std::min(target + (maxHeight - target) / 2, ctx.availableHeight);

    // Early columns overfull and the last one starved: lower it
    if (heights.front() > target && last < target * 0.5)
        return std::max(target - (target - minHeight) / 2, config.minColumnHeight);

    const qreal spread = maxHeight - minHeight;
    if (maxHeight > target)
        return std::min(target + spread / 4, ctx.availableHeight);
    return std::max(target - spread / 4, config.minColumnHeight);
}

} // anonymous namespace

ParagraphCut findParagraphBreakPoint(const QList<qreal> &lineHeights,
                                     qreal availableHeight,
                                     int orphanLines,
                                     int widowLines)
{
    if (lineHeights.isEmpty())
        return {};

    const int lineCount = lineHeights.size();
    qreal heightSoFar = 0;

    for (int i = 0; i < lineCount; ++i) {
        heightSoFar += lineHeights[i];
        if (heightSoFar <= availableHeight)
            continue;

        // Line i is the first that does not fit
        const int linesBefore = i;
        const int linesAfter = lineCount - i;

        if (linesAfter < widowLines) {
            // Pull the cut earlier so enough lines move to the next column
            const int adjusted = std::max(0, i - (widowLines - linesAfter));
            if (adjusted < orphanLines)
                return {};
            return {adjusted - 1, true};
        }

        if (linesBefore < orphanLines)
            return {};

        return {i - 1, true};
    }

    // Everything fits
    return {lineCount - 1, true};
}

Result balance(const Context &ctx, const Config &config)
{
    if (ctx.columnCount <= 1)
        return singleColumnResult(ctx);

    if (ctx.contentBlocks.isEmpty()) {
        Result r;
        r.targetColumnHeight = 0;
        r.iterations = 0;
        return r;
    }

    if (!config.enabled) {
        Result r = sequentialResult(ctx);
        r.success = true;
        return r;
    }

    const qreal total = totalHeight(ctx.contentBlocks);

    // Too little content to spread out
    if (total < config.minColumnHeight * ctx.columnCount)
        return singleColumnResult(ctx);

    // A single atomic block stays where it is
    if (ctx.contentBlocks.size() == 1 && !ctx.contentBlocks.first().canBreak)
        return singleColumnResult(ctx);

    qreal target = std::ceil(total / ctx.columnCount);
    target = std::max(target, config.minColumnHeight);
    target = std::min(target, ctx.availableHeight);

    std::optional<Simulation> best;
    qreal bestScore = std::numeric_limits<qreal>::infinity();

    for (int i = 0; i < config.maxIterations; ++i) {
        Simulation sim = simulate(ctx, target);
        const qreal score = balanceScore(sim.columnHeights, config.tolerance);

        if (isBalanced(sim.columnHeights, config.tolerance)) {
            Result r;
            r.targetColumnHeight = target;
            r.columnAssignments = sim.assignments;
            r.success = true;
            r.iterations = i + 1;
            r.blockBreakPoints = sim.breakPoints;
            return r;
        }

        if (score < bestScore) {
            bestScore = score;
            best = std::move(sim);
            target = adjustTarget(*best, target, ctx, config);
        } else {
            target = adjustTarget(sim, target, ctx, config);
        }
        qDebug() << "ColumnBalancer: iteration" << i + 1 << "score" << score << "next target" << target;
    }

    if (best) {
        Result r;
        r.targetColumnHeight = target;
        r.columnAssignments = best->assignments;
        r.success = false;
        r.iterations = config.maxIterations;
        r.blockBreakPoints = best->breakPoints;
        return r;
    }

    return sequentialResult(ctx);
}

bool shouldSkipBalancing(const Context &ctx, const Config &config)
{
    if (!config.enabled)
        return true;
    if (ctx.columnCount <= 1)
        return true;
    if (ctx.contentBlocks.isEmpty())
        return true;

    // A single long paragraph can still be spread across columns
    if (ctx.contentBlocks.size() == 1 && !ctx.contentBlocks.first().canBreak)
        return true;

    const qreal total = totalHeight(ctx.contentBlocks);
    if (total < config.minColumnHeight)
        return true;
    if (total / ctx.columnCount < config.minColumnHeight)
        return true;

    return false;
}

bool shouldBalanceColumns(std::optional<Content::SectionType> sectionType,
                          std::optional<bool> explicitFlag,
                          bool isLastSection)
{
    if (explicitFlag)
        return *explicitFlag;
    return sectionType == Content::SectionType::Continuous || isLastSection;
}

Block blockFromParagraph(const Content::Paragraph &para)
{
    Block b;
    b.blockId = para.id;
    b.measuredHeight = para.measuredHeight();
    b.canBreak = para.canBreak;
    b.keepWithNext = para.keepWithNext;
    b.keepTogether = para.keepTogether;
    b.orphanLines = para.orphanLines;
    b.widowLines = para.widowLines;
    for (const auto &line : para.lines)
        b.lineHeights.append(line.lineHeight);
    return b;
}

// ---------------------------------------------------------------------------
// Post-placement balancing
// ---------------------------------------------------------------------------

qreal fragmentHeight(const Layout::Fragment &fragment, const MeasureMap &measurements)
{
    return std::visit([&](const auto &f) -> qreal {
        using T = std::decay_t<decltype(f)>;
        const auto it = measurements.constFind(f.blockId);
        if constexpr (std::is_same_v<T, Layout::ParagraphFragment>) {
            if (it == measurements.constEnd() || it->lineHeights.isEmpty())
                return f.height;
            qreal sum = 0;
            const int to = std::min<int>(f.toLine, it->lineHeights.size());
            for (int i = std::max(0, f.fromLine); i < to; ++i)
                sum += it->lineHeights[i];
            return sum;
        } else {
            if (f.height > 0)
                return f.height;
            if (it != measurements.constEnd() && it->height)
                return *it->height;
            return 0;
        }
    }, fragment);
}

bool rebalancePositionedContent(QList<Layout::Fragment> &fragments,
                                const ColumnSpec &columns,
                                const QMarginsF &margins,
                                qreal topMargin,
                                const MeasureMap &measurements,
                                const Config &config)
{
    if (!config.enabled || columns.count <= 1 || fragments.isEmpty())
        return false;

    auto columnX = [&](int index) {
        return margins.left() + index * (columns.width + columns.gap);
    };

    // Fragments sharing a (rounded) y form one row and move together
    struct RowEntry {
        int fragmentIndex;
        qreal height;
    };
    QMap<int, QList<RowEntry>> rows;
    for (int i = 0; i < fragments.size(); ++i) {
        const int y = qRound(Layout::fragmentY(fragments[i]));
        rows[y].append(RowEntry{i, fragmentHeight(fragments[i], measurements)});
    }

    auto rowHeight = [](const QList<RowEntry> &row) {
        qreal h = 0;
        for (const auto &e : row)
            h = std::max(h, e.height);
        return h;
    };

    qreal total = 0;
    for (const auto &row : rows)
        total += rowHeight(row);

    const qreal targetHeight = total / columns.count;
    if (targetHeight < config.minColumnHeight)
        return false;

    int column = 0;
    qreal columnHeight = 0;
    qreal y = topMargin;

    for (const auto &row : rows) {
        const qreal h = rowHeight(row);

        // Switch once the target is reached, not only when exceeded
        if (columnHeight > 0 && columnHeight + h >= targetHeight && column < columns.count - 1) {
            ++column;
            columnHeight = 0;
            y = topMargin;
        }

        const qreal x = columnX(column);
        for (const auto &entry : row) {
            std::visit([&](auto &f) {
                f.x = x;
                f.y = y;
                f.width = columns.width;
            }, fragments[entry.fragmentIndex]);
        }

        columnHeight += h;
        y += h;
    }
    return true;
}

} // namespace Balancing
