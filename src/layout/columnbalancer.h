/*
 * columnbalancer.h — Column balancing for multi-column sections
 *
 * Two related passes:
 *  - balance(): distributes measured blocks across columns before placement,
 *    searching for a target height that leaves the columns near-equal.
 *  - rebalancePositionedContent(): redistributes fragments that are already
 *    positioned on a page, row by row.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEFLOW_COLUMNBALANCER_H
#define PAGEFLOW_COLUMNBALANCER_H

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMarginsF>
#include <QString>

#include <optional>

#include "contentmodel.h"
#include "pagecursor.h"

namespace Balancing {

struct Config {
    bool enabled = true;
    qreal tolerance = 5.0;     // acceptable height spread between columns
    int maxIterations = 10;
    qreal minColumnHeight = 20.0;

    static Config fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

// A measured block as the balancer sees it
struct Block {
    QString blockId;
    qreal measuredHeight = 0;
    bool canBreak = true;
    bool keepWithNext = false;
    bool keepTogether = false;
    int orphanLines = 1;
    int widowLines = 1;
    QList<qreal> lineHeights; // paragraphs only; enables line-level splits
};

struct Context {
    int columnCount = 1;
    qreal columnWidth = 0;
    qreal columnGap = 0;
    qreal availableHeight = 0; // from the current position to the content bottom
    QList<Block> contentBlocks;
};

struct BreakPoint {
    QString blockId;
    int breakAfterLine = -1; // last line kept in the earlier column
    qreal heightBeforeBreak = 0;
    qreal heightAfterBreak = 0;
};

struct Result {
    qreal targetColumnHeight = 0;
    QHash<QString, int> columnAssignments;
    bool success = true;
    int iterations = 0;
    QHash<QString, BreakPoint> blockBreakPoints; // empty when nothing was split
};

Result balance(const Context &ctx, const Config &config = {});

// Where a paragraph can be cut to fit availableHeight. breakAfterLine is the
// last line that stays; canBreak is false when orphan/widow limits forbid it.
struct ParagraphCut {
    int breakAfterLine = -1;
    bool canBreak = false;
};
ParagraphCut findParagraphBreakPoint(const QList<qreal> &lineHeights,
                                     qreal availableHeight,
                                     int orphanLines,
                                     int widowLines);

bool shouldSkipBalancing(const Context &ctx, const Config &config = {});

// Explicit flag wins; otherwise continuous sections and the final section balance.
bool shouldBalanceColumns(std::optional<Content::SectionType> sectionType,
                          std::optional<bool> explicitFlag,
                          bool isLastSection);

// Balancer view of a measured block, with the block's own constraints
Block blockFromParagraph(const Content::Paragraph &para);

// --- Post-placement ---

struct ColumnSpec {
    int count = 1;
    qreal gap = 0;
    qreal width = 0;
};

// Measurements used to size positioned fragments
struct Measure {
    QList<qreal> lineHeights; // paragraphs
    std::optional<qreal> height; // tables, images
};
using MeasureMap = QHash<QString, Measure>;

qreal fragmentHeight(const Layout::Fragment &fragment, const MeasureMap &measurements);

// Redistributes fragments row by row across the columns. Returns false and
// leaves fragments untouched when there is too little content to balance.
bool rebalancePositionedContent(QList<Layout::Fragment> &fragments,
                                const ColumnSpec &columns,
                                const QMarginsF &margins,
                                qreal topMargin,
                                const MeasureMap &measurements,
                                const Config &config = {});

} // namespace Balancing

#endif // PAGEFLOW_COLUMNBALANCER_H
