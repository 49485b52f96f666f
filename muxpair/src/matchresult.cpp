#include "matchresult.h"

QString matchKindToString(MatchKind kind)
{
    switch (kind) {
        case MatchKind::Exact:
            return "exact";
        case MatchKind::ExactWithLangCode:
            return "exact+lang";
        case MatchKind::Episode:
            return "episode";
        case MatchKind::Fuzzy:
            return "fuzzy";
        case MatchKind::Manual:
            return "manual";
        case MatchKind::None:
        default:
            return "none";
    }
}

MatchResult::MatchResult()
    : m_confidence(0.0)
    , m_kind(MatchKind::None)
    , m_reason("No match")
{
}

MatchResult::MatchResult(const QString &videoPath, const QString &subtitlePath,
                         double confidence, MatchKind kind, const QString &reason)
    : m_videoPath(videoPath)
    , m_subtitlePath(subtitlePath)
    , m_confidence(qBound(0.0, confidence, 1.0))
    , m_kind(kind)
    , m_reason(reason.isEmpty() ? QString("No reason given") : reason)
{
}

MatchResult MatchResult::manualOverride(const QString &videoPath, const QString &subtitlePath)
{
    if (subtitlePath.isEmpty()) {
        return MatchResult(videoPath, QString(), 0.0, MatchKind::Manual, "Manually set to no subtitle");
    }
    return MatchResult(videoPath, subtitlePath, 1.0, MatchKind::Manual, "Manually selected");
}

MatchSummary MatchSummary::summarize(const QList<MatchResult> &results, double threshold)
{
    MatchSummary summary;
    summary.total = results.size();
    for (const MatchResult &result : results) {
        if (!result.hasSubtitle()) {
            summary.unmatched++;
        } else if (result.isConfident(threshold)) {
            summary.highConfidence++;
        } else {
            summary.lowConfidence++;
        }
    }
    return summary;
}
