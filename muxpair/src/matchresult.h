#ifndef MATCHRESULT_H
#define MATCHRESULT_H

#include <QList>
#include <QString>

enum class MatchKind {
    None,
    Exact,
    ExactWithLangCode,
    Episode,
    Fuzzy,
    Manual
};

QString matchKindToString(MatchKind kind);

/**
 * @brief Score of one video/subtitle pair
 */
struct MatchCandidate {
    double score;
    MatchKind kind;
    QString reason;

    MatchCandidate() : score(0.0), kind(MatchKind::None) {}
    MatchCandidate(double s, MatchKind k, const QString &r) : score(s), kind(k), reason(r) {}
};

/**
 * @brief Best subtitle found for one video
 *
 * subtitlePath is empty when nothing matched or the best pair was rejected
 * by strict matching. reason is always a readable explanation.
 */
class MatchResult
{
public:
    MatchResult();
    MatchResult(const QString &videoPath, const QString &subtitlePath,
                double confidence, MatchKind kind, const QString &reason);

    /**
     * @brief Replace an automatic result with a user choice
     * @param subtitlePath Chosen subtitle, or empty to force "no subtitle"
     */
    static MatchResult manualOverride(const QString &videoPath, const QString &subtitlePath);

    QString videoPath() const { return m_videoPath; }
    QString subtitlePath() const { return m_subtitlePath; }
    bool hasSubtitle() const { return !m_subtitlePath.isEmpty(); }
    double confidence() const { return m_confidence; }
    MatchKind kind() const { return m_kind; }
    QString reason() const { return m_reason; }

    bool isConfident(double threshold = 0.7) const { return m_confidence >= threshold; }

private:
    QString m_videoPath;
    QString m_subtitlePath;
    double m_confidence;
    MatchKind m_kind;
    QString m_reason;
};

/**
 * @brief Counts shown in a batch preview
 */
struct MatchSummary {
    int total;
    int highConfidence;  // has a subtitle and isConfident(threshold)
    int lowConfidence;   // has a subtitle below the threshold
    int unmatched;

    MatchSummary() : total(0), highConfidence(0), lowConfidence(0), unmatched(0) {}

    static MatchSummary summarize(const QList<MatchResult> &results, double threshold = 0.7);
};

#endif // MATCHRESULT_H
