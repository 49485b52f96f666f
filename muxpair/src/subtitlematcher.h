#ifndef SUBTITLEMATCHER_H
#define SUBTITLEMATCHER_H

#include <QList>
#include <QString>
#include <QStringList>
#include "episodekey.h"
#include "matchresult.h"

/**
 * @brief Pairs video files with subtitle files by confidence score
 *
 * Scoring ladder for one pair (first rule that applies wins):
 *   1.00  identical base names
 *   0.99  subtitle is "<video base>.<lang>.<ext>"
 *   0.20  same episode, both seasons known but different
 *   0.60  same episode, season unknown on a side (+0.15 / +0.05 name bonus)
 *   0.80  same season and episode (+0.15 / +0.05 name bonus), capped at 0.95
 *   0.70  no episode in the video name, show names > 90% similar
 *   0.50  no episode in the video name, show names > 70% similar
 *   0.00  nothing in common
 *
 * The matcher keeps no state between calls and can be shared across
 * threads. Each video is matched against the whole candidate list, so one
 * subtitle may be chosen for several videos.
 */
class SubtitleMatcher
{
public:
    struct Alternative {
        QString subtitlePath;
        MatchCandidate candidate;
    };

    // Threshold below which strict matching drops the subtitle
    static constexpr double kStrictThreshold = 0.9;

    explicit SubtitleMatcher(bool debug = false);

    /**
     * @brief Score a single video/subtitle pair
     */
    MatchCandidate scoreMatch(const QString &videoPath, const QString &subtitlePath) const;

    /**
     * @brief Best subtitle for one video
     * @param strict Drop the subtitle when the best score is below kStrictThreshold
     *
     * Ties keep the candidate seen first.
     */
    MatchResult matchSingle(const QString &videoPath, const QStringList &candidates,
                            bool strict = false) const;

    /**
     * @brief matchSingle() for every video against the same candidate list
     */
    QList<MatchResult> matchBatch(const QStringList &videoPaths, const QStringList &subtitlePaths,
                                  bool strict = false) const;

    /**
     * @brief All candidates ranked by score, for manual selection
     */
    QList<Alternative> alternativeMatches(const QString &videoPath, const QStringList &candidates,
                                          int topN = 5) const;

    /**
     * @brief Recursively collect subtitle files below root
     */
    static QStringList findAllSubtitles(const QString &root);

    static QStringList subtitleExtensions();

private:
    struct VideoKey {
        QString stem;
        QString showName;
        EpisodeKey episode;
    };

    static VideoKey describeVideo(const QString &videoPath);
    MatchCandidate scoreAgainst(const VideoKey &video, const QString &subtitlePath) const;

    bool m_debug;
};

#endif // SUBTITLEMATCHER_H
