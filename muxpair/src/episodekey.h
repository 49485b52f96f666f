#ifndef EPISODEKEY_H
#define EPISODEKEY_H

#include <QString>

/**
 * @brief Season/episode pair recovered from a release filename
 *
 * Either half may be unknown. Unknown is not the same as zero: a file
 * named "Show - 00" has episode 0, while "Show" has no episode at all.
 *
 * Formatting:
 *   season known   -> "S01E05"
 *   season unknown -> "05"
 *   episode unknown -> "" (nothing to show)
 */
class EpisodeKey
{
public:
    // Both halves unknown
    EpisodeKey();
    EpisodeKey(int season, int episode);

    static EpisodeKey episodeOnly(int episode);

    bool hasSeason() const { return m_season >= 0; }
    bool hasEpisode() const { return m_episode >= 0; }

    // Only meaningful when the matching has*() is true
    int season() const { return m_season; }
    int episode() const { return m_episode; }

    bool isEmpty() const { return !hasSeason() && !hasEpisode(); }

    QString toDisplayString() const;

    // Debug form, "S?E7" style, used in log lines
    QString toDebugString() const;

    bool operator==(const EpisodeKey& other) const;
    bool operator!=(const EpisodeKey& other) const;

private:
    int m_season;   // -1 = unknown
    int m_episode;  // -1 = unknown
};

#endif // EPISODEKEY_H
