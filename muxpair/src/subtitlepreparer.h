#ifndef SUBTITLEPREPARER_H
#define SUBTITLEPREPARER_H

#include <QString>
#include "matchresult.h"

class MuxSettings;
class VideoProber;

/**
 * @brief Gets a matched subtitle ready for the muxer
 *
 * Runs the timing shift and then the resample for one MatchResult. Each
 * step falls back to its input on failure, so the worst outcome is the
 * original subtitle file.
 */
class SubtitlePreparer
{
public:
    struct Options {
        int shiftFrames;
        bool forceResample;
        bool noResample;
        QString subtitleLanguage;  // empty = read from the subtitle file name

        Options() : shiftFrames(0), forceResample(false), noResample(false) {}

        static Options fromSettings(const MuxSettings &settings);
    };

    struct PreparedSubtitle {
        QString videoPath;
        QString originalSubtitlePath;
        QString subtitlePath;  // what the muxer should use
        QString language;      // may be empty
        bool shifted;
        bool resampled;

        PreparedSubtitle() : shifted(false), resampled(false) {}

        bool isValid() const { return !subtitlePath.isEmpty(); }
    };

    explicit SubtitlePreparer(VideoProber &prober);

    /**
     * @brief Shift and resample the subtitle of one match
     * @return Invalid PreparedSubtitle when the match has no subtitle
     */
    PreparedSubtitle prepare(const MatchResult &match, const Options &options) const;

private:
    VideoProber &m_prober;
};

#endif // SUBTITLEPREPARER_H
