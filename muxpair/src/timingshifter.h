#ifndef TIMINGSHIFTER_H
#define TIMINGSHIFTER_H

#include <QString>

/**
 * @brief Moves every subtitle event by a number of video frames
 *
 * ASS/SSA use the script's Timer value as the frame rate when it is set,
 * SRT always uses 23.976. Each start and end time is shifted on its own and
 * clamped at zero.
 *
 * The input file is never modified. The shifted copy goes to the
 * TempWorkspace; on any failure the input path is returned unchanged.
 */
class TimingShifter
{
public:
    struct Request {
        int frames;
        double fps;

        Request() : frames(0), fps(23.976) {}
        Request(int f, double rate) : frames(f), fps(rate) {}

        // round(frames * 1000 / fps)
        qint64 shiftMs() const;
    };

    /**
     * @brief Shift a subtitle file
     * @param subtitlePath .ass, .ssa or .srt file; other formats pass through
     * @param frames Signed frame offset, 0 returns subtitlePath untouched
     * @return Path of the shifted copy, or subtitlePath when nothing was written
     */
    static QString shiftTiming(const QString &subtitlePath, int frames);

    // Text level transforms, exposed for tests
    static bool shiftAssContent(const QString &content, int frames, QString *shifted,
                                Request *used, QString *error);
    static QString shiftSrtContent(const QString &content, const Request &request);
};

#endif // TIMINGSHIFTER_H
