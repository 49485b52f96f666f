#ifndef SUBTITLERESAMPLER_H
#define SUBTITLERESAMPLER_H

#include <QSize>
#include <QString>

class VideoProber;

/**
 * @brief Rescales an ASS script's geometry to another resolution
 *
 * Horizontal values follow targetWidth / PlayResX, vertical values follow
 * targetHeight / PlayResY; the two factors may differ.
 *
 * Styles:    Fontsize, Outline, Shadow, MarginV   by scaleY
 *            MarginL, MarginR, Spacing            by scaleX
 *            (margins rounded to whole pixels)
 * Overrides: \pos \move \org \clip/\iclip (rectangle form) \fs
 *
 * Lines that hold none of these are written back unchanged.
 */
class SubtitleResampler
{
public:
    struct Request {
        QSize sourceResolution;  // invalid = read PlayResX/PlayResY from the script
        QSize targetResolution;
        bool force;     // rewrite even when the resolutions already match
        bool disabled;  // never rewrite

        Request() : force(false), disabled(false) {}
    };

    /**
     * @brief Resample an .ass/.ssa file
     * @return Path of the resampled copy, or subtitlePath when nothing was written
     */
    static QString resample(const QString &subtitlePath, const Request &request);

    /**
     * @brief Resample to the resolution the prober reports for videoPath
     */
    static QString resampleForVideo(const QString &subtitlePath, const QString &videoPath,
                                    VideoProber &prober, bool force = false, bool disabled = false);

    /**
     * @brief Scale inline override tags of one event text
     */
    static QString scaleOverrideTags(const QString &text, double scaleX, double scaleY);

    /**
     * @brief Text level transform, exposed for tests
     * @param written Set to false when the request turned out to be a no-op
     */
    static bool resampleContent(const QString &content, const Request &request,
                                QString *resampled, bool *written, QString *error);
};

#endif // SUBTITLERESAMPLER_H
