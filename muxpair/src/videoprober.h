#ifndef VIDEOPROBER_H
#define VIDEOPROBER_H

#include <QString>

/**
 * @brief Stream properties of a video file
 */
struct VideoInfo {
    int width;
    int height;
    double fps;

    VideoInfo() : width(0), height(0), fps(0.0) {}
    VideoInfo(int w, int h, double rate) : width(w), height(h), fps(rate) {}

    bool isValid() const { return width > 0 && height > 0; }
};

/**
 * @brief Access to an external media prober (ffprobe, mkvinfo, ...)
 *
 * Implementations run outside the core. An unknown property is reported as
 * zero and makes the dependent transform a no-op.
 */
class VideoProber
{
public:
    virtual ~VideoProber() = default;

    virtual VideoInfo probe(const QString &videoPath) = 0;
};

#endif // VIDEOPROBER_H
