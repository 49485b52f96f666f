#include "subtitlepreparer.h"
#include "filenameparser.h"
#include "logger.h"
#include "muxsettings.h"
#include "subtitleresampler.h"
#include "timingshifter.h"
#include "videoprober.h"
#include <QFileInfo>

SubtitlePreparer::Options SubtitlePreparer::Options::fromSettings(const MuxSettings &settings)
{
    Options options;
    options.shiftFrames = settings.getShiftFrames();
    options.forceResample = settings.getForceResample();
    options.noResample = settings.getNoResample();
    options.subtitleLanguage = settings.getSubtitleLanguage();
    return options;
}

SubtitlePreparer::SubtitlePreparer(VideoProber &prober)
    : m_prober(prober)
{
}

SubtitlePreparer::PreparedSubtitle SubtitlePreparer::prepare(const MatchResult &match,
                                                             const Options &options) const
{
    PreparedSubtitle prepared;
    prepared.videoPath = match.videoPath();

    if (!match.hasSubtitle()) {
        LOG(QString("[Prepare] No subtitle for %1, skipping").arg(QFileInfo(match.videoPath()).fileName()));
        return prepared;
    }

    prepared.originalSubtitlePath = match.subtitlePath();
    QString current = match.subtitlePath();

    if (options.shiftFrames != 0) {
        LOG(QString("[Prepare] Shifting subtitles by %1 frames").arg(options.shiftFrames));
        const QString shifted = TimingShifter::shiftTiming(current, options.shiftFrames);
        prepared.shifted = (shifted != current);
        current = shifted;
    }

    const QString resampled = SubtitleResampler::resampleForVideo(current, match.videoPath(), m_prober,
                                                                  options.forceResample, options.noResample);
    prepared.resampled = (resampled != current);
    current = resampled;

    prepared.subtitlePath = current;

    // Temporary copies carry a random suffix, so the language comes from the original name
    prepared.language = options.subtitleLanguage.isEmpty()
        ? FilenameParser::extractLanguageCode(QFileInfo(prepared.originalSubtitlePath).fileName())
        : options.subtitleLanguage;

    return prepared;
}
