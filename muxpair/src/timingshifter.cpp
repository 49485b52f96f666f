#include "timingshifter.h"
#include "assscript.h"
#include "logger.h"
#include "subtitleformat.h"
#include "tempworkspace.h"
#include <QFileInfo>
#include <QRegularExpression>
#include <QtMath>

qint64 TimingShifter::Request::shiftMs() const
{
    const double rate = fps > 0.0 ? fps : SubtitleFormat::kDefaultFps;
    return qRound64(frames * 1000.0 / rate);
}

bool TimingShifter::shiftAssContent(const QString &content, int frames, QString *shifted,
                                    Request *used, QString *error)
{
    AssScript script;
    if (!AssScript::parse(content, &script, error)) {
        return false;
    }

    const Request request(frames, script.info().fps(SubtitleFormat::kDefaultFps));
    const qint64 shiftMs = request.shiftMs();

    AssScript::Patch patch;
    for (const AssScript::Record &event : script.events()) {
        const qint64 start = SubtitleFormat::parseAssTime(event.value("start"));
        const qint64 end = SubtitleFormat::parseAssTime(event.value("end"));
        if (start < 0 || end < 0) {
            if (error) {
                *error = QString("Bad timestamp on line %1").arg(event.line + 1);
            }
            return false;
        }

        QMap<QString, QString> times;
        times.insert("start", SubtitleFormat::formatAssTime(qMax<qint64>(0, start + shiftMs)));
        times.insert("end", SubtitleFormat::formatAssTime(qMax<qint64>(0, end + shiftMs)));
        patch.insert(event.line, event.withValues(times));
    }

    if (shifted) {
        *shifted = script.serialize(patch);
    }
    if (used) {
        *used = request;
    }
    return true;
}

QString TimingShifter::shiftSrtContent(const QString &content, const Request &request)
{
    static const QRegularExpression cueTimes(
        R"((\d{2}):(\d{2}):(\d{2}),(\d{3})\s-->\s(\d{2}):(\d{2}):(\d{2}),(\d{3}))");

    const qint64 shiftMs = request.shiftMs();

    QString result;
    result.reserve(content.size());
    qsizetype last = 0;

    QRegularExpressionMatchIterator it = cueTimes.globalMatch(content);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        result.append(content.mid(last, match.capturedStart() - last));

        const qint64 start = SubtitleFormat::srtTimeToMs(match.captured(1).toInt(), match.captured(2).toInt(),
                                                         match.captured(3).toInt(), match.captured(4).toInt());
        const qint64 end = SubtitleFormat::srtTimeToMs(match.captured(5).toInt(), match.captured(6).toInt(),
                                                       match.captured(7).toInt(), match.captured(8).toInt());

        result.append(QString("%1 --> %2")
                          .arg(SubtitleFormat::formatSrtTime(qMax<qint64>(0, start + shiftMs)),
                               SubtitleFormat::formatSrtTime(qMax<qint64>(0, end + shiftMs))));
        last = match.capturedEnd();
    }
    result.append(content.mid(last));
    return result;
}

QString TimingShifter::shiftTiming(const QString &subtitlePath, int frames)
{
    if (frames == 0) {
        return subtitlePath;
    }

    const SubtitleFormat::Type type = SubtitleFormat::detect(subtitlePath);
    if (type == SubtitleFormat::Type::Unsupported) {
        LOG_WARN(QString("[Shift] Subtitle format .%1 doesn't support shifting, using original")
                     .arg(QFileInfo(subtitlePath).suffix()));
        return subtitlePath;
    }

    QString content;
    QString error;
    if (!SubtitleFormat::readTextFile(subtitlePath, &content, &error)) {
        LOG_ERROR(QString("[Shift] %1").arg(error));
        return subtitlePath;
    }

    QString shifted;
    Request used;
    if (type == SubtitleFormat::Type::Ass) {
        if (!shiftAssContent(content, frames, &shifted, &used, &error)) {
            LOG_ERROR(QString("[Shift] Error shifting ASS subtitle %1: %2").arg(subtitlePath, error));
            return subtitlePath;
        }
    } else {
        used = Request(frames, SubtitleFormat::kDefaultFps);
        shifted = shiftSrtContent(content, used);
    }

    const QString outputPath = TempWorkspace::instance()->createOutputPath(subtitlePath, "shifted");
    if (outputPath.isEmpty()) {
        LOG_ERROR(QString("[Shift] No temporary directory available, using original %1").arg(subtitlePath));
        return subtitlePath;
    }

    if (!SubtitleFormat::writeNewTextFile(outputPath, shifted, &error)) {
        LOG_ERROR(QString("[Shift] %1").arg(error));
        return subtitlePath;
    }

    LOG(QString("[Shift] Shifted subtitle by %1 frames (%2ms at %3fps)")
            .arg(frames).arg(used.shiftMs()).arg(used.fps, 0, 'f', 3));
    return outputPath;
}
