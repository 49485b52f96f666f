#include "subtitleresampler.h"
#include "assscript.h"
#include "logger.h"
#include "subtitleformat.h"
#include "tempworkspace.h"
#include "videoprober.h"
#include <QFileInfo>
#include <QRegularExpression>
#include <cmath>
#include <functional>

namespace {

// A tag argument: optional sign, digits with an optional fraction
#define TAG_NUMBER R"(\s*([-+]?(?:\d+(?:\.\d*)?|\.\d+))\s*)"

QString replaceMatches(const QString &text, const QRegularExpression &re,
                       const std::function<QString(const QRegularExpressionMatch &)> &replacement)
{
    QString result;
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = re.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        result.append(text.mid(last, match.capturedStart() - last));
        result.append(replacement(match));
        last = match.capturedEnd();
    }
    result.append(text.mid(last));
    return result;
}

QString scaled(const QString &number, double factor)
{
    return SubtitleFormat::formatNumber(number.toDouble() * factor);
}

// Style fields and the axis that scales them
struct StyleField {
    const char *key;
    bool horizontal;
    bool roundToInt;
};

const StyleField kStyleFields[] = {
    { "fontsize", false, false },
    { "outline",  false, false },
    { "shadow",   false, false },
    { "marginl",  true,  true  },
    { "marginr",  true,  true  },
    { "marginv",  false, true  },
    { "spacing",  true,  false },
};

} // namespace

QString SubtitleResampler::scaleOverrideTags(const QString &text, double scaleX, double scaleY)
{
    // Override tags only live inside {...} blocks
    if (!text.contains('\\')) {
        return text;
    }

    static const QRegularExpression posRe(R"(\\pos\()" TAG_NUMBER "," TAG_NUMBER R"(\))");
    static const QRegularExpression orgRe(R"(\\org\()" TAG_NUMBER "," TAG_NUMBER R"(\))");
    static const QRegularExpression moveRe(
        R"(\\move\()" TAG_NUMBER "," TAG_NUMBER "," TAG_NUMBER "," TAG_NUMBER R"(((?:,[^,()]*,[^,()]*)?)\))");
    static const QRegularExpression clipRe(
        R"(\\(i?clip)\()" TAG_NUMBER "," TAG_NUMBER "," TAG_NUMBER "," TAG_NUMBER R"(\))");
    static const QRegularExpression fontSizeRe(R"(\\fs(\d+(?:\.\d*)?|\.\d+))");

    QString result = text;

    result = replaceMatches(result, posRe, [&](const QRegularExpressionMatch &m) {
        return QString("\\pos(%1,%2)").arg(scaled(m.captured(1), scaleX), scaled(m.captured(2), scaleY));
    });

    result = replaceMatches(result, moveRe, [&](const QRegularExpressionMatch &m) {
        // Optional t1,t2 are times and stay as written
        return QString("\\move(%1,%2,%3,%4%5)")
            .arg(scaled(m.captured(1), scaleX), scaled(m.captured(2), scaleY),
                 scaled(m.captured(3), scaleX), scaled(m.captured(4), scaleY),
                 m.captured(5));
    });

    result = replaceMatches(result, orgRe, [&](const QRegularExpressionMatch &m) {
        return QString("\\org(%1,%2)").arg(scaled(m.captured(1), scaleX), scaled(m.captured(2), scaleY));
    });

    result = replaceMatches(result, clipRe, [&](const QRegularExpressionMatch &m) {
        return QString("\\%1(%2,%3,%4,%5)")
            .arg(m.captured(1),
                 scaled(m.captured(2), scaleX), scaled(m.captured(3), scaleY),
                 scaled(m.captured(4), scaleX), scaled(m.captured(5), scaleY));
    });

    result = replaceMatches(result, fontSizeRe, [&](const QRegularExpressionMatch &m) {
        return QString("\\fs%1").arg(scaled(m.captured(1), scaleY));
    });

    return result;
}

#undef TAG_NUMBER

bool SubtitleResampler::resampleContent(const QString &content, const Request &request,
                                        QString *resampled, bool *written, QString *error)
{
    if (written) {
        *written = false;
    }

    if (request.disabled) {
        return true;
    }

    if (!request.targetResolution.isValid() || request.targetResolution.isEmpty()) {
        if (error) {
            *error = "Target resolution is unknown";
        }
        return true;
    }

    AssScript script;
    if (!AssScript::parse(content, &script, error)) {
        return false;
    }

    QSize source = request.sourceResolution;
    if (!source.isValid() || source.isEmpty()) {
        source = QSize(script.info().width(), script.info().height());
    }
    const QSize target = request.targetResolution;

    if (!request.force && source == target) {
        return true;
    }

    const double scaleX = static_cast<double>(target.width()) / source.width();
    const double scaleY = static_cast<double>(target.height()) / source.height();

    AssScript::Patch patch;

    // Script resolution
    const AssScript::ScriptInfo &info = script.info();
    const QString widthText = QString::number(target.width());
    const QString heightText = QString::number(target.height());
    QStringList missingInfo;
    if (info.playResXLine >= 0) {
        patch.insert(info.playResXLine, script.infoLineWithValue(info.playResXLine, widthText));
    } else {
        missingInfo << QString("PlayResX: %1").arg(widthText);
    }
    if (info.playResYLine >= 0) {
        patch.insert(info.playResYLine, script.infoLineWithValue(info.playResYLine, heightText));
    } else {
        missingInfo << QString("PlayResY: %1").arg(heightText);
    }
    if (!missingInfo.isEmpty() && info.headerLine >= 0) {
        const QString newline = script.hasCarriageReturn(info.headerLine) ? "\r\n" : "\n";
        patch.insert(info.headerLine, script.line(info.headerLine) + newline + missingInfo.join(newline));
    }

    // Styles
    for (const AssScript::Record &style : script.styles()) {
        QMap<QString, QString> values;
        for (const StyleField &field : kStyleFields) {
            if (style.indexOf(field.key) < 0) {
                continue;
            }
            bool ok = false;
            const double original = style.value(field.key).trimmed().toDouble(&ok);
            if (!ok) {
                if (error) {
                    *error = QString("Style on line %1 has a non-numeric %2")
                                 .arg(style.line + 1).arg(QString::fromLatin1(field.key));
                }
                return false;
            }
            const double value = original * (field.horizontal ? scaleX : scaleY);
            values.insert(field.key, field.roundToInt ? QString::number(qRound(value))
                                                      : SubtitleFormat::formatNumber(value));
        }
        if (!values.isEmpty()) {
            patch.insert(style.line, style.withValues(values));
        }
    }

    // Event overrides
    for (const AssScript::Record &event : script.events()) {
        const QString text = event.value("text");
        const QString scaledText = scaleOverrideTags(text, scaleX, scaleY);
        if (scaledText != text) {
            QMap<QString, QString> values;
            values.insert("text", scaledText);
            patch.insert(event.line, event.withValues(values));
        }
    }

    if (resampled) {
        *resampled = script.serialize(patch);
    }
    if (written) {
        *written = true;
    }
    return true;
}

QString SubtitleResampler::resample(const QString &subtitlePath, const Request &request)
{
    if (SubtitleFormat::detect(subtitlePath) != SubtitleFormat::Type::Ass || request.disabled) {
        return subtitlePath;
    }

    QString content;
    QString error;
    if (!SubtitleFormat::readTextFile(subtitlePath, &content, &error)) {
        LOG_ERROR(QString("[Resample] %1").arg(error));
        return subtitlePath;
    }

    QString resampled;
    bool written = false;
    if (!resampleContent(content, request, &resampled, &written, &error)) {
        LOG_ERROR(QString("[Resample] Error while resampling %1: %2").arg(subtitlePath, error));
        return subtitlePath;
    }
    if (!written) {
        if (!error.isEmpty()) {
            LOG_WARN(QString("[Resample] Skipping %1: %2").arg(subtitlePath, error));
        } else {
            LOG(QString("[Resample] Subtitle resolution already matches %1x%2 - skipping resample")
                    .arg(request.targetResolution.width()).arg(request.targetResolution.height()));
        }
        return subtitlePath;
    }

    const QString outputPath = TempWorkspace::instance()->createOutputPath(subtitlePath, "resampled");
    if (outputPath.isEmpty()) {
        LOG_ERROR(QString("[Resample] No temporary directory available, using original %1").arg(subtitlePath));
        return subtitlePath;
    }

    if (!SubtitleFormat::writeNewTextFile(outputPath, resampled, &error)) {
        LOG_ERROR(QString("[Resample] %1").arg(error));
        return subtitlePath;
    }

    LOG(QString("[Resample] Resampled %1 to %2x%3")
            .arg(QFileInfo(subtitlePath).fileName())
            .arg(request.targetResolution.width()).arg(request.targetResolution.height()));
    return outputPath;
}

QString SubtitleResampler::resampleForVideo(const QString &subtitlePath, const QString &videoPath,
                                            VideoProber &prober, bool force, bool disabled)
{
    if (SubtitleFormat::detect(subtitlePath) != SubtitleFormat::Type::Ass || disabled) {
        return subtitlePath;
    }

    const VideoInfo video = prober.probe(videoPath);
    if (!video.isValid()) {
        LOG_WARN(QString("[Resample] Could not get resolution for %1, skipping subtitle resample").arg(videoPath));
        return subtitlePath;
    }

    Request request;
    request.targetResolution = QSize(video.width, video.height);
    request.force = force;
    request.disabled = disabled;
    return resample(subtitlePath, request);
}
