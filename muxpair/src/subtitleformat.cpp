#include "subtitleformat.h"
#include <QFile>
#include <QFileInfo>
#include <QLocale>
#include <QRegularExpression>
#include <QStringDecoder>

namespace SubtitleFormat {

Type detect(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix == "ass" || suffix == "ssa") {
        return Type::Ass;
    }
    if (suffix == "srt") {
        return Type::Srt;
    }
    return Type::Unsupported;
}

qint64 parseAssTime(const QString &text)
{
    static const QRegularExpression timeRe(R"(^\s*(\d+):(\d{1,2}):(\d{1,2})(?:[.,](\d+))?\s*$)");
    QRegularExpressionMatch match = timeRe.match(text);
    if (!match.hasMatch()) {
        return -1;
    }

    const qint64 hours = match.captured(1).toLongLong();
    const qint64 minutes = match.captured(2).toLongLong();
    const qint64 seconds = match.captured(3).toLongLong();

    qint64 millis = 0;
    QString fraction = match.captured(4);
    if (!fraction.isEmpty()) {
        fraction = fraction.left(3);
        while (fraction.size() < 3) {
            fraction.append('0');
        }
        millis = fraction.toLongLong();
    }

    return ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
}

QString formatAssTime(qint64 ms)
{
    if (ms < 0) {
        ms = 0;
    }
    const qint64 hours = ms / 3600000;
    ms %= 3600000;
    const qint64 minutes = ms / 60000;
    ms %= 60000;
    const qint64 seconds = ms / 1000;
    const qint64 centis = (ms % 1000) / 10;

    return QString("%1:%2:%3.%4")
        .arg(hours)
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(centis, 2, 10, QChar('0'));
}

qint64 srtTimeToMs(int hours, int minutes, int seconds, int millis)
{
    return ((static_cast<qint64>(hours) * 60 + minutes) * 60 + seconds) * 1000 + millis;
}

QString formatSrtTime(qint64 ms)
{
    if (ms < 0) {
        ms = 0;
    }
    const qint64 hours = ms / 3600000;
    const qint64 minutes = (ms % 3600000) / 60000;
    const qint64 seconds = (ms % 60000) / 1000;
    const qint64 millis = ms % 1000;

    return QString("%1:%2:%3,%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

double parseDoubleOr(const QString &text, double fallback)
{
    bool ok = false;
    const double value = text.trimmed().toDouble(&ok);
    return ok ? value : fallback;
}

int parseIntOr(const QString &text, int fallback)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    return ok ? value : fallback;
}

QString formatNumber(double value)
{
    // Avoid "-0" for values that scaled down to nothing
    if (value == 0.0) {
        return "0";
    }
    // Fixed notation: ASS renderers do not read exponents inside override tags
    return QString::number(value, 'f', QLocale::FloatingPointShortest);
}

bool readTextFile(const QString &path, QString *content, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QString("Cannot open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    const QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        if (error) {
            *error = QString("Cannot read %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    // Strict decoding: a subtitle in another encoding must not come back with
    // U+FFFD in place of its text
    QStringDecoder decoder(QStringConverter::Utf8, QStringConverter::Flag::ConvertInitialBom);
    const QString text = decoder.decode(bytes);
    if (decoder.hasError()) {
        if (error) {
            *error = QString("%1 is not valid UTF-8").arg(path);
        }
        return false;
    }

    if (content) {
        *content = text;
    }
    return true;
}

bool writeNewTextFile(const QString &path, const QString &content, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        if (error) {
            *error = QString("Cannot create %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    const QByteArray bytes = content.toUtf8();
    const qint64 written = file.write(bytes);
    const bool flushed = file.flush();
    file.close();

    if (written != bytes.size() || !flushed) {
        if (error) {
            *error = QString("Cannot write %1: %2").arg(path, file.errorString());
        }
        QFile::remove(path);
        return false;
    }
    return true;
}

} // namespace SubtitleFormat
