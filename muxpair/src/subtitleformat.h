#ifndef SUBTITLEFORMAT_H
#define SUBTITLEFORMAT_H

#include <QString>

/**
 * Format detection, timestamp codecs and text file I/O shared by the
 * subtitle transforms
 */
namespace SubtitleFormat {

enum class Type {
    Ass,         // .ass and .ssa
    Srt,
    Unsupported  // passed through untouched
};

Type detect(const QString &path);

// Frame rate used when a subtitle carries no usable timing metadata
constexpr double kDefaultFps = 23.976;

/**
 * "H:MM:SS.cc" -> milliseconds. The fraction is read as a decimal fraction
 * of a second, so ".5", ".50" and ".500" are all 500 ms.
 * Returns -1 when the text is not a timestamp.
 */
qint64 parseAssTime(const QString &text);

// Milliseconds -> "H:MM:SS.cc" (centiseconds truncated)
QString formatAssTime(qint64 ms);

// "HH:MM:SS,mmm" fields -> milliseconds
qint64 srtTimeToMs(int hours, int minutes, int seconds, int millis);

// Milliseconds -> "HH:MM:SS,mmm"
QString formatSrtTime(qint64 ms);

/**
 * Parse a floating point value, returning fallback when text is empty or
 * not a number
 */
double parseDoubleOr(const QString &text, double fallback);

/**
 * Parse an integer value, returning fallback when text is empty or not an
 * integer
 */
int parseIntOr(const QString &text, int fallback);

/**
 * Shortest text that reads back as the same double ("30", "1.5", "0.1"),
 * always in fixed notation (never "1e-05")
 */
QString formatNumber(double value);

/**
 * Read a whole UTF-8 text file. A byte order mark is kept as the first
 * character so that writing the text back reproduces the file. Returns
 * false when the bytes are not valid UTF-8.
 */
bool readTextFile(const QString &path, QString *content, QString *error);

/**
 * Write UTF-8 text to a file that must not exist yet. A partially written
 * file is removed before returning false.
 */
bool writeNewTextFile(const QString &path, const QString &content, QString *error);

} // namespace SubtitleFormat

#endif // SUBTITLEFORMAT_H
