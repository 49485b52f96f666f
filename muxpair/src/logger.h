#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>

/**
 * Unified logging sink for muxpair
 *
 * Every component (parser, matcher, transforms, settings) reports through
 * this class. A message is:
 * - Written to the console (qDebug for info, qWarning for warnings/errors)
 * - Emitted through logMessage() so a front end can show it
 *
 * Messages carry a component tag by convention, e.g. "[Shift] ...".
 *
 * Usage:
 *   LOG("Matched 12 videos");
 *   LOG_WARN(QString("Subtitle format %1 cannot be shifted").arg(suffix));
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    enum Severity {
        Info,
        Warning,
        Error
    };
    Q_ENUM(Severity)

    /**
     * Log a message with its origin
     *
     * @param msg The message to log
     * @param file Source file name, normally __FILE__ (only the base name is kept)
     * @param line Source line number, normally __LINE__
     * @param severity Info by default
     *
     * An empty file or a non-positive line logs the bare message.
     */
    static void log(const QString &msg, const QString &file, int line, Severity severity = Info);

    static Logger* instance();

    static QString severityName(Severity severity);

signals:
    /**
     * Emitted for every logged message, already formatted as
     * "[file:line] message" (warnings and errors carry a level prefix)
     */
    void logMessage(QString message);

    void logMessageWithSeverity(QString message, Logger::Severity severity);

private:
    Logger();
};

#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)
#define LOG_WARN(msg) Logger::log(msg, __FILE__, __LINE__, Logger::Warning)
#define LOG_ERROR(msg) Logger::log(msg, __FILE__, __LINE__, Logger::Error)

#endif // LOGGER_H
