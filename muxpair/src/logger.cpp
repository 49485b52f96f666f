#include "logger.h"
#include <QDebug>
#include <QMutex>

// Lives for the whole process, never deleted
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;

Logger::Logger() : QObject(nullptr)
{
}

Logger* Logger::instance()
{
    // Double-checked locking; QMutex provides the memory barriers
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

QString Logger::severityName(Severity severity)
{
    switch (severity)
    {
        case Warning:
            return "WARNING";
        case Error:
            return "ERROR";
        case Info:
        default:
            return "INFO";
    }
}

void Logger::log(const QString &msg, const QString &file, int line, Severity severity)
{
    QString body = msg;
    if (severity != Info)
    {
        body = QString("%1: %2").arg(severityName(severity), msg);
    }

    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        // Keep only the file name, __FILE__ may carry a full path
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }

        fullMessage = QString("[%1:%2] %3").arg(filename).arg(line).arg(body);
    }
    else
    {
        fullMessage = body;
    }

    if (severity == Info)
    {
        qDebug().noquote() << fullMessage;
    }
    else
    {
        qWarning().noquote() << fullMessage;
    }

    Logger *logger = instance();
    emit logger->logMessage(fullMessage);
    emit logger->logMessageWithSeverity(fullMessage, severity);
}
