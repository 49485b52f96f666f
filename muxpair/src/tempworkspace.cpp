#include "tempworkspace.h"
#include "logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QUuid>

static TempWorkspace* s_instance = nullptr;
static QMutex s_instanceMutex;

TempWorkspace::TempWorkspace()
    : m_baseDirectory(QDir::tempPath())
{
}

TempWorkspace* TempWorkspace::instance()
{
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new TempWorkspace();
        }
    }
    return s_instance;
}

void TempWorkspace::setBaseDirectory(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_baseDirectory = path;
    m_directory.clear();
}

QString TempWorkspace::directory()
{
    QMutexLocker locker(&m_mutex);
    if (!m_directory.isEmpty() && QFileInfo(m_directory).isDir()) {
        return m_directory;
    }

    const QString path = QDir(m_baseDirectory).filePath(
        QString("muxpair-%1").arg(QCoreApplication::applicationPid()));
    if (!QDir().mkpath(path)) {
        LOG_ERROR(QString("[TempWorkspace] Cannot create %1").arg(path));
        return QString();
    }

    m_directory = path;
    return m_directory;
}

QString TempWorkspace::createOutputPath(const QString &sourcePath, const QString &tag)
{
    const QString dir = directory();
    if (dir.isEmpty()) {
        return QString();
    }

    QFileInfo source(sourcePath);
    QString name = QString("%1_%2_%3").arg(source.completeBaseName(), tag, randomToken());
    if (!source.suffix().isEmpty()) {
        name += "." + source.suffix();
    }
    return QDir(dir).filePath(name);
}

bool TempWorkspace::cleanup()
{
    QMutexLocker locker(&m_mutex);
    if (m_directory.isEmpty()) {
        return true;
    }

    const bool removed = QDir(m_directory).removeRecursively();
    if (!removed) {
        LOG_WARN(QString("[TempWorkspace] Could not fully remove %1").arg(m_directory));
    }
    m_directory.clear();
    return removed;
}

QString TempWorkspace::randomToken()
{
    return QUuid::createUuid().toString(QUuid::Id128).left(8);
}
