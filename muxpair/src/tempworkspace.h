#ifndef TEMPWORKSPACE_H
#define TEMPWORKSPACE_H

#include <QMutex>
#include <QString>

/**
 * @brief Process-wide directory for transformed subtitle files
 *
 * The directory is created on first use. Output names carry a random token
 * so concurrent transforms never pick the same file. Removing the directory
 * is left to the caller, once every transform has finished.
 */
class TempWorkspace
{
public:
    static TempWorkspace* instance();

    /**
     * @brief Use another parent directory (tests, user configuration)
     *
     * Takes effect for the next directory() call; files already created stay
     * where they are.
     */
    void setBaseDirectory(const QString &path);

    /**
     * @brief Workspace directory, created if needed
     * @return Empty string when the directory cannot be created
     */
    QString directory();

    /**
     * @brief Fresh path "<dir>/<stem>_<tag>_<token>.<ext>" for a transform output
     * @return Empty string when the workspace is unavailable
     */
    QString createOutputPath(const QString &sourcePath, const QString &tag);

    /**
     * @brief Remove the workspace directory and everything in it
     */
    bool cleanup();

    // 8 hex characters from a random UUID
    static QString randomToken();

private:
    TempWorkspace();

    QMutex m_mutex;
    QString m_baseDirectory;
    QString m_directory;  // empty until created
};

#endif // TEMPWORKSPACE_H
