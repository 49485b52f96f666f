#include "muxsettings.h"
#include "logger.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>

MuxSettings::MuxSettings(QSqlDatabase database)
    : m_database(database)
{
    // Defaults until load() is called
}

bool MuxSettings::databaseUsable() const
{
    return m_database.isValid() && m_database.isOpen();
}

bool MuxSettings::ensureTable()
{
    QSqlQuery query(m_database);
    if (!query.exec("CREATE TABLE IF NOT EXISTS `settings`(`name` TEXT PRIMARY KEY, `value` TEXT)")) {
        LOG_ERROR(QString("[Settings] Cannot create settings table: %1").arg(query.lastError().text()));
        return false;
    }
    return true;
}

void MuxSettings::load()
{
    if (!databaseUsable()) {
        LOG("[Settings] Database not available, using defaults");
        return;
    }
    if (!ensureTable()) {
        return;
    }

    QSqlQuery query(m_database);
    if (!query.exec("SELECT `name`, `value` FROM `settings`")) {
        LOG_ERROR(QString("[Settings] Cannot read settings: %1").arg(query.lastError().text()));
        return;
    }

    while (query.next()) {
        QString name = query.value(0).toString();
        QString value = query.value(1).toString();

        // Matching
        if (name == "confidenceThreshold") {
            bool ok = false;
            double threshold = value.toDouble(&ok);
            if (ok) {
                m_matching.confidenceThreshold = qBound(0.0, threshold, 1.0);
            } else {
                LOG_WARN(QString("[Settings] Ignoring invalid confidenceThreshold '%1'").arg(value));
            }
        }
        else if (name == "strictMatching") {
            m_matching.strictMatching = (value == "1");
        }
        // Processing
        else if (name == "shiftFrames") {
            bool ok = false;
            int frames = value.toInt(&ok);
            if (ok) {
                m_processing.shiftFrames = frames;
            } else {
                LOG_WARN(QString("[Settings] Ignoring invalid shiftFrames '%1'").arg(value));
            }
        }
        else if (name == "forceResample") {
            m_processing.forceResample = (value == "1");
        }
        else if (name == "noResample") {
            m_processing.noResample = (value == "1");
        }
        // Output
        else if (name == "releaseTag") {
            m_output.releaseTag = value;
        }
        else if (name == "outputDirectory") {
            m_output.outputDirectory = value;
        }
        else if (name == "subtitleLanguage") {
            m_output.subtitleLanguage = value;
        }
        else if (name == "videoTrackName") {
            m_output.videoTrackName = value;
        }
        else if (name == "subtitleTrackName") {
            m_output.subtitleTrackName = value;
        }
    }
}

void MuxSettings::save()
{
    if (!databaseUsable()) {
        LOG("[Settings] Database not available, cannot save settings");
        return;
    }
    if (!ensureTable()) {
        return;
    }

    LOG("[Settings] Saving settings to database");

    saveSetting("confidenceThreshold", QString::number(m_matching.confidenceThreshold));
    saveSetting("strictMatching", m_matching.strictMatching ? "1" : "0");

    saveSetting("shiftFrames", QString::number(m_processing.shiftFrames));
    saveSetting("forceResample", m_processing.forceResample ? "1" : "0");
    saveSetting("noResample", m_processing.noResample ? "1" : "0");

    saveSetting("releaseTag", m_output.releaseTag);
    saveSetting("outputDirectory", m_output.outputDirectory);
    saveSetting("subtitleLanguage", m_output.subtitleLanguage);
    saveSetting("videoTrackName", m_output.videoTrackName);
    saveSetting("subtitleTrackName", m_output.subtitleTrackName);
}

void MuxSettings::saveSetting(const QString& name, const QString& value)
{
    if (!databaseUsable() || !ensureTable()) {
        return;
    }

    QSqlQuery query(m_database);
    query.prepare("INSERT OR REPLACE INTO `settings`(`name`, `value`) VALUES (?, ?)");
    query.addBindValue(name);
    query.addBindValue(value);

    if (!query.exec()) {
        LOG_ERROR(QString("[Settings] Failed to save setting %1: %2")
                      .arg(name, query.lastError().text()));
    }
}

// === Setters with auto-save ===

void MuxSettings::setConfidenceThreshold(double threshold)
{
    m_matching.confidenceThreshold = qBound(0.0, threshold, 1.0);
    saveSetting("confidenceThreshold", QString::number(m_matching.confidenceThreshold));
}

void MuxSettings::setStrictMatching(bool strict)
{
    m_matching.strictMatching = strict;
    saveSetting("strictMatching", strict ? "1" : "0");
}

void MuxSettings::setShiftFrames(int frames)
{
    m_processing.shiftFrames = frames;
    saveSetting("shiftFrames", QString::number(frames));
}

void MuxSettings::setForceResample(bool force)
{
    m_processing.forceResample = force;
    saveSetting("forceResample", force ? "1" : "0");
}

void MuxSettings::setNoResample(bool disabled)
{
    m_processing.noResample = disabled;
    saveSetting("noResample", disabled ? "1" : "0");
}

void MuxSettings::setReleaseTag(const QString& tag)
{
    m_output.releaseTag = tag;
    saveSetting("releaseTag", tag);
}

void MuxSettings::setOutputDirectory(const QString& directory)
{
    m_output.outputDirectory = directory;
    saveSetting("outputDirectory", directory);
}

void MuxSettings::setSubtitleLanguage(const QString& language)
{
    m_output.subtitleLanguage = language;
    saveSetting("subtitleLanguage", language);
}

void MuxSettings::setVideoTrackName(const QString& name)
{
    m_output.videoTrackName = name;
    saveSetting("videoTrackName", name);
}

void MuxSettings::setSubtitleTrackName(const QString& name)
{
    m_output.subtitleTrackName = name;
    saveSetting("subtitleTrackName", name);
}
