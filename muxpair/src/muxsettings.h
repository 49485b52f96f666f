#ifndef MUXSETTINGS_H
#define MUXSETTINGS_H

#include <QString>
#include <QSqlDatabase>

/**
 * @brief Typed settings for matching and subtitle preparation
 *
 * Values live in the caller's database, in a `settings` table of
 * name/value rows. Without a usable database the defaults apply and
 * nothing is persisted.
 */
class MuxSettings
{
public:
    /**
     * @brief Automatic pairing behaviour
     */
    struct MatchSettings {
        double confidenceThreshold;   // results below it are flagged for review
        bool strictMatching;          // drop pairs scoring below 0.9

        MatchSettings() : confidenceThreshold(0.7), strictMatching(false) {}
    };

    /**
     * @brief Subtitle transforms
     */
    struct ProcessingSettings {
        int shiftFrames;
        bool forceResample;
        bool noResample;

        ProcessingSettings() : shiftFrames(0), forceResample(false), noResample(false) {}
    };

    /**
     * @brief Naming handed to the muxer
     */
    struct OutputSettings {
        QString releaseTag;
        QString outputDirectory;     // empty = next to the video
        QString subtitleLanguage;    // empty = taken from the subtitle name
        QString videoTrackName;
        QString subtitleTrackName;

        OutputSettings() : releaseTag("MySubs") {}
    };

    explicit MuxSettings(QSqlDatabase database = QSqlDatabase());

    MuxSettings(const MuxSettings&) = delete;
    MuxSettings& operator=(const MuxSettings&) = delete;

    /**
     * @brief Read all settings, creating the table when missing
     */
    void load();

    /**
     * @brief Write all settings
     */
    void save();

    // === Matching ===

    const MatchSettings& matching() const { return m_matching; }

    double getConfidenceThreshold() const { return m_matching.confidenceThreshold; }
    // Clamped to [0, 1]
    void setConfidenceThreshold(double threshold);

    bool getStrictMatching() const { return m_matching.strictMatching; }
    void setStrictMatching(bool strict);

    // === Processing ===

    const ProcessingSettings& processing() const { return m_processing; }

    int getShiftFrames() const { return m_processing.shiftFrames; }
    void setShiftFrames(int frames);

    bool getForceResample() const { return m_processing.forceResample; }
    void setForceResample(bool force);

    bool getNoResample() const { return m_processing.noResample; }
    void setNoResample(bool disabled);

    // === Output ===

    const OutputSettings& output() const { return m_output; }

    QString getReleaseTag() const { return m_output.releaseTag; }
    void setReleaseTag(const QString& tag);

    QString getOutputDirectory() const { return m_output.outputDirectory; }
    void setOutputDirectory(const QString& directory);

    QString getSubtitleLanguage() const { return m_output.subtitleLanguage; }
    void setSubtitleLanguage(const QString& language);

    QString getVideoTrackName() const { return m_output.videoTrackName; }
    void setVideoTrackName(const QString& name);

    QString getSubtitleTrackName() const { return m_output.subtitleTrackName; }
    void setSubtitleTrackName(const QString& name);

private:
    bool databaseUsable() const;
    bool ensureTable();
    void saveSetting(const QString& name, const QString& value);

    QSqlDatabase m_database;
    MatchSettings m_matching;
    ProcessingSettings m_processing;
    OutputSettings m_output;
};

#endif // MUXSETTINGS_H
