#ifndef ASSSCRIPT_H
#define ASSSCRIPT_H

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

/**
 * @brief Read-only view of an ASS/SSA script
 *
 * The script keeps its original lines. Transforms never edit it in place:
 * they build a Patch (line index -> replacement line) and call serialize()
 * once, so every line they did not touch is written back byte for byte.
 *
 * Only what the transforms need is interpreted:
 *   [Script Info]      PlayResX, PlayResY, Timer
 *   [V4+ Styles]       Format + Style lines (also [V4 Styles] from SSA)
 *   [Events]           Format + Dialogue/Comment lines
 */
class AssScript
{
public:
    typedef QMap<int, QString> Patch;

    // Resolution assumed when PlayResX/PlayResY are missing or zero
    static constexpr int kDefaultWidth = 1280;
    static constexpr int kDefaultHeight = 720;

    /**
     * @brief Optional [Script Info] fields
     *
     * A field that is absent or does not parse keeps has* = false and its
     * line index at -1.
     */
    struct ScriptInfo {
        bool hasPlayResX;
        int playResX;
        int playResXLine;
        bool hasPlayResY;
        int playResY;
        int playResYLine;
        bool hasTimer;
        double timer;
        int headerLine;  // "[Script Info]", -1 when the section is missing

        ScriptInfo()
            : hasPlayResX(false), playResX(0), playResXLine(-1)
            , hasPlayResY(false), playResY(0), playResYLine(-1)
            , hasTimer(false), timer(0.0), headerLine(-1) {}

        // PlayRes with the 1280x720 default for missing or zero values
        int width() const;
        int height() const;

        // Timer read as a frame rate, the default rate when unusable
        double fps(double fallback) const;
    };

    /**
     * @brief One comma separated record (a Style, Dialogue or Comment line)
     *
     * keys come from the section's Format line, lowercased.
     */
    struct Record {
        int line;
        QString prefix;       // "Style: " or "Dialogue: ", spacing as in the file
        QStringList keys;
        QStringList values;

        int indexOf(const QString &key) const;
        QString value(const QString &key) const;

        /**
         * Rebuild the line with some fields replaced; every other field keeps
         * its original text
         */
        QString withValues(const QMap<QString, QString> &replacements) const;
    };

    AssScript();

    /**
     * @brief Parse script text
     * @return false with *error set when the structure cannot be understood
     */
    static bool parse(const QString &content, AssScript *script, QString *error);

    const ScriptInfo &info() const { return m_info; }
    const QList<Record> &styles() const { return m_styles; }
    const QList<Record> &events() const { return m_events; }

    int lineCount() const { return m_lines.size(); }

    // Line text without its line terminator
    QString line(int index) const;

    bool hasCarriageReturn(int index) const;

    /**
     * @brief Original text with the patched lines replaced
     *
     * Line terminators (LF or CRLF) and a leading byte order mark are kept.
     */
    QString serialize(const Patch &patch = Patch()) const;

    /**
     * @brief Replacement for a "Key: value" [Script Info] line
     */
    QString infoLineWithValue(int lineIndex, const QString &value) const;

private:
    enum Section {
        OtherSection,
        ScriptInfoSection,
        StylesSection,
        EventsSection
    };

    QStringList m_lines;      // without "\r"
    QList<bool> m_hasCarriageReturn;
    ScriptInfo m_info;
    QList<Record> m_styles;
    QList<Record> m_events;
};

#endif // ASSSCRIPT_H
