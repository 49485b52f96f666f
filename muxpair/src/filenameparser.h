#ifndef FILENAMEPARSER_H
#define FILENAMEPARSER_H

#include <QList>
#include <QPair>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include "episodekey.h"

/**
 * Heuristics for community release names
 *
 * Release names have no fixed grammar ("[Group] Show - 07 [1080p].mkv",
 * "Show.S02E05.x265.mkv", "Show [05][BDRip].ass", ...). Everything here is
 * pure and total: unknown parts come back empty, nothing throws.
 */
namespace FilenameParser {

enum class EpisodeRuleKind {
    SeasonEpisode,     // S02E05
    SeasonCrossEpisode, // 2x05
    DashSeparator,     // "Show - 05 " (only used to locate the show name)
    BracketedNumber,   // [05]
    BareNumber         // 05, E05
};

struct EpisodeRule {
    EpisodeRuleKind kind;
    QRegularExpression pattern;
    // Builds the key from a match of pattern
    EpisodeKey (*extract)(const QRegularExpressionMatch &match);
    // False for rules that only help splitting off the show name
    bool yieldsEpisode;
};

/**
 * Ordered rule tables. Order is significant: the first rule with a usable
 * match wins, regardless of how specific a later rule would be.
 */
struct RuleTable {
    QList<EpisodeRule> episodeRules;
    // Technical tag groups ([1080p], [960x720], [BDRip], [x265 flac]) that
    // must never be read as an episode number
    QList<QRegularExpression> ignorePatterns;
};

const RuleTable& defaultRuleTable();

struct ParsedName {
    QString showName;
    EpisodeKey episodeKey;
    QString releaseGroup;  // empty when the name has no leading group tag
    QString languageCode;  // empty when none
};

/**
 * Character ranges [start, end) covered by the table's ignore patterns
 */
QList<QPair<int, int>> ignoreRanges(const QString &filename, const RuleTable &table);

/**
 * Extract season and episode numbers.
 *
 * "ShowName - 07 [1080p].mkv" -> (unknown, 7)
 * "Show.S02E05.mkv"           -> (2, 5)
 */
EpisodeKey extractEpisodeInfo(const QString &filename, const RuleTable &table);
EpisodeKey extractEpisodeInfo(const QString &filename);

/**
 * Extract the show name. Falls back to the trimmed input when no
 * structure is recognized.
 */
QString extractShowName(const QString &filename, const RuleTable &table);
QString extractShowName(const QString &filename);

/**
 * Contents of a leading [Group] or (Group) tag, empty if there is none
 */
QString extractReleaseGroup(const QString &filename);

/**
 * Two or three letter language code before the final extension
 * ("Show - 01.eng.ass" -> "eng"), empty if there is none
 */
QString extractLanguageCode(const QString &filename);

ParsedName parse(const QString &filename);

// "S01E05" with a season, "05" without one, "" when the episode is unknown
QString formatEpisodeNumber(const EpisodeKey &key);

/**
 * Output name for a muxed release: "[tag] Show - S01E05 [1080p 10bit].mkv"
 *
 * @param videoPath Source video (its base name is parsed, its suffix kept)
 * @param releaseTag Tag placed in front of the name
 * @param videoParams Technical tags supplied by the prober, may be empty
 */
QString generateOutputFilename(const QString &videoPath, const QString &releaseTag,
                               const QStringList &videoParams = QStringList());

} // namespace FilenameParser

#endif // FILENAMEPARSER_H
