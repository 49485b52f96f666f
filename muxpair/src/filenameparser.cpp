#include "filenameparser.h"
#include <QFileInfo>

namespace FilenameParser {

namespace {

EpisodeKey extractSeasonAndEpisode(const QRegularExpressionMatch &match)
{
    return EpisodeKey(match.captured(1).toInt(), match.captured(2).toInt());
}

EpisodeKey extractEpisodeOnly(const QRegularExpressionMatch &match)
{
    return EpisodeKey::episodeOnly(match.captured(1).toInt());
}

RuleTable buildDefaultRuleTable()
{
    const auto ci = QRegularExpression::CaseInsensitiveOption;

    RuleTable table;
    table.episodeRules = {
        { EpisodeRuleKind::SeasonEpisode,
          QRegularExpression(R"(S(\d+)E(\d+))", ci), &extractSeasonAndEpisode, true },
        { EpisodeRuleKind::SeasonCrossEpisode,
          QRegularExpression(R"((\d+)x(\d+))", ci), &extractSeasonAndEpisode, true },
        { EpisodeRuleKind::DashSeparator,
          QRegularExpression(R"( - (\d{1,2})(?:\s|$|\[))", ci), &extractEpisodeOnly, false },
        { EpisodeRuleKind::BracketedNumber,
          QRegularExpression(R"(\[(\d{1,3})(?!\d)(?!p)(?!x\d)(?!bit)(?!-bit)\])"), &extractEpisodeOnly, true },
        { EpisodeRuleKind::BareNumber,
          QRegularExpression(R"((?<![0-9])E?(\d{1,3})(?![0-9xp]))", ci), &extractEpisodeOnly, true },
    };

    table.ignorePatterns = {
        QRegularExpression(R"(\[[^\]]*\d+x\d+[^\]]*\])"),
        QRegularExpression(R"(\[[^\]]*\d+p[^\]]*\])"),
        QRegularExpression(R"(\[[^\]]*(?:DVDRip|BDRip|WebRip)[^\]]*\])", ci),
        QRegularExpression(R"(\[[^\]]*(?:x26[45]|hevc|avc|flac|ac3|mp3)[^\]]*\])", ci),
    };
    return table;
}

bool insideAnyRange(int position, const QList<QPair<int, int>> &ranges)
{
    for (const QPair<int, int> &range : ranges) {
        if (position >= range.first && position < range.second) {
            return true;
        }
    }
    return false;
}

// Show name boundary: leading group tags, then the shortest run up to a separator
const QRegularExpression &titlePattern()
{
    static const QRegularExpression re(
        R"((?:\[.+?\]\s*)*(.+?)(?:\s+-\s+|\s+S\d+E\d+|\s+\d+x\d+|\s+E\d+|\s+\[\d{1,3}\]|\s+\[\d{4}\]))");
    return re;
}

} // namespace

const RuleTable& defaultRuleTable()
{
    static const RuleTable table = buildDefaultRuleTable();
    return table;
}

QList<QPair<int, int>> ignoreRanges(const QString &filename, const RuleTable &table)
{
    QList<QPair<int, int>> ranges;
    for (const QRegularExpression &pattern : table.ignorePatterns) {
        QRegularExpressionMatchIterator it = pattern.globalMatch(filename);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            ranges.append(qMakePair(static_cast<int>(match.capturedStart()),
                                    static_cast<int>(match.capturedEnd())));
        }
    }
    return ranges;
}

EpisodeKey extractEpisodeInfo(const QString &filename, const RuleTable &table)
{
    const QList<QPair<int, int>> skip = ignoreRanges(filename, table);

    for (const EpisodeRule &rule : table.episodeRules) {
        if (!rule.yieldsEpisode) {
            continue;
        }
        QRegularExpressionMatchIterator it = rule.pattern.globalMatch(filename);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            if (!insideAnyRange(static_cast<int>(match.capturedStart()), skip)) {
                return rule.extract(match);
            }
        }
    }

    return EpisodeKey();
}

EpisodeKey extractEpisodeInfo(const QString &filename)
{
    return extractEpisodeInfo(filename, defaultRuleTable());
}

QString extractShowName(const QString &filename, const RuleTable &table)
{
    // Which rule sees an episode first decides how the name is cut
    const EpisodeRule *firstRule = nullptr;
    for (const EpisodeRule &rule : table.episodeRules) {
        if (rule.pattern.match(filename).hasMatch()) {
            firstRule = &rule;
            break;
        }
    }

    if (firstRule && firstRule->kind == EpisodeRuleKind::BracketedNumber) {
        static const QRegularExpression bracketNumber(R"(\[\d{1,3}\])");
        QRegularExpressionMatch split = bracketNumber.match(filename);
        if (split.hasMatch()) {
            QString showPart = filename.left(split.capturedStart());
            static const QRegularExpression leadingGroup(R"(^\s*\[.*?\]\s*(.*?)$)");
            QRegularExpressionMatch group = leadingGroup.match(showPart);
            if (group.hasMatch()) {
                return group.captured(1).trimmed();
            }
            return showPart.trimmed();
        }
    }

    QRegularExpressionMatch title = titlePattern().match(filename);
    if (title.hasMatch()) {
        return title.captured(1).trimmed();
    }

    static const QRegularExpression bracketNumbers(R"(\[\d{1,3}\])");
    static const QRegularExpression technicalTags(
        R"(\[[^\]]*(?:bit|p|x\d+|HEVC|h26[45]|flac|aac)[^\]]*\])",
        QRegularExpression::CaseInsensitiveOption);

    QString cleanName = filename;
    cleanName.remove(bracketNumbers);
    cleanName.remove(technicalTags);

    if (cleanName.startsWith('[')) {
        int rbracket = cleanName.indexOf(']');
        if (rbracket > 0) {
            cleanName = cleanName.mid(rbracket + 1).trimmed();
        }
    }

    return cleanName.trimmed();
}

QString extractShowName(const QString &filename)
{
    return extractShowName(filename, defaultRuleTable());
}

QString extractReleaseGroup(const QString &filename)
{
    static const QRegularExpression bracketGroup(R"(^\s*\[([^\]]+)\])");
    QRegularExpressionMatch match = bracketGroup.match(filename);
    if (match.hasMatch()) {
        return match.captured(1).trimmed();
    }

    static const QRegularExpression parenGroup(R"(^\s*\(([^)]+)\))");
    match = parenGroup.match(filename);
    if (match.hasMatch()) {
        return match.captured(1).trimmed();
    }

    return QString();
}

QString extractLanguageCode(const QString &filename)
{
    static const QRegularExpression langRe(R"(\.(?<lang>[a-z]{2,3})\.[^.]+$)");
    QRegularExpressionMatch match = langRe.match(filename);
    if (match.hasMatch()) {
        return match.captured("lang");
    }
    return QString();
}

ParsedName parse(const QString &filename)
{
    ParsedName parsed;
    parsed.showName = extractShowName(filename);
    parsed.episodeKey = extractEpisodeInfo(filename);
    parsed.releaseGroup = extractReleaseGroup(filename);
    parsed.languageCode = extractLanguageCode(filename);
    return parsed;
}

QString formatEpisodeNumber(const EpisodeKey &key)
{
    return key.toDisplayString();
}

QString generateOutputFilename(const QString &videoPath, const QString &releaseTag,
                               const QStringList &videoParams)
{
    QFileInfo info(videoPath);
    const QString stem = info.completeBaseName();

    const QString showName = extractShowName(stem);
    const EpisodeKey key = extractEpisodeInfo(stem);

    QString episodePart;
    if (key.hasEpisode()) {
        episodePart = QString(" - %1").arg(formatEpisodeNumber(key));
    }

    QString paramsPart;
    if (!videoParams.isEmpty()) {
        paramsPart = QString(" [%1]").arg(videoParams.join(' '));
    }

    QString suffix = info.suffix();
    if (!suffix.isEmpty()) {
        suffix.prepend('.');
    }

    return QString("[%1] %2%3%4%5").arg(releaseTag, showName, episodePart, paramsPart, suffix);
}

} // namespace FilenameParser
