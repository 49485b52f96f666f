#include "subtitlematcher.h"
#include "filenameparser.h"
#include "similarity.h"
#include "logger.h"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <algorithm>

SubtitleMatcher::SubtitleMatcher(bool debug)
    : m_debug(debug)
{
}

QStringList SubtitleMatcher::subtitleExtensions()
{
    return QStringList() << "ass" << "srt" << "ssa" << "sub";
}

SubtitleMatcher::VideoKey SubtitleMatcher::describeVideo(const QString &videoPath)
{
    VideoKey key;
    key.stem = QFileInfo(videoPath).completeBaseName();
    key.showName = FilenameParser::extractShowName(key.stem);
    key.episode = FilenameParser::extractEpisodeInfo(key.stem);
    return key;
}

MatchCandidate SubtitleMatcher::scoreMatch(const QString &videoPath, const QString &subtitlePath) const
{
    return scoreAgainst(describeVideo(videoPath), subtitlePath);
}

MatchCandidate SubtitleMatcher::scoreAgainst(const VideoKey &video, const QString &subtitlePath) const
{
    const QString subStem = QFileInfo(subtitlePath).completeBaseName();

    // 1. Same base name
    if (video.stem == subStem) {
        return MatchCandidate(1.0, MatchKind::Exact, "Exact filename match");
    }

    // 2. Same base name plus a language tag
    if (subStem.startsWith(video.stem + ".")) {
        return MatchCandidate(0.99, MatchKind::ExactWithLangCode, "Exact match with language code");
    }

    const EpisodeKey subEpisode = FilenameParser::extractEpisodeInfo(subStem);
    const QString subShow = FilenameParser::extractShowName(subStem);

    // 3. Same episode number
    if (video.episode.hasEpisode() && subEpisode.hasEpisode()
        && video.episode.episode() == subEpisode.episode()) {
        double score = 0.6;
        QString reason;

        if (video.episode.hasSeason() && subEpisode.hasSeason()) {
            if (video.episode.season() != subEpisode.season()) {
                // No name bonus here, even for identical show names
                return MatchCandidate(0.2, MatchKind::Episode,
                    QString("Episode match but different season (S%1 vs S%2)")
                        .arg(video.episode.season()).arg(subEpisode.season()));
            }
            score = 0.8;
            reason = QString("Episode %1 match").arg(video.episode.toDisplayString());
        } else {
            reason = QString("Episode E%1 match (no season info)")
                         .arg(video.episode.episode(), 2, 10, QChar('0'));
        }

        if (!video.showName.isEmpty() && !subShow.isEmpty()) {
            const double nameSimilarity = Similarity::similarity(video.showName, subShow);
            if (nameSimilarity > 0.8) {
                score += 0.15;
                reason += " with similar show name";
            } else if (nameSimilarity > 0.5) {
                score += 0.05;
            }
        }

        return MatchCandidate(std::min(score, 0.95), MatchKind::Episode, reason);
    }

    // 4. Show name only, when the video carries no episode number
    if (!video.episode.hasEpisode() && !video.showName.isEmpty() && !subShow.isEmpty()) {
        const double nameSimilarity = Similarity::similarity(video.showName, subShow);
        const int percent = qRound(nameSimilarity * 100.0);
        if (nameSimilarity > 0.9) {
            return MatchCandidate(0.7, MatchKind::Fuzzy,
                QString("High show name similarity (%1%)").arg(percent));
        } else if (nameSimilarity > 0.7) {
            return MatchCandidate(0.5, MatchKind::Fuzzy,
                QString("Moderate show name similarity (%1%)").arg(percent));
        }
    }

    return MatchCandidate(0.0, MatchKind::None, "No matching criteria");
}

MatchResult SubtitleMatcher::matchSingle(const QString &videoPath, const QStringList &candidates,
                                         bool strict) const
{
    if (candidates.isEmpty()) {
        return MatchResult(videoPath, QString(), 0.0, MatchKind::None, "No subtitle files found");
    }

    const VideoKey video = describeVideo(videoPath);

    if (m_debug) {
        LOG(QString("[Matcher] Matching %1: show '%2' %3")
                .arg(QFileInfo(videoPath).fileName(), video.showName, video.episode.toDebugString()));
    }

    QString bestPath;
    MatchCandidate best;
    for (const QString &subtitlePath : candidates) {
        const MatchCandidate candidate = scoreAgainst(video, subtitlePath);

        if (m_debug) {
            LOG(QString("[Matcher]   %1: %2 (%3) - %4")
                    .arg(QFileInfo(subtitlePath).fileName())
                    .arg(candidate.score, 0, 'f', 2)
                    .arg(matchKindToString(candidate.kind), candidate.reason));
        }

        // Strictly greater: the first candidate keeps a tie
        if (candidate.score > best.score) {
            best = candidate;
            bestPath = subtitlePath;
        }
    }

    if (bestPath.isEmpty()) {
        return MatchResult(videoPath, QString(), 0.0, MatchKind::None, "No matching criteria");
    }

    if (strict && best.score < kStrictThreshold) {
        return MatchResult(videoPath, QString(), best.score, MatchKind::None,
                           QString("Best match below strict threshold: %1").arg(best.reason));
    }

    return MatchResult(videoPath, bestPath, best.score, best.kind, best.reason);
}

QList<MatchResult> SubtitleMatcher::matchBatch(const QStringList &videoPaths, const QStringList &subtitlePaths,
                                               bool strict) const
{
    QList<MatchResult> results;
    results.reserve(videoPaths.size());
    for (const QString &videoPath : videoPaths) {
        results.append(matchSingle(videoPath, subtitlePaths, strict));
    }
    return results;
}

QList<SubtitleMatcher::Alternative> SubtitleMatcher::alternativeMatches(const QString &videoPath,
                                                                        const QStringList &candidates,
                                                                        int topN) const
{
    const VideoKey video = describeVideo(videoPath);

    QList<Alternative> alternatives;
    for (const QString &subtitlePath : candidates) {
        Alternative alternative;
        alternative.subtitlePath = subtitlePath;
        alternative.candidate = scoreAgainst(video, subtitlePath);
        alternatives.append(alternative);
    }

    std::stable_sort(alternatives.begin(), alternatives.end(),
                     [](const Alternative &a, const Alternative &b) {
                         return a.candidate.score > b.candidate.score;
                     });

    if (topN >= 0 && alternatives.size() > topN) {
        alternatives = alternatives.mid(0, topN);
    }
    return alternatives;
}

QStringList SubtitleMatcher::findAllSubtitles(const QString &root)
{
    QStringList nameFilters;
    for (const QString &ext : subtitleExtensions()) {
        nameFilters << QString("*.%1").arg(ext);
    }

    QStringList found;
    QDirIterator it(root, nameFilters, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        found << it.next();
    }
    found.sort();

    LOG(QString("[Matcher] Found %1 subtitle files under %2").arg(found.size()).arg(root));
    return found;
}
