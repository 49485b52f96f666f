#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "../muxpair/src/subtitlematcher.h"

class TestSubtitleMatcher : public QObject
{
    Q_OBJECT

private slots:
    void testExactMatch();
    void testLanguageTaggedSibling();
    void testSeasonMismatch();
    void testEpisodeScores();
    void testFuzzyShowName();
    void testNoCommonGround();
    void testMatchSinglePicksBest();
    void testTieKeepsFirstCandidate();
    void testStrictThreshold();
    void testEmptyCandidateList();
    void testAllZeroScores();
    void testBatchReusesSubtitle();
    void testAlternatives();
    void testManualOverride();
    void testSummary();
    void testFindAllSubtitles();

private:
    SubtitleMatcher matcher;
};

void TestSubtitleMatcher::testExactMatch()
{
    MatchCandidate c = matcher.scoreMatch("/v/Show S01E05.mkv", "/s/Show S01E05.ass");
    QCOMPARE(c.score, 1.0);
    QCOMPARE(c.kind, MatchKind::Exact);
    QCOMPARE(c.reason, QString("Exact filename match"));

    // Extension and directory do not matter
    QCOMPARE(matcher.scoreMatch("Frieren - 05.mkv", "other/Frieren - 05.srt").score, 1.0);
}

void TestSubtitleMatcher::testLanguageTaggedSibling()
{
    MatchCandidate c = matcher.scoreMatch("/v/Show S01E05.mkv", "/s/Show S01E05.eng.ass");
    QCOMPARE(c.score, 0.99);
    QCOMPARE(c.kind, MatchKind::ExactWithLangCode);
    QCOMPARE(c.reason, QString("Exact match with language code"));
}

void TestSubtitleMatcher::testSeasonMismatch()
{
    MatchCandidate c = matcher.scoreMatch("Show S01E05.mkv", "Show S02E05.ass");
    QCOMPARE(c.score, 0.2);
    QCOMPARE(c.kind, MatchKind::Episode);
    QCOMPARE(c.reason, QString("Episode match but different season (S1 vs S2)"));
}

void TestSubtitleMatcher::testEpisodeScores()
{
    // Season and episode agree, identical show names: 0.8 + 0.15 capped
    MatchCandidate c = matcher.scoreMatch("Show S01E05.mkv", "Show S01E05 [Grp].ass");
    QCOMPARE(c.score, 0.95);
    QCOMPARE(c.reason, QString("Episode S01E05 match with similar show name"));

    // Season unknown on one side
    c = matcher.scoreMatch("Show S01E05.mkv", "Show - 05.ass");
    QCOMPARE(c.score, 0.75);
    QCOMPARE(c.reason, QString("Episode E05 match (no season info) with similar show name"));

    c = matcher.scoreMatch("[A] Frieren - 05 [1080p].mkv", "[B] Frieren 05.ass");
    QCOMPARE(c.score, 0.75);

    // Moderate name similarity earns the small bonus
    c = matcher.scoreMatch("[A] Kaguya sama - 05.mkv", "Kaguya - 05.ass");
    QCOMPARE(c.score, 0.65);
    QCOMPARE(c.reason, QString("Episode E05 match (no season info)"));

    // Unrelated show names still share the episode number
    c = matcher.scoreMatch("[A] Frieren - 05.mkv", "[B] Other Show - 05.ass");
    QCOMPARE(c.score, 0.6);
    QCOMPARE(c.kind, MatchKind::Episode);

    QCOMPARE(matcher.scoreMatch("Show - 02.mkv", "Show - 01.ass").score, 0.0);
}

void TestSubtitleMatcher::testFuzzyShowName()
{
    MatchCandidate c = matcher.scoreMatch("Cowboy Bebop.mkv", "Cowboy Bebob.ass");
    QCOMPARE(c.score, 0.7);
    QCOMPARE(c.kind, MatchKind::Fuzzy);
    QCOMPARE(c.reason, QString("High show name similarity (91%)"));

    c = matcher.scoreMatch("Cowboy Bebop.mkv", "Cowboy Bepop Movie.ass");
    QCOMPARE(c.score, 0.5);
    QCOMPARE(c.reason, QString("Moderate show name similarity (74%)"));
}

void TestSubtitleMatcher::testNoCommonGround()
{
    MatchCandidate c = matcher.scoreMatch("Cowboy Bebop.mkv", "Completely Different.ass");
    QCOMPARE(c.score, 0.0);
    QCOMPARE(c.kind, MatchKind::None);
    QCOMPARE(c.reason, QString("No matching criteria"));
}

void TestSubtitleMatcher::testMatchSinglePicksBest()
{
    QStringList subs;
    subs << "/s/Show S02E05.ass" << "/s/Show - 05.ass" << "/s/Show S01E05.eng.ass";

    MatchResult result = matcher.matchSingle("/v/Show S01E05.mkv", subs);
    QVERIFY(result.hasSubtitle());
    QCOMPARE(result.subtitlePath(), QString("/s/Show S01E05.eng.ass"));
    QCOMPARE(result.confidence(), 0.99);
    QCOMPARE(result.videoPath(), QString("/v/Show S01E05.mkv"));
    QVERIFY(result.isConfident());
}

void TestSubtitleMatcher::testTieKeepsFirstCandidate()
{
    QStringList subs;
    subs << "/a/[X] Show - 01.ass" << "/b/[Y] Show - 01.ass";

    MatchResult result = matcher.matchSingle("/v/Show - 01.mkv", subs);
    QCOMPARE(result.subtitlePath(), QString("/a/[X] Show - 01.ass"));
    QCOMPARE(result.confidence(), 0.75);
}

void TestSubtitleMatcher::testStrictThreshold()
{
    QStringList subs;
    subs << "/s/Show - 05.ass";

    MatchResult loose = matcher.matchSingle("/v/Show S01E05.mkv", subs, false);
    QVERIFY(loose.hasSubtitle());

    MatchResult strict = matcher.matchSingle("/v/Show S01E05.mkv", subs, true);
    QVERIFY(!strict.hasSubtitle());
    QCOMPARE(strict.confidence(), 0.75);
    QVERIFY(strict.reason().startsWith("Best match below strict threshold: "));

    subs << "/s/Show S01E05 [Grp].ass";
    strict = matcher.matchSingle("/v/Show S01E05.mkv", subs, true);
    QCOMPARE(strict.subtitlePath(), QString("/s/Show S01E05 [Grp].ass"));
}

void TestSubtitleMatcher::testEmptyCandidateList()
{
    MatchResult result = matcher.matchSingle("/v/Show S01E05.mkv", QStringList());
    QVERIFY(!result.hasSubtitle());
    QCOMPARE(result.confidence(), 0.0);
    QCOMPARE(result.reason(), QString("No subtitle files found"));
}

void TestSubtitleMatcher::testAllZeroScores()
{
    QStringList subs;
    subs << "/s/Completely Different.ass" << "/s/Another Thing.srt";

    MatchResult result = matcher.matchSingle("/v/Cowboy Bebop.mkv", subs);
    QVERIFY(!result.hasSubtitle());
    QCOMPARE(result.kind(), MatchKind::None);
    QCOMPARE(result.reason(), QString("No matching criteria"));
}

void TestSubtitleMatcher::testBatchReusesSubtitle()
{
    // One subtitle can serve several videos
    QStringList videos;
    videos << "/v/Show S01E05.mkv" << "/v/Show S01E05 v2.mkv" << "/v/Unrelated.mkv";
    QStringList subs;
    subs << "/s/Show S01E05.ass";

    QList<MatchResult> results = matcher.matchBatch(videos, subs);
    QCOMPARE(results.size(), 3);
    QCOMPARE(results[0].subtitlePath(), QString("/s/Show S01E05.ass"));
    QCOMPARE(results[1].subtitlePath(), QString("/s/Show S01E05.ass"));
    QVERIFY(!results[2].hasSubtitle());

    // Order follows the input
    QCOMPARE(results[2].videoPath(), QString("/v/Unrelated.mkv"));
}

void TestSubtitleMatcher::testAlternatives()
{
    QStringList subs;
    subs << "/s/Completely Different.ass" << "/s/Show S02E05.ass"
         << "/s/Show S01E05.ass" << "/s/Show - 05.ass";

    QList<SubtitleMatcher::Alternative> ranked = matcher.alternativeMatches("/v/Show S01E05.mkv", subs);
    QCOMPARE(ranked.size(), 4);
    QCOMPARE(ranked[0].subtitlePath, QString("/s/Show S01E05.ass"));
    QCOMPARE(ranked[1].subtitlePath, QString("/s/Show - 05.ass"));
    QCOMPARE(ranked[2].subtitlePath, QString("/s/Show S02E05.ass"));
    QCOMPARE(ranked[3].candidate.score, 0.0);

    ranked = matcher.alternativeMatches("/v/Show S01E05.mkv", subs, 2);
    QCOMPARE(ranked.size(), 2);
}

void TestSubtitleMatcher::testManualOverride()
{
    MatchResult chosen = MatchResult::manualOverride("/v/a.mkv", "/s/b.ass");
    QCOMPARE(chosen.confidence(), 1.0);
    QCOMPARE(chosen.kind(), MatchKind::Manual);
    QCOMPARE(chosen.reason(), QString("Manually selected"));

    MatchResult cleared = MatchResult::manualOverride("/v/a.mkv", QString());
    QVERIFY(!cleared.hasSubtitle());
    QCOMPARE(cleared.reason(), QString("Manually set to no subtitle"));

    // Out of range confidence is clamped, an empty reason is filled in
    MatchResult odd("/v/a.mkv", "/s/b.ass", 1.7, MatchKind::Fuzzy, QString());
    QCOMPARE(odd.confidence(), 1.0);
    QCOMPARE(odd.reason(), QString("No reason given"));
}

void TestSubtitleMatcher::testSummary()
{
    QList<MatchResult> results;
    results << MatchResult("a", "x", 0.95, MatchKind::Episode, "r")
            << MatchResult("b", "y", 0.5, MatchKind::Fuzzy, "r")
            << MatchResult("c", QString(), 0.0, MatchKind::None, "r")
            << MatchResult("d", "z", 0.7, MatchKind::Fuzzy, "r");

    MatchSummary summary = MatchSummary::summarize(results);
    QCOMPARE(summary.total, 4);
    QCOMPARE(summary.highConfidence, 2);
    QCOMPARE(summary.lowConfidence, 1);
    QCOMPARE(summary.unmatched, 1);
}

void TestSubtitleMatcher::testFindAllSubtitles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QDir root(dir.path());
    QVERIFY(root.mkpath("season1/extras"));

    QStringList files;
    files << "a.ass" << "season1/b.srt" << "season1/extras/c.ssa" << "d.sub"
          << "video.mkv" << "notes.txt";
    for (const QString &name : files) {
        QFile file(root.filePath(name));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }

    QStringList found = SubtitleMatcher::findAllSubtitles(dir.path());
    QCOMPARE(found.size(), 4);
    QVERIFY(found.contains(root.filePath("season1/extras/c.ssa")));
    QVERIFY(!found.contains(root.filePath("video.mkv")));

    QStringList sorted = found;
    sorted.sort();
    QCOMPARE(found, sorted);
}

QTEST_MAIN(TestSubtitleMatcher)
#include "test_subtitlematcher.moc"
