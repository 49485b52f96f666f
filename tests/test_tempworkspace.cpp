#include <QTest>
#include <QTemporaryDir>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>
#include "../muxpair/src/tempworkspace.h"

class TestTempWorkspace : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        QVERIFY(m_base.isValid());
        TempWorkspace::instance()->setBaseDirectory(m_base.path());
    }

    void cleanup()
    {
        TempWorkspace::instance()->cleanup();
    }

    void testSingleton()
    {
        QCOMPARE(TempWorkspace::instance(), TempWorkspace::instance());
    }

    void testDirectoryIsCreatedLazily()
    {
        const QString expected = QDir(m_base.path()).filePath(
            QString("muxpair-%1").arg(QCoreApplication::applicationPid()));
        QVERIFY(!QFileInfo::exists(expected));

        QCOMPARE(TempWorkspace::instance()->directory(), expected);
        QVERIFY(QFileInfo(expected).isDir());
    }

    void testOutputNames()
    {
        const QString path = TempWorkspace::instance()->createOutputPath("/subs/Show - 01.eng.ass", "resampled");
        const QFileInfo info(path);
        QCOMPARE(info.absolutePath(), TempWorkspace::instance()->directory());
        QVERIFY(info.fileName().startsWith("Show - 01.eng_resampled_"));
        QCOMPARE(info.suffix(), QString("ass"));

        // <stem>_<tag>_<8 hex>.<ext>
        QCOMPARE(info.fileName().size(), QString("Show - 01.eng_resampled_").size() + 8 + 4);

        const QString bare = TempWorkspace::instance()->createOutputPath("/subs/README", "shifted");
        QVERIFY(!QFileInfo(bare).fileName().contains('.'));
    }

    void testTokensAreDistinct()
    {
        QSet<QString> tokens;
        for (int i = 0; i < 100; ++i) {
            const QString token = TempWorkspace::randomToken();
            QCOMPARE(token.size(), 8);
            QVERIFY(QRegularExpression("^[0-9a-f]{8}$").match(token).hasMatch());
            tokens.insert(token);
        }
        QCOMPARE(tokens.size(), 100);
    }

    void testCleanupRemovesEverything()
    {
        const QString dir = TempWorkspace::instance()->directory();
        QFile file(TempWorkspace::instance()->createOutputPath("a.srt", "shifted"));
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("1\n");
        file.close();

        QVERIFY(TempWorkspace::instance()->cleanup());
        QVERIFY(!QFileInfo::exists(dir));

        // Cleaning twice is fine, and the directory comes back on demand
        QVERIFY(TempWorkspace::instance()->cleanup());
        QVERIFY(QFileInfo(TempWorkspace::instance()->directory()).isDir());
    }

private:
    QTemporaryDir m_base;
};

QTEST_MAIN(TestTempWorkspace)
#include "test_tempworkspace.moc"
