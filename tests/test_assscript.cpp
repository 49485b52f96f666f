#include <QTest>
#include "../muxpair/src/assscript.h"

namespace {

const char *kScript =
    "[Script Info]\n"
    "Title: Test\n"
    "PlayResX: 1920\n"
    "PlayResY: 1080\n"
    "Timer: 100.0000\n"
    "\n"
    "[V4+ Styles]\n"
    "Format: Name, Fontname, Fontsize, MarginL\n"
    "Style: Default,Arial,48,20\n"
    "\n"
    "[Events]\n"
    "Format: Layer, Start, End, Style, Text\n"
    "Dialogue: 0,0:00:01.00,0:00:02.00,Default,Hello, world\n"
    "Comment: 0,0:00:03.00,0:00:04.00,Default,note\n";

} // namespace

class TestAssScript : public QObject
{
    Q_OBJECT

private slots:
    void testParseSections()
    {
        AssScript script;
        QString error;
        QVERIFY2(AssScript::parse(kScript, &script, &error), qPrintable(error));

        QVERIFY(script.info().hasPlayResX);
        QCOMPARE(script.info().playResX, 1920);
        QCOMPARE(script.info().playResY, 1080);
        QCOMPARE(script.info().playResXLine, 2);
        QCOMPARE(script.info().headerLine, 0);
        QVERIFY(script.info().hasTimer);
        QCOMPARE(script.info().fps(23.976), 100.0);

        QCOMPARE(script.styles().size(), 1);
        QCOMPARE(script.styles().first().value("Fontsize"), QString("48"));
        QCOMPARE(script.styles().first().value("marginl"), QString("20"));

        // Dialogue and Comment are both events; Text keeps its comma
        QCOMPARE(script.events().size(), 2);
        QCOMPARE(script.events().first().value("text"), QString("Hello, world"));
        QCOMPARE(script.events().at(1).prefix, QString("Comment: "));
    }

    void testDefaults()
    {
        AssScript script;
        QString error;
        QVERIFY(AssScript::parse("[Script Info]\nTitle: x\nPlayResX: 0\n", &script, &error));
        QCOMPARE(script.info().width(), AssScript::kDefaultWidth);
        QCOMPARE(script.info().height(), AssScript::kDefaultHeight);
        QVERIFY(!script.info().hasPlayResY);
        QCOMPARE(script.info().playResYLine, -1);
        QCOMPARE(script.info().fps(23.976), 23.976);
    }

    void testSerializeUntouchedIsIdentical()
    {
        const QString crlf = QString::fromUtf8("\xEF\xBB\xBF") + QString(kScript).replace("\n", "\r\n");
        AssScript script;
        QString error;
        QVERIFY(AssScript::parse(crlf, &script, &error));
        QCOMPARE(script.serialize(), crlf);
        QVERIFY(script.hasCarriageReturn(0));
        QVERIFY(!script.line(0).endsWith('\r'));
        QCOMPARE(script.info().headerLine, 0);
    }

    void testPatchReplacesOnlyGivenLines()
    {
        AssScript script;
        QString error;
        QVERIFY(AssScript::parse(kScript, &script, &error));

        AssScript::Patch patch;
        patch.insert(script.info().playResXLine, script.infoLineWithValue(script.info().playResXLine, "1280"));

        QMap<QString, QString> values;
        values.insert("fontsize", "32");
        const AssScript::Record &style = script.styles().first();
        patch.insert(style.line, style.withValues(values));

        QString expected = kScript;
        expected.replace("PlayResX: 1920", "PlayResX: 1280");
        expected.replace("Style: Default,Arial,48,20", "Style: Default,Arial,32,20");
        QCOMPARE(script.serialize(patch), expected);
    }

    void testFormatOrderIsRespected()
    {
        const QString text =
            "[Events]\n"
            "Format: Start, End, Text, Layer, Style\n"
            "Dialogue: 0:00:01.00,0:00:02.00,Hi,0,Default\n";
        AssScript script;
        QString error;
        QVERIFY(AssScript::parse(text, &script, &error));
        QCOMPARE(script.events().first().value("start"), QString("0:00:01.00"));
        QCOMPARE(script.events().first().value("style"), QString("Default"));
    }

    void testMalformedInput()
    {
        AssScript script;
        QString error;

        QVERIFY(!AssScript::parse("[Events]\nDialogue: 0,0:00:01.00,0:00:02.00,Default,Hi\n", &script, &error));
        QVERIFY(error.contains("before any Format line"));

        error.clear();
        QVERIFY(!AssScript::parse("[V4+ Styles]\nFormat: Name, Fontsize\nStyle: Default\n", &script, &error));
        QVERIFY(error.contains("fields"));
    }
};

QTEST_MAIN(TestAssScript)
#include "test_assscript.moc"
