#include "assscript.h"
#include "subtitleformat.h"

namespace {

const QChar kByteOrderMark(0xFEFF);

// Position just past "Key:" and the blanks that follow it, -1 without a colon
int valueOffset(const QString &line)
{
    const int colon = line.indexOf(':');
    if (colon < 0) {
        return -1;
    }
    int offset = colon + 1;
    while (offset < line.size() && (line.at(offset) == ' ' || line.at(offset) == '\t')) {
        ++offset;
    }
    return offset;
}

// Split into at most count fields; the last field keeps any further commas
QStringList splitFields(const QString &text, int count)
{
    QStringList fields;
    int start = 0;
    for (int i = 0; i < count - 1; ++i) {
        const int comma = text.indexOf(',', start);
        if (comma < 0) {
            break;
        }
        fields << text.mid(start, comma - start);
        start = comma + 1;
    }
    fields << text.mid(start);
    return fields;
}

QStringList parseFormat(const QString &text)
{
    QStringList keys;
    for (const QString &key : text.split(',')) {
        keys << key.trimmed().toLower();
    }
    return keys;
}

} // namespace

int AssScript::ScriptInfo::width() const
{
    return (hasPlayResX && playResX > 0) ? playResX : kDefaultWidth;
}

int AssScript::ScriptInfo::height() const
{
    return (hasPlayResY && playResY > 0) ? playResY : kDefaultHeight;
}

double AssScript::ScriptInfo::fps(double fallback) const
{
    return (hasTimer && timer > 0.0) ? timer : fallback;
}

int AssScript::Record::indexOf(const QString &key) const
{
    return keys.indexOf(key.toLower());
}

QString AssScript::Record::value(const QString &key) const
{
    const int index = indexOf(key);
    if (index < 0 || index >= values.size()) {
        return QString();
    }
    return values.at(index);
}

QString AssScript::Record::withValues(const QMap<QString, QString> &replacements) const
{
    QStringList updated = values;
    for (auto it = replacements.constBegin(); it != replacements.constEnd(); ++it) {
        const int index = indexOf(it.key());
        if (index >= 0 && index < updated.size()) {
            updated[index] = it.value();
        }
    }
    return prefix + updated.join(',');
}

AssScript::AssScript()
{
}

bool AssScript::parse(const QString &content, AssScript *script, QString *error)
{
    if (!script) {
        return false;
    }

    AssScript parsed;
    const QStringList rawLines = content.split('\n');
    for (const QString &raw : rawLines) {
        if (raw.endsWith('\r')) {
            parsed.m_lines << raw.left(raw.size() - 1);
            parsed.m_hasCarriageReturn << true;
        } else {
            parsed.m_lines << raw;
            parsed.m_hasCarriageReturn << false;
        }
    }

    Section section = OtherSection;
    QStringList styleFormat;
    QStringList eventFormat;

    for (int i = 0; i < parsed.m_lines.size(); ++i) {
        QString text = parsed.m_lines.at(i);
        if (i == 0 && text.startsWith(kByteOrderMark)) {
            text = text.mid(1);
        }
        const QString trimmed = text.trimmed();
        if (trimmed.isEmpty() || trimmed.startsWith(';')) {
            continue;
        }

        if (trimmed.startsWith('[') && trimmed.endsWith(']')) {
            const QString name = trimmed.mid(1, trimmed.size() - 2).trimmed().toLower();
            if (name == "script info") {
                section = ScriptInfoSection;
                parsed.m_info.headerLine = i;
            } else if (name.endsWith("styles")) {
                section = StylesSection;
            } else if (name == "events") {
                section = EventsSection;
            } else {
                section = OtherSection;
            }
            continue;
        }

        const int offset = valueOffset(text);
        if (offset < 0) {
            continue;
        }
        const QString key = text.left(text.indexOf(':')).trimmed().toLower();
        const QString rest = text.mid(offset);

        if (section == ScriptInfoSection) {
            bool ok = false;
            if (key == "playresx") {
                const int value = rest.trimmed().toInt(&ok);
                parsed.m_info.hasPlayResX = ok;
                parsed.m_info.playResX = ok ? value : 0;
                parsed.m_info.playResXLine = i;
            } else if (key == "playresy") {
                const int value = rest.trimmed().toInt(&ok);
                parsed.m_info.hasPlayResY = ok;
                parsed.m_info.playResY = ok ? value : 0;
                parsed.m_info.playResYLine = i;
            } else if (key == "timer") {
                const double value = SubtitleFormat::parseDoubleOr(rest, -1.0);
                parsed.m_info.hasTimer = value > 0.0;
                parsed.m_info.timer = value > 0.0 ? value : 0.0;
            }
        } else if (section == StylesSection) {
            if (key == "format") {
                styleFormat = parseFormat(rest);
            } else if (key == "style") {
                if (styleFormat.isEmpty()) {
                    if (error) {
                        *error = QString("Style on line %1 appears before any Format line").arg(i + 1);
                    }
                    return false;
                }
                Record record;
                record.line = i;
                record.prefix = parsed.m_lines.at(i).left(offset + (parsed.m_lines.at(i).size() - text.size()));
                record.keys = styleFormat;
                record.values = splitFields(rest, styleFormat.size());
                if (record.values.size() != styleFormat.size()) {
                    if (error) {
                        *error = QString("Style on line %1 has %2 fields, format declares %3")
                                     .arg(i + 1).arg(record.values.size()).arg(styleFormat.size());
                    }
                    return false;
                }
                parsed.m_styles << record;
            }
        } else if (section == EventsSection) {
            if (key == "format") {
                eventFormat = parseFormat(rest);
            } else if (key == "dialogue" || key == "comment") {
                if (eventFormat.isEmpty()) {
                    if (error) {
                        *error = QString("Event on line %1 appears before any Format line").arg(i + 1);
                    }
                    return false;
                }
                Record record;
                record.line = i;
                record.prefix = parsed.m_lines.at(i).left(offset + (parsed.m_lines.at(i).size() - text.size()));
                record.keys = eventFormat;
                record.values = splitFields(rest, eventFormat.size());
                if (record.values.size() != eventFormat.size()) {
                    if (error) {
                        *error = QString("Event on line %1 has %2 fields, format declares %3")
                                     .arg(i + 1).arg(record.values.size()).arg(eventFormat.size());
                    }
                    return false;
                }
                parsed.m_events << record;
            }
        }
    }

    *script = parsed;
    return true;
}

QString AssScript::line(int index) const
{
    if (index < 0 || index >= m_lines.size()) {
        return QString();
    }
    return m_lines.at(index);
}

bool AssScript::hasCarriageReturn(int index) const
{
    return index >= 0 && index < m_hasCarriageReturn.size() && m_hasCarriageReturn.at(index);
}

QString AssScript::infoLineWithValue(int lineIndex, const QString &value) const
{
    const QString original = line(lineIndex);
    const int offset = valueOffset(original);
    if (offset < 0) {
        return original;
    }
    return original.left(offset) + value;
}

QString AssScript::serialize(const Patch &patch) const
{
    QString out;
    for (int i = 0; i < m_lines.size(); ++i) {
        if (i > 0) {
            out.append('\n');
        }
        out.append(patch.contains(i) ? patch.value(i) : m_lines.at(i));
        if (m_hasCarriageReturn.at(i)) {
            out.append('\r');
        }
    }
    return out;
}
