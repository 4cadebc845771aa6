#include "wordlist.h"

#include <QRegularExpression>
#include <QSet>

namespace {

bool isPlainWord(const QString &word)
{
    if (word.isEmpty())
        return false;
    for (const auto &ch : word) {
        if (ch < QLatin1Char('a') || ch > QLatin1Char('z'))
            return false;
    }
    return true;
}

QString normalizeEntry(const QString &line)
{
    const auto trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.startsWith('#'))
        return {};

    const auto tokens = trimmed.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (tokens.isEmpty())
        return {};

    return tokens.last().toLower();
}

} // namespace

Wordlist::Wordlist(const QStringList &words)
{
    QSet<QString> seen;
    words_.reserve(words.size());
    for (const auto &w : words) {
        const auto word = w.trimmed().toLower();
        if (!isPlainWord(word) || seen.contains(word))
            continue;
        seen.insert(word);
        words_.push_back(word);
    }
}

Wordlist Wordlist::fromText(const QByteArray &text)
{
    const auto lines = QString::fromUtf8(text).split('\n');

    QStringList entries;
    entries.reserve(lines.size());
    for (const auto &line : lines) {
        const auto entry = normalizeEntry(line);
        if (!entry.isEmpty())
            entries.push_back(entry);
    }
    return Wordlist(entries);
}

QByteArray Wordlist::toText() const
{
    QByteArray out;
    for (const auto &word : words_) {
        out.append(word.toLatin1());
        out.append('\n');
    }
    return out;
}
