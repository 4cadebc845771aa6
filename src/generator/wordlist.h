#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <QStringList>

// Ordered, de-duplicated list of lowercase ASCII words.
class Wordlist final
{
public:
    Wordlist() = default;
    explicit Wordlist(const QStringList &words);

    // One entry per line. Diceware lines ("11111<TAB>word") keep their last token;
    // blank lines, '#' comments and entries that are not plain ASCII letters are skipped.
    static Wordlist fromText(const QByteArray &text);

    QByteArray toText() const;

    bool isEmpty() const { return words_.isEmpty(); }
    qsizetype size() const { return words_.size(); }
    const QString &at(qsizetype i) const { return words_.at(i); }
    const QStringList &words() const { return words_; }

private:
    QStringList words_;
};

Q_DECLARE_METATYPE(Wordlist)
