#include "generator/passphrasegenerator.h"
#include "generator/passwordgenerator.h"
#include "generator/randomsource.h"
#include "generator/secretstrength.h"
#include "generator/wordlist.h"

#include <QRandomGenerator>
#include <QSet>
#include <QStringList>
#include <QtTest>

#include <algorithm>
#include <limits>

namespace {

int countIn(const QString &s, const QString &chars)
{
    int n = 0;
    for (const auto &ch : s) {
        if (chars.contains(ch))
            n++;
    }
    return n;
}

Wordlist twoLetterWordlist()
{
    QStringList words;
    for (char a = 'a'; a <= 'z'; ++a) {
        for (char b = 'a'; b <= 'z'; ++b)
            words.push_back(QString("%1%2").arg(QChar(a)).arg(QChar(b)));
    }
    return Wordlist(words);
}

const Wordlist &fiveWords()
{
    static const Wordlist wordlist(QStringList{"apple", "river", "stone", "cloud", "light"});
    return wordlist;
}

} // namespace

class GeneratorUnitTests final : public QObject
{
    Q_OBJECT

private slots:
    void random_uniform_index_range()
    {
        const auto &random = RandomSource::system();
        QCOMPARE(random.uniformIndex(1), qsizetype(0));

        QSet<qsizetype> seen;
        for (int i = 0; i < 500; ++i) {
            const auto idx = random.uniformIndex(7);
            QVERIFY(idx >= 0 && idx < 7);
            seen.insert(idx);
        }
        QCOMPARE(seen.size(), qsizetype(7));
    }

    void random_uniform_index_rejects_empty_pool()
    {
        GeneratorError error;
        QCOMPARE(RandomSource::system().uniformIndex(0, &error), qsizetype(-1));
        QCOMPARE(error.code, GeneratorErrorCode::InvalidArgument);
        QCOMPARE(error.kind(), GeneratorErrorKind::InvalidArgument);

        GeneratorError negative;
        QCOMPARE(RandomSource::system().uniformIndex(-5, &negative), qsizetype(-1));
        QCOMPARE(negative.kind(), GeneratorErrorKind::InvalidArgument);
    }

    void random_shuffle_is_a_permutation()
    {
        const QString original = "abcdefghij0123456789";
        auto shuffled = RandomSource::system().shuffled(original);
        QCOMPARE(shuffled.size(), original.size());

        auto a = original;
        std::sort(a.begin(), a.end());
        std::sort(shuffled.begin(), shuffled.end());
        QCOMPARE(shuffled, a);
    }

    void random_shuffle_reaches_every_ordering()
    {
        QSet<QString> orderings;
        for (int i = 0; i < 600; ++i)
            orderings.insert(RandomSource::system().shuffled(QString("abc")));
        QCOMPARE(orderings.size(), qsizetype(6));
    }

    void random_injected_generator_is_reproducible()
    {
        QRandomGenerator g1(1234);
        QRandomGenerator g2(1234);
        const RandomSource r1(&g1);
        const RandomSource r2(&g2);

        QStringList a{"one", "two", "three", "four", "five"};
        QStringList b = a;
        r1.shuffle(a);
        r2.shuffle(b);
        QCOMPARE(a, b);
    }

    void password_length_is_exact()
    {
        PasswordRequest request;
        for (int length = static_cast<int>(request.minimumLength()); length <= 64; ++length) {
            request.length = length;
            GeneratorError error;
            const auto pwd = generatePassword(request, &error);
            QVERIFY2(!error.isError(), qPrintable(error.message));
            QCOMPARE(pwd.size(), qsizetype(length));
        }
    }

    void password_required_categories_present()
    {
        PasswordRequest request;
        request.length = 12;
        request.digitCount = 3;
        request.symbolCount = 2;

        for (int i = 0; i < 100; ++i) {
            const auto pwd = generatePassword(request);
            QCOMPARE(pwd.size(), qsizetype(12));
            QVERIFY(countIn(pwd, PasswordAlphabet::kDigits) >= 3);
            QVERIFY(countIn(pwd, PasswordAlphabet::kDefaultSymbols) >= 2);
            QVERIFY(countIn(pwd, PasswordAlphabet::kLowercase) >= 1);
            QVERIFY(countIn(pwd, PasswordAlphabet::kUppercase) >= 1);
        }
    }

    void password_unselected_categories_absent()
    {
        PasswordRequest request;
        request.length = 32;
        request.includeUppercase = false;
        request.digitCount = 1;
        request.symbolCount = 0;

        for (int i = 0; i < 50; ++i) {
            const auto pwd = generatePassword(request);
            QCOMPARE(countIn(pwd, PasswordAlphabet::kUppercase), 0);
            QCOMPARE(countIn(pwd, PasswordAlphabet::kDefaultSymbols), 0);
        }
    }

    void password_exclude_ambiguous()
    {
        PasswordRequest request;
        request.length = 64;
        request.digitCount = 8;
        request.symbolCount = 4;
        request.excludeAmbiguous = true;

        for (int i = 0; i < 200; ++i) {
            const auto pwd = generatePassword(request);
            QCOMPARE(countIn(pwd, PasswordAlphabet::kAmbiguous), 0);
        }
    }

    void password_two_digits_two_symbols()
    {
        PasswordRequest request;
        request.length = 4;
        request.digitCount = 2;
        request.symbolCount = 2;
        request.includeLowercase = false;
        request.includeUppercase = false;

        GeneratorError error;
        const auto pwd = generatePassword(request, &error);
        QVERIFY2(!pwd.isEmpty(), qPrintable(error.message));
        QCOMPARE(pwd.size(), qsizetype(4));
        QCOMPARE(countIn(pwd, PasswordAlphabet::kDigits), 2);
        QCOMPARE(countIn(pwd, PasswordAlphabet::kDefaultSymbols), 2);
    }

    void password_custom_symbols()
    {
        PasswordRequest request;
        request.length = 10;
        request.includeLowercase = false;
        request.includeUppercase = false;
        request.digitCount = 0;
        request.symbolCount = 10;
        request.customSymbols = "#@ #@";

        const auto pwd = generatePassword(request);
        QCOMPARE(pwd.size(), qsizetype(10));
        QCOMPARE(countIn(pwd, "#@"), 10);
    }

    void password_mandatory_positions_vary()
    {
        PasswordRequest request;
        request.length = 8;
        request.includeUppercase = false;
        request.digitCount = 0;
        request.symbolCount = 1;

        QSet<qsizetype> positions;
        for (int i = 0; i < 200; ++i) {
            const auto pwd = generatePassword(request);
            for (qsizetype p = 0; p < pwd.size(); ++p) {
                if (PasswordAlphabet::kDefaultSymbols.contains(pwd.at(p))) {
                    positions.insert(p);
                    break;
                }
            }
        }
        QVERIFY(positions.size() > 1);
    }

    void password_is_not_deterministic()
    {
        PasswordRequest request;
        request.length = 16;
        const auto a = generatePassword(request);
        const auto b = generatePassword(request);
        QVERIFY(!a.isEmpty());
        QVERIFY(a != b);
    }

    void password_length_too_short()
    {
        PasswordRequest request;
        request.length = 3;
        request.digitCount = 5;
        request.symbolCount = 0;

        GeneratorError error;
        QVERIFY(generatePassword(request, &error).isEmpty());
        QCOMPARE(error.code, GeneratorErrorCode::LengthTooShort);
        QCOMPARE(error.kind(), GeneratorErrorKind::Validation);
        QVERIFY(!error.message.isEmpty());
    }

    void password_category_empty_checked_first()
    {
        PasswordRequest request;
        request.length = 0;
        request.symbolCount = 1;
        request.customSymbols = "   ";

        GeneratorError error;
        QVERIFY(generatePassword(request, &error).isEmpty());
        QCOMPARE(error.code, GeneratorErrorCode::CategoryEmpty);
        QCOMPARE(error.kind(), GeneratorErrorKind::Validation);
    }

    void password_nothing_selected()
    {
        PasswordRequest request;
        request.length = 8;
        request.includeLowercase = false;
        request.includeUppercase = false;
        request.digitCount = 0;
        request.symbolCount = 0;

        GeneratorError error;
        QVERIFY(generatePassword(request, &error).isEmpty());
        QCOMPARE(error.code, GeneratorErrorCode::NothingSelected);

        request.length = 0;
        GeneratorError zero;
        QVERIFY(generatePassword(request, &zero).isEmpty());
        QCOMPARE(zero.code, GeneratorErrorCode::NothingSelected);
    }

    void password_structural_errors()
    {
        PasswordRequest request;
        request.length = -1;
        GeneratorError error;
        QVERIFY(generatePassword(request, &error).isEmpty());
        QCOMPARE(error.kind(), GeneratorErrorKind::InvalidArgument);

        request.length = 16;
        request.digitCount = -2;
        GeneratorError count;
        QVERIFY(generatePassword(request, &count).isEmpty());
        QCOMPARE(count.kind(), GeneratorErrorKind::InvalidArgument);
    }

    void password_huge_counts_do_not_wrap()
    {
        PasswordRequest request;
        request.length = 16;
        request.digitCount = std::numeric_limits<int>::max();
        request.symbolCount = 1;

        GeneratorError digits;
        QVERIFY(generatePassword(request, &digits).isEmpty());
        QCOMPARE(digits.code, GeneratorErrorCode::LengthTooShort);

        request.digitCount = 1;
        request.symbolCount = std::numeric_limits<int>::max();
        GeneratorError symbols;
        QVERIFY(generatePassword(request, &symbols).isEmpty());
        QCOMPARE(symbols.code, GeneratorErrorCode::LengthTooShort);

        request.length = std::numeric_limits<int>::max();
        request.digitCount = std::numeric_limits<int>::max();
        request.symbolCount = std::numeric_limits<int>::max();
        QVERIFY(request.minimumLength() > request.length);
        GeneratorError both;
        QVERIFY(!validatePasswordRequest(request, &both));
        QCOMPARE(both.code, GeneratorErrorCode::LengthTooShort);
    }

    void password_custom_symbols_reject_surrogates()
    {
        PasswordRequest request;
        request.length = 8;
        request.symbolCount = 2;
        request.customSymbols = QStringLiteral("#") + QString::fromUcs4(U"\U0001F600");

        GeneratorError error;
        QVERIFY(generatePassword(request, &error).isEmpty());
        QCOMPARE(error.code, GeneratorErrorCode::InvalidArgument);
        QCOMPARE(error.kind(), GeneratorErrorKind::InvalidArgument);

        request.customSymbols = QStringLiteral("#§");
        const auto pwd = generatePassword(request);
        QCOMPARE(pwd.size(), qsizetype(8));
        QCOMPARE(countIn(pwd, QStringLiteral("#§")), 2);
    }

    void password_custom_symbols_skip_ambiguity_filter()
    {
        PasswordRequest request;
        request.length = 40;
        request.digitCount = 10;
        request.symbolCount = 10;
        request.excludeAmbiguous = true;
        request.customSymbols = "O0";

        for (int i = 0; i < 50; ++i) {
            const auto pwd = generatePassword(request);
            QCOMPARE(pwd.size(), qsizetype(40));
            // Letters and digits lose l/1/I/O/0; the explicit symbol set keeps O and 0.
            QVERIFY(countIn(pwd, "O0") >= 10);
            QCOMPARE(countIn(pwd, "l1I"), 0);
        }
    }

    void passphrase_basic_shape()
    {
        PassphraseRequest request;
        request.wordCount = 4;
        request.separator = "-";
        request.capitalize = true;
        request.digitCount = 0;
        request.symbolCount = 0;

        for (int i = 0; i < 50; ++i) {
            GeneratorError error;
            const auto phrase = generatePassphrase(request, fiveWords(), &error);
            QVERIFY2(!phrase.isEmpty(), qPrintable(error.message));
            QCOMPARE(phrase.count('-'), qsizetype(3));

            const auto parts = phrase.split('-');
            QCOMPARE(parts.size(), qsizetype(4));

            QSet<QString> unique;
            for (const auto &part : parts) {
                QVERIFY(!part.isEmpty());
                QVERIFY(part.at(0).isUpper());
                QCOMPARE(part.mid(1), part.mid(1).toLower());
                QVERIFY(fiveWords().words().contains(part.toLower()));
                unique.insert(part.toLower());
            }
            QCOMPARE(unique.size(), qsizetype(4));
        }
    }

    void passphrase_extras_adjacent_to_words()
    {
        PassphraseRequest request;
        request.wordCount = 3;
        request.separator = "_";
        request.capitalize = false;
        request.digitCount = 2;
        request.symbolCount = 1;

        const auto wordlist = twoLetterWordlist();
        for (int i = 0; i < 50; ++i) {
            const auto phrase = generatePassphrase(request, wordlist);
            const auto parts = phrase.split('_');
            QCOMPARE(parts.size(), qsizetype(3));

            for (const auto &part : parts) {
                QCOMPARE(part.size(), qsizetype(3));
                const bool extraFirst = !part.at(0).isLetter();
                const auto word = extraFirst ? part.mid(1) : part.left(2);
                QVERIFY(wordlist.words().contains(word));
            }
            QCOMPARE(countIn(phrase, PassphraseAlphabet::kDigits), 2);
            QCOMPARE(countIn(phrase, PassphraseAlphabet::kSymbols), 1);
        }
    }

    void passphrase_leftover_extras_appended()
    {
        PassphraseRequest request;
        request.wordCount = 1;
        request.separator = "-";
        request.capitalize = false;
        request.digitCount = 2;
        request.symbolCount = 1;

        for (int i = 0; i < 50; ++i) {
            const auto phrase = generatePassphrase(request, fiveWords());
            QVERIFY(!phrase.contains('-'));
            QCOMPARE(countIn(phrase, PassphraseAlphabet::kDigits), 2);
            QCOMPARE(countIn(phrase, PassphraseAlphabet::kSymbols), 1);

            QString letters;
            for (const auto &ch : phrase) {
                if (ch.isLetter())
                    letters.append(ch);
            }
            QVERIFY(fiveWords().words().contains(letters));
            QCOMPARE(phrase.size(), letters.size() + 3);
            QVERIFY(!phrase.at(phrase.size() - 1).isLetter());
            QVERIFY(!phrase.at(phrase.size() - 2).isLetter());
        }
    }

    void passphrase_empty_separator()
    {
        PassphraseRequest request;
        request.wordCount = 3;
        request.separator = QString();
        request.capitalize = true;
        request.digitCount = 0;
        request.symbolCount = 0;

        const auto phrase = generatePassphrase(request, fiveWords());
        QVERIFY(!phrase.isEmpty());
        int uppers = 0;
        for (const auto &ch : phrase) {
            QVERIFY(ch.isLetter());
            if (ch.isUpper())
                uppers++;
        }
        QCOMPARE(uppers, 3);
    }

    void passphrase_single_word_has_no_separator()
    {
        PassphraseRequest request;
        request.wordCount = 1;
        request.separator = "-";
        request.digitCount = 0;
        request.symbolCount = 0;
        request.capitalize = false;

        const auto phrase = generatePassphrase(request, fiveWords());
        QVERIFY(fiveWords().words().contains(phrase));
    }

    void passphrase_is_not_deterministic()
    {
        PassphraseRequest request;
        request.wordCount = 6;
        const auto wordlist = twoLetterWordlist();
        const auto a = generatePassphrase(request, wordlist);
        const auto b = generatePassphrase(request, wordlist);
        QVERIFY(!a.isEmpty());
        QVERIFY(a != b);
    }

    void passphrase_errors()
    {
        PassphraseRequest request;
        request.wordCount = 6;

        GeneratorError tooMany;
        QVERIFY(generatePassphrase(request, fiveWords(), &tooMany).isEmpty());
        QCOMPARE(tooMany.code, GeneratorErrorCode::NotEnoughWords);
        QCOMPARE(tooMany.kind(), GeneratorErrorKind::Validation);

        GeneratorError empty;
        QVERIFY(generatePassphrase(request, Wordlist(), &empty).isEmpty());
        QCOMPARE(empty.code, GeneratorErrorCode::WordlistEmpty);
        QCOMPARE(empty.kind(), GeneratorErrorKind::Validation);

        request.wordCount = 0;
        GeneratorError zero;
        QVERIFY(generatePassphrase(request, Wordlist(), &zero).isEmpty());
        QCOMPARE(zero.kind(), GeneratorErrorKind::InvalidArgument);
    }

    void passphrase_insert_counts_are_bounded()
    {
        PassphraseRequest request;
        request.wordCount = 3;
        request.digitCount = std::numeric_limits<int>::max();
        request.symbolCount = 1;

        GeneratorError digits;
        QVERIFY(generatePassphrase(request, fiveWords(), &digits).isEmpty());
        QCOMPARE(digits.code, GeneratorErrorCode::InvalidArgument);

        request.digitCount = 0;
        request.symbolCount = PassphraseAlphabet::kMaxInserts + 1;
        GeneratorError symbols;
        QVERIFY(generatePassphrase(request, fiveWords(), &symbols).isEmpty());
        QCOMPARE(symbols.code, GeneratorErrorCode::InvalidArgument);

        request.symbolCount = PassphraseAlphabet::kMaxInserts;
        GeneratorError atLimit;
        const auto phrase = generatePassphrase(request, fiveWords(), &atLimit);
        QVERIFY2(!phrase.isEmpty(), qPrintable(atLimit.message));
        QCOMPARE(countIn(phrase, PassphraseAlphabet::kSymbols), PassphraseAlphabet::kMaxInserts);
    }

    void wordlist_parses_plain_and_diceware()
    {
        const QByteArray text = "# comment line\n"
                                "11111\tabacus\n"
                                "11112\tabdomen\n"
                                "\n"
                                "  River  \n"
                                "abacus\n"
                                "don't\n"
                                "caf\xC3\xA9\n"
                                "stone\r\n";

        const auto wordlist = Wordlist::fromText(text);
        QCOMPARE(wordlist.words(), QStringList({"abacus", "abdomen", "river", "stone"}));
        QCOMPARE(Wordlist::fromText(wordlist.toText()).words(), wordlist.words());
    }

    void strength_estimates()
    {
        PasswordRequest request;
        request.length = 16;
        const auto pwd = estimatePasswordStrength(request);
        QVERIFY(pwd.bits > 80.0);
        QVERIFY(pwd.score >= 60);
        QVERIFY(!pwd.label.isEmpty());

        request.length = 2;
        const auto invalid = estimatePasswordStrength(request);
        QCOMPARE(invalid.score, 0);
        QCOMPARE(invalid.label, strengthLabelForScore(0));

        PassphraseRequest phrase;
        phrase.wordCount = 6;
        phrase.digitCount = 0;
        phrase.symbolCount = 0;
        const auto diceware = estimatePassphraseStrength(phrase, 7776);
        QVERIFY(diceware.bits > 77.0 && diceware.bits < 78.0);

        QCOMPARE(estimatePassphraseStrength(phrase, 0).score, 0);
    }
};

QTEST_MAIN(GeneratorUnitTests)

#include "tst_generator_unit.moc"
