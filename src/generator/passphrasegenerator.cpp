#include "passphrasegenerator.h"

#include "randomsource.h"
#include "wordlist.h"

#include <QStringList>
#include <QVector>

#include <utility>

namespace {

// Partial Fisher-Yates over indices: the first `count` slots end up as a uniform sample without replacement.
QStringList sampleWords(const Wordlist &wordlist, int count, const RandomSource &random)
{
    QVector<qsizetype> indices(wordlist.size());
    for (qsizetype i = 0; i < indices.size(); ++i)
        indices[i] = i;

    QStringList out;
    out.reserve(count);
    for (qsizetype i = 0; i < count; ++i) {
        const auto j = i + random.uniformIndex(indices.size() - i);
        std::swap(indices[i], indices[j]);
        out.push_back(wordlist.at(indices.at(i)));
    }
    return out;
}

QString capitalized(const QString &word)
{
    if (word.isEmpty())
        return word;
    return QString(word.at(0).toUpper()) + word.mid(1);
}

} // namespace

namespace PassphraseAlphabet {

const QString kDigits = QStringLiteral("0123456789");
const QString kSymbols = QStringLiteral("!#$%&*+=?@");

} // namespace PassphraseAlphabet

bool validatePassphraseRequest(const PassphraseRequest &request, qsizetype wordlistSize, GeneratorError *errorOut)
{
    const auto fail = [errorOut](GeneratorErrorCode code, const QString &msg) {
        failGeneration(errorOut, code, msg);
        return false;
    };

    if (request.wordCount < 1)
        return fail(GeneratorErrorCode::InvalidArgument, "单词数量必须 ≥ 1");
    if (request.digitCount < 0 || request.symbolCount < 0)
        return fail(GeneratorErrorCode::InvalidArgument, "数字或符号个数无效");
    if (request.digitCount > PassphraseAlphabet::kMaxInserts || request.symbolCount > PassphraseAlphabet::kMaxInserts)
        return fail(GeneratorErrorCode::InvalidArgument,
                    QString("数字或符号个数不能超过 %1").arg(PassphraseAlphabet::kMaxInserts));
    if (wordlistSize <= 0)
        return fail(GeneratorErrorCode::WordlistEmpty, "词表为空或尚未加载");
    if (request.wordCount > wordlistSize)
        return fail(GeneratorErrorCode::NotEnoughWords,
                    QString("单词数量（%1）超过词表大小（%2）").arg(request.wordCount).arg(wordlistSize));
    return true;
}

QString generatePassphrase(const PassphraseRequest &request, const Wordlist &wordlist, GeneratorError *errorOut)
{
    return generatePassphrase(request, wordlist, RandomSource::system(), errorOut);
}

QString generatePassphrase(const PassphraseRequest &request,
                           const Wordlist &wordlist,
                           const RandomSource &random,
                           GeneratorError *errorOut)
{
    if (!validatePassphraseRequest(request, wordlist.size(), errorOut))
        return QString();

    auto words = sampleWords(wordlist, request.wordCount, random);
    if (request.capitalize) {
        for (auto &word : words)
            word = capitalized(word);
    }

    QString extras;
    extras.reserve(qsizetype(request.digitCount) + request.symbolCount);
    for (int i = 0; i < request.digitCount; ++i)
        extras.append(PassphraseAlphabet::kDigits.at(random.uniformIndex(PassphraseAlphabet::kDigits.size())));
    for (int i = 0; i < request.symbolCount; ++i)
        extras.append(PassphraseAlphabet::kSymbols.at(random.uniformIndex(PassphraseAlphabet::kSymbols.size())));
    random.shuffle(extras);

    qsizetype nextExtra = 0;
    QStringList parts;
    parts.reserve(words.size());
    for (const auto &word : words) {
        if (nextExtra >= extras.size()) {
            parts.push_back(word);
            continue;
        }

        const auto extra = extras.at(nextExtra++);
        parts.push_back(random.coinFlip() ? QString(extra) + word : word + extra);
    }

    auto out = parts.join(request.separator);
    out.append(extras.mid(nextExtra));
    return out;
}
