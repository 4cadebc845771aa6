#pragma once

#include "generatorerror.h"

#include <QString>

class RandomSource;
class Wordlist;

struct PassphraseRequest final
{
    int wordCount = 4;
    QString separator = QStringLiteral("-");
    bool capitalize = true;
    int digitCount = 1;  // digits placed next to words
    int symbolCount = 1; // symbols placed next to words
};

namespace PassphraseAlphabet {

extern const QString kDigits;
extern const QString kSymbols;

// Upper bound for digitCount and symbolCount each.
constexpr int kMaxInserts = 256;

} // namespace PassphraseAlphabet

bool validatePassphraseRequest(const PassphraseRequest &request, qsizetype wordlistSize, GeneratorError *errorOut = nullptr);

// The wordlist is only read for the duration of the call.
QString generatePassphrase(const PassphraseRequest &request, const Wordlist &wordlist, GeneratorError *errorOut = nullptr);
QString generatePassphrase(const PassphraseRequest &request,
                           const Wordlist &wordlist,
                           const RandomSource &random,
                           GeneratorError *errorOut = nullptr);
