#pragma once

#include "generatorerror.h"

#include <QString>

class RandomSource;

struct PasswordRequest final
{
    int length = 16;
    bool includeLowercase = true;
    bool includeUppercase = true;
    int digitCount = 2;
    int symbolCount = 2;
    bool excludeAmbiguous = true;
    QString customSymbols; // overrides the default symbol set when non-empty; BMP characters only

    // Summed in 64 bits so that huge counts cannot wrap around.
    qint64 minimumLength() const
    {
        return qint64(digitCount) + qint64(symbolCount) + (includeLowercase ? 1 : 0) + (includeUppercase ? 1 : 0);
    }
};

// Per-category character subsets after symbol override and ambiguity filtering.
struct CharacterPool final
{
    QString lowercase;
    QString uppercase;
    QString digits;
    QString symbols;

    // Characters eligible for the free fill positions of the given request.
    QString fillPool(const PasswordRequest &request) const;
};

namespace PasswordAlphabet {

extern const QString kLowercase;
extern const QString kUppercase;
extern const QString kDigits;
extern const QString kDefaultSymbols;
extern const QString kAmbiguous;

CharacterPool resolve(const PasswordRequest &request);

} // namespace PasswordAlphabet

// Runs every check generatePassword() runs, without drawing randomness.
bool validatePasswordRequest(const PasswordRequest &request, GeneratorError *errorOut = nullptr);

QString generatePassword(const PasswordRequest &request, GeneratorError *errorOut = nullptr);
QString generatePassword(const PasswordRequest &request, const RandomSource &random, GeneratorError *errorOut = nullptr);
