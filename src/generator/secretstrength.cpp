#include "secretstrength.h"

#include "passphrasegenerator.h"
#include "passwordgenerator.h"

#include <QtMath>

#include <cmath>

namespace {

// 128 bits and above is treated as the top of the scale.
constexpr double kFullScoreBits = 128.0;

SecretStrength fromBits(double bits)
{
    const auto score = qBound(0, qRound(bits * 100.0 / kFullScoreBits), 100);
    return {bits, score, strengthLabelForScore(score)};
}

} // namespace

QString strengthLabelForScore(int score)
{
    if (score < 20)
        return "极弱";
    if (score < 40)
        return "弱";
    if (score < 60)
        return "一般";
    if (score < 80)
        return "强";
    return "很强";
}

SecretStrength estimatePasswordStrength(const PasswordRequest &request)
{
    if (!validatePasswordRequest(request))
        return fromBits(0.0);

    const auto pool = PasswordAlphabet::resolve(request).fillPool(request);
    if (pool.size() < 2)
        return fromBits(0.0);

    return fromBits(request.length * std::log2(static_cast<double>(pool.size())));
}

SecretStrength estimatePassphraseStrength(const PassphraseRequest &request, qsizetype wordlistSize)
{
    if (!validatePassphraseRequest(request, wordlistSize))
        return fromBits(0.0);

    // Ordered selection of distinct words: log2(n! / (n - k)!).
    double bits = 0.0;
    for (int i = 0; i < request.wordCount; ++i)
        bits += std::log2(static_cast<double>(wordlistSize - i));

    bits += request.digitCount * std::log2(static_cast<double>(PassphraseAlphabet::kDigits.size()));
    bits += request.symbolCount * std::log2(static_cast<double>(PassphraseAlphabet::kSymbols.size()));

    // One fair coin per word that receives an extra.
    bits += qMin(request.wordCount, request.digitCount + request.symbolCount);

    return fromBits(bits);
}
