#pragma once

#include <QtGlobal>
#include <QString>

struct PassphraseRequest;
struct PasswordRequest;

struct SecretStrength final
{
    double bits = 0.0; // entropy of the generation process, not of a particular output
    int score = 0;     // 0~100
    QString label;
};

SecretStrength estimatePasswordStrength(const PasswordRequest &request);
SecretStrength estimatePassphraseStrength(const PassphraseRequest &request, qsizetype wordlistSize);

QString strengthLabelForScore(int score);
