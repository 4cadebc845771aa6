#pragma once

#include <QString>

enum class GeneratorErrorKind : int
{
    None = 0,
    InvalidArgument = 1,
    Validation = 2,
};

enum class GeneratorErrorCode : int
{
    None = 0,
    InvalidArgument = 1,

    // Password requests
    CategoryEmpty = 10,
    LengthTooShort = 11,
    NothingSelected = 12,

    // Passphrase requests
    WordlistEmpty = 20,
    NotEnoughWords = 21,
};

struct GeneratorError final
{
    GeneratorErrorCode code = GeneratorErrorCode::None;
    QString message;

    bool isError() const { return code != GeneratorErrorCode::None; }

    GeneratorErrorKind kind() const
    {
        switch (code) {
        case GeneratorErrorCode::None:
            return GeneratorErrorKind::None;
        case GeneratorErrorCode::InvalidArgument:
            return GeneratorErrorKind::InvalidArgument;
        default:
            return GeneratorErrorKind::Validation;
        }
    }
};

// Fills *errorOut (if given) and returns an empty string, so call sites can `return failGeneration(...)`.
inline QString failGeneration(GeneratorError *errorOut, GeneratorErrorCode code, const QString &message)
{
    if (errorOut) {
        errorOut->code = code;
        errorOut->message = message;
    }
    return QString();
}
