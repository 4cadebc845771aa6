#include "passwordgenerator.h"

#include "randomsource.h"

namespace {

// Whitespace is never a usable symbol; duplicates would skew the draw.
QString cleanSymbols(const QString &chars)
{
    QString out;
    out.reserve(chars.size());
    for (const auto &ch : chars) {
        if (!ch.isSpace() && !out.contains(ch))
            out.append(ch);
    }
    return out;
}

QString filterAmbiguous(const QString &chars, bool exclude)
{
    if (!exclude)
        return chars;

    QString out;
    out.reserve(chars.size());
    for (const auto &ch : chars) {
        if (!PasswordAlphabet::kAmbiguous.contains(ch))
            out.append(ch);
    }
    return out;
}

void appendRandom(QString &out, const QString &chars, int count, const RandomSource &random)
{
    for (int i = 0; i < count; ++i)
        out.append(chars.at(random.uniformIndex(chars.size())));
}

} // namespace

namespace PasswordAlphabet {

const QString kLowercase = QStringLiteral("abcdefghijklmnopqrstuvwxyz");
const QString kUppercase = QStringLiteral("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
const QString kDigits = QStringLiteral("0123456789");
const QString kDefaultSymbols = QStringLiteral("!@#$%^&*()-_=+[]{};:,.?/\\|~");
const QString kAmbiguous = QStringLiteral("l1IO0");

CharacterPool resolve(const PasswordRequest &request)
{
    CharacterPool pool;
    pool.lowercase = filterAmbiguous(kLowercase, request.excludeAmbiguous);
    pool.uppercase = filterAmbiguous(kUppercase, request.excludeAmbiguous);
    pool.digits = filterAmbiguous(kDigits, request.excludeAmbiguous);
    // Symbols are never filtered for ambiguity.
    pool.symbols = request.customSymbols.isEmpty() ? kDefaultSymbols : cleanSymbols(request.customSymbols);
    return pool;
}

} // namespace PasswordAlphabet

QString CharacterPool::fillPool(const PasswordRequest &request) const
{
    QString all;
    if (request.includeLowercase)
        all.append(lowercase);
    if (request.includeUppercase)
        all.append(uppercase);
    if (request.digitCount > 0)
        all.append(digits);
    if (request.symbolCount > 0)
        all.append(symbols);
    return all;
}

bool validatePasswordRequest(const PasswordRequest &request, GeneratorError *errorOut)
{
    const auto fail = [errorOut](GeneratorErrorCode code, const QString &msg) {
        failGeneration(errorOut, code, msg);
        return false;
    };

    if (request.length < 0)
        return fail(GeneratorErrorCode::InvalidArgument, "长度无效");
    if (request.digitCount < 0 || request.symbolCount < 0)
        return fail(GeneratorErrorCode::InvalidArgument, "数字或符号个数无效");

    // Each password character is one UTF-16 unit, so surrogate pairs cannot be drawn as symbols.
    for (const auto &ch : request.customSymbols) {
        if (ch.isSurrogate())
            return fail(GeneratorErrorCode::InvalidArgument, "自定义符号只支持基本多文种平面内的字符");
    }

    const auto pool = PasswordAlphabet::resolve(request);

    if (request.digitCount > 0 && pool.digits.isEmpty())
        return fail(GeneratorErrorCode::CategoryEmpty, "数字字符集为空");
    if (request.symbolCount > 0 && pool.symbols.isEmpty())
        return fail(GeneratorErrorCode::CategoryEmpty, "符号字符集为空");
    if (request.includeLowercase && pool.lowercase.isEmpty())
        return fail(GeneratorErrorCode::CategoryEmpty, "小写字符集为空");
    if (request.includeUppercase && pool.uppercase.isEmpty())
        return fail(GeneratorErrorCode::CategoryEmpty, "大写字符集为空");

    if (request.digitCount > request.length || request.symbolCount > request.length)
        return fail(GeneratorErrorCode::LengthTooShort, QString("长度（%1）小于数字或符号个数").arg(request.length));

    const qint64 minimum = request.minimumLength();
    if (request.length < minimum)
        return fail(GeneratorErrorCode::LengthTooShort, QString("长度必须 ≥ %1（必选字符数量）").arg(minimum));

    if (minimum == 0)
        return fail(GeneratorErrorCode::NothingSelected, "请至少选择一种字符类型");

    // Non-empty whenever minimum > 0, because every selected category resolved non-empty above.
    if (pool.fillPool(request).isEmpty())
        return fail(GeneratorErrorCode::NothingSelected, "可用字符为空");

    return true;
}

QString generatePassword(const PasswordRequest &request, GeneratorError *errorOut)
{
    return generatePassword(request, RandomSource::system(), errorOut);
}

QString generatePassword(const PasswordRequest &request, const RandomSource &random, GeneratorError *errorOut)
{
    if (!validatePasswordRequest(request, errorOut))
        return QString();

    const auto pool = PasswordAlphabet::resolve(request);
    const auto all = pool.fillPool(request);

    QString out;
    out.reserve(request.length);

    appendRandom(out, pool.digits, request.digitCount, random);
    appendRandom(out, pool.symbols, request.symbolCount, random);
    if (request.includeLowercase)
        appendRandom(out, pool.lowercase, 1, random);
    if (request.includeUppercase)
        appendRandom(out, pool.uppercase, 1, random);

    appendRandom(out, all, request.length - static_cast<int>(out.size()), random);

    random.shuffle(out);
    return out;
}
