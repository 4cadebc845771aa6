#include "passforgecli.h"

#include "core/appsettings.h"
#include "generator/secretstrength.h"
#include "generator/wordlistcache.h"

#include <QCommandLineParser>
#include <QDebug>
#include <QEventLoop>
#include <QTextStream>

namespace PassforgeCli {

namespace {

bool intOption(const QCommandLineParser &parser, const QCommandLineOption &option, int &value, QString *errorOut)
{
    if (!parser.isSet(option))
        return true;

    bool ok = false;
    const auto parsed = parser.value(option).toInt(&ok);
    if (!ok) {
        if (errorOut)
            *errorOut = QString("参数 --%1 需要整数：%2").arg(option.names().first(), parser.value(option));
        return false;
    }
    value = parsed;
    return true;
}

void printSecret(QTextStream &out, const QString &secret, const SecretStrength *strength)
{
    out << secret;
    if (strength)
        out << QString("\t%1(%2, %3 bits)").arg(strength->label).arg(strength->score).arg(strength->bits, 0, 'f', 1);
    out << Qt::endl;
}

} // namespace

void Options::addTo(QCommandLineParser &parser) const
{
    parser.addOptions({length,
                       noLower,
                       noUpper,
                       digits,
                       symbols,
                       symbolSet,
                       allowAmbiguous,
                       words,
                       separator,
                       noCapitalize,
                       wordlist,
                       count,
                       strength,
                       saveDefaults,
                       verbose});
}

std::optional<Mode> parseMode(const QStringList &positional, QString *errorOut)
{
    if (positional.isEmpty())
        return Mode::Password;

    const auto mode = positional.first().toLower();
    if (positional.size() == 1 && mode == "password")
        return Mode::Password;
    if (positional.size() == 1 && mode == "passphrase")
        return Mode::Passphrase;

    if (errorOut)
        *errorOut = QString("未知模式：%1").arg(positional.join(' '));
    return std::nullopt;
}

bool applyPasswordOptions(const QCommandLineParser &parser, const Options &opts, PasswordRequest &request, QString *errorOut)
{
    if (!intOption(parser, opts.length, request.length, errorOut))
        return false;
    if (!intOption(parser, opts.digits, request.digitCount, errorOut))
        return false;
    if (!intOption(parser, opts.symbols, request.symbolCount, errorOut))
        return false;

    if (parser.isSet(opts.noLower))
        request.includeLowercase = false;
    if (parser.isSet(opts.noUpper))
        request.includeUppercase = false;
    if (parser.isSet(opts.allowAmbiguous))
        request.excludeAmbiguous = false;
    if (parser.isSet(opts.symbolSet))
        request.customSymbols = parser.value(opts.symbolSet);
    return true;
}

bool applyPassphraseOptions(const QCommandLineParser &parser, const Options &opts, PassphraseRequest &request, QString *errorOut)
{
    if (!intOption(parser, opts.words, request.wordCount, errorOut))
        return false;
    if (!intOption(parser, opts.digits, request.digitCount, errorOut))
        return false;
    if (!intOption(parser, opts.symbols, request.symbolCount, errorOut))
        return false;

    if (parser.isSet(opts.separator))
        request.separator = parser.value(opts.separator);
    if (parser.isSet(opts.noCapitalize))
        request.capitalize = false;
    return true;
}

int runPassword(const QCommandLineParser &parser, const Options &opts, int count, QTextStream &out, QTextStream &err)
{
    auto request = AppSettings::passwordDefaults();

    QString usageError;
    if (!applyPasswordOptions(parser, opts, request, &usageError)) {
        err << usageError << Qt::endl;
        return kExitUsage;
    }

    GeneratorError error;
    if (!validatePasswordRequest(request, &error)) {
        qWarning() << "Password request rejected:" << static_cast<int>(error.code);
        err << error.message << Qt::endl;
        return kExitFailed;
    }

    if (parser.isSet(opts.saveDefaults))
        AppSettings::savePasswordDefaults(request);

    const auto strength = estimatePasswordStrength(request);
    for (int i = 0; i < count; ++i) {
        const auto pwd = generatePassword(request, &error);
        if (pwd.isEmpty()) {
            err << (error.message.isEmpty() ? QString("生成失败") : error.message) << Qt::endl;
            return kExitFailed;
        }
        printSecret(out, pwd, parser.isSet(opts.strength) ? &strength : nullptr);
    }

    qInfo() << "Generated" << count << "password(s), length" << request.length;
    return kExitOk;
}

int runPassphrase(const QCommandLineParser &parser, const Options &opts, int count, QTextStream &out, QTextStream &err)
{
    auto request = AppSettings::passphraseDefaults();

    QString usageError;
    if (!applyPassphraseOptions(parser, opts, request, &usageError)) {
        err << usageError << Qt::endl;
        return kExitUsage;
    }

    // Structural problems are reported before any download starts.
    GeneratorError error;
    if (!validatePassphraseRequest(request, qMax(request.wordCount, 1), &error)) {
        err << error.message << Qt::endl;
        return kExitFailed;
    }

    const auto source = parser.isSet(opts.wordlist) ? parser.value(opts.wordlist) : AppSettings::wordlistSource();
    if (parser.isSet(opts.saveDefaults)) {
        AppSettings::savePassphraseDefaults(request);
        if (parser.isSet(opts.wordlist))
            AppSettings::setWordlistSource(source);
    }

    WordlistCache cache(WordlistCache::createProvider(source));
    QEventLoop loop;
    int exitCode = kExitFailed;

    QObject::connect(&cache, &WordlistCache::failed, &loop, [&](const QString &message) {
        err << message << Qt::endl;
        exitCode = kExitFailed;
        loop.quit();
    });

    QObject::connect(&cache, &WordlistCache::ready, &loop, [&]() {
        const auto &wordlist = cache.wordlist();
        const auto strength = estimatePassphraseStrength(request, wordlist.size());

        exitCode = kExitOk;
        for (int i = 0; i < count; ++i) {
            const auto phrase = generatePassphrase(request, wordlist, &error);
            if (phrase.isEmpty()) {
                err << (error.message.isEmpty() ? QString("生成失败") : error.message) << Qt::endl;
                exitCode = kExitFailed;
                break;
            }
            printSecret(out, phrase, parser.isSet(opts.strength) ? &strength : nullptr);
        }

        if (exitCode == kExitOk)
            qInfo() << "Generated" << count << "passphrase(s) of" << request.wordCount << "words";
        loop.quit();
    });

    // ready/failed are always delivered through the event loop, never from inside ensureLoaded().
    cache.ensureLoaded();
    loop.exec();
    return exitCode;
}

int run(const QCommandLineParser &parser, const Options &opts, QTextStream &out, QTextStream &err)
{
    QString usageError;
    const auto mode = parseMode(parser.positionalArguments(), &usageError);
    if (!mode) {
        err << usageError << Qt::endl;
        return kExitUsage;
    }

    int count = 1;
    if (!intOption(parser, opts.count, count, &usageError)) {
        err << usageError << Qt::endl;
        return kExitUsage;
    }
    if (count < 1) {
        err << "生成数量必须 ≥ 1" << Qt::endl;
        return kExitUsage;
    }

    qDebug() << "Mode" << static_cast<int>(*mode) << "count" << count;

    if (*mode == Mode::Passphrase)
        return runPassphrase(parser, opts, count, out, err);
    return runPassword(parser, opts, count, out, err);
}

} // namespace PassforgeCli
