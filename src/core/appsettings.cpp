#include "appsettings.h"

#include "apppaths.h"

#include <QSettings>

namespace AppSettings {

const char kDefaultWordlistSource[] = "https://www.eff.org/files/2016/07/18/eff_large_wordlist.txt";

PasswordRequest passwordDefaults(QSettings &settings)
{
    PasswordRequest request;
    settings.beginGroup("password");
    request.length = settings.value("length", request.length).toInt();
    request.includeLowercase = settings.value("lowercase", request.includeLowercase).toBool();
    request.includeUppercase = settings.value("uppercase", request.includeUppercase).toBool();
    request.digitCount = settings.value("digits", request.digitCount).toInt();
    request.symbolCount = settings.value("symbols", request.symbolCount).toInt();
    request.excludeAmbiguous = settings.value("excludeAmbiguous", request.excludeAmbiguous).toBool();
    request.customSymbols = settings.value("customSymbols", request.customSymbols).toString();
    settings.endGroup();
    return request;
}

void savePasswordDefaults(QSettings &settings, const PasswordRequest &request)
{
    settings.beginGroup("password");
    settings.setValue("length", request.length);
    settings.setValue("lowercase", request.includeLowercase);
    settings.setValue("uppercase", request.includeUppercase);
    settings.setValue("digits", request.digitCount);
    settings.setValue("symbols", request.symbolCount);
    settings.setValue("excludeAmbiguous", request.excludeAmbiguous);
    settings.setValue("customSymbols", request.customSymbols);
    settings.endGroup();
}

PassphraseRequest passphraseDefaults(QSettings &settings)
{
    PassphraseRequest request;
    settings.beginGroup("passphrase");
    request.wordCount = settings.value("words", request.wordCount).toInt();
    request.separator = settings.value("separator", request.separator).toString();
    request.capitalize = settings.value("capitalize", request.capitalize).toBool();
    request.digitCount = settings.value("digits", request.digitCount).toInt();
    request.symbolCount = settings.value("symbols", request.symbolCount).toInt();
    settings.endGroup();
    return request;
}

void savePassphraseDefaults(QSettings &settings, const PassphraseRequest &request)
{
    settings.beginGroup("passphrase");
    settings.setValue("words", request.wordCount);
    settings.setValue("separator", request.separator);
    settings.setValue("capitalize", request.capitalize);
    settings.setValue("digits", request.digitCount);
    settings.setValue("symbols", request.symbolCount);
    settings.endGroup();
}

PasswordRequest passwordDefaults()
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    return passwordDefaults(settings);
}

void savePasswordDefaults(const PasswordRequest &request)
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    savePasswordDefaults(settings, request);
}

PassphraseRequest passphraseDefaults()
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    return passphraseDefaults(settings);
}

void savePassphraseDefaults(const PassphraseRequest &request)
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    savePassphraseDefaults(settings, request);
}

QString wordlistSource()
{
    const QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    const auto source = settings.value("wordlist/source").toString().trimmed();
    return source.isEmpty() ? QString::fromLatin1(kDefaultWordlistSource) : source;
}

void setWordlistSource(const QString &source)
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    settings.setValue("wordlist/source", source.trimmed());
}

QString logLevel()
{
    const QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    return settings.value("logging/level", "info").toString();
}

void setLogLevel(const QString &level)
{
    QSettings settings(AppPaths::settingsFilePath(), QSettings::IniFormat);
    settings.setValue("logging/level", level);
}

} // namespace AppSettings
