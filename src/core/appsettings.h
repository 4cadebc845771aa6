#pragma once

#include "generator/passphrasegenerator.h"
#include "generator/passwordgenerator.h"

#include <QString>

class QSettings;

namespace AppSettings {

extern const char kDefaultWordlistSource[];

// Defaults live in AppPaths::settingsFilePath() (INI). Missing keys fall back to the
// PasswordRequest / PassphraseRequest member defaults.
PasswordRequest passwordDefaults();
void savePasswordDefaults(const PasswordRequest &request);

PassphraseRequest passphraseDefaults();
void savePassphraseDefaults(const PassphraseRequest &request);

// URL (http, https, file) or local path.
QString wordlistSource();
void setWordlistSource(const QString &source);

QString logLevel();
void setLogLevel(const QString &level);

// Overloads taking an explicit store, used by tests and by callers that batch writes.
PasswordRequest passwordDefaults(QSettings &settings);
void savePasswordDefaults(QSettings &settings, const PasswordRequest &request);
PassphraseRequest passphraseDefaults(QSettings &settings);
void savePassphraseDefaults(QSettings &settings, const PassphraseRequest &request);

} // namespace AppSettings
