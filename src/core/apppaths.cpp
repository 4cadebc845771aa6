#include "apppaths.h"

#include <QDir>
#include <QStandardPaths>

QString AppPaths::appDataDir()
{
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(base);
    return base;
}

QString AppPaths::settingsFilePath()
{
    return QDir(appDataDir()).filePath("passforge.ini");
}

QString AppPaths::logFilePath()
{
    const auto logsDir = QDir(appDataDir()).filePath("logs");
    QDir().mkpath(logsDir);
    return QDir(logsDir).filePath("passforge.log");
}

QString AppPaths::wordlistCacheFilePath()
{
    return QDir(appDataDir()).filePath("wordlist-cache.txt");
}
