#pragma once

#include <QString>

class AppPaths final
{
public:
    static QString appDataDir();
    static QString settingsFilePath();
    static QString logFilePath();
    static QString wordlistCacheFilePath();
};
