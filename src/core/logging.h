#pragma once

#include <QtGlobal>

class QMessageLogContext;
class QString;

struct LoggingOptions final
{
    QtMsgType minimumLevel = QtInfoMsg;
    bool echoToStderr = false;
};

class Logging final
{
public:
    static void init(const LoggingOptions &options = {});

    // Accepts "debug", "info", "warning", "critical"; anything else falls back to info.
    static QtMsgType levelFromString(const QString &name);
    static bool isEnabled(QtMsgType type);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
};
