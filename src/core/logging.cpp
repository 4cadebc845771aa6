#include "logging.h"

#include "apppaths.h"

#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QStringConverter>
#include <QTextStream>

#include <cstdlib>

static QMutex g_logMutex;
static bool g_initialized = false;
static LoggingOptions g_options;

namespace {

// QtMsgType is not ordered by severity (QtInfoMsg was appended later).
int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
        return 4;
    default:
        return 1;
    }
}

QString levelToString(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARN";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "FATAL";
    default:
        return "LOG";
    }
}

} // namespace

void Logging::init(const LoggingOptions &options)
{
    QMutexLocker locker(&g_logMutex);
    g_options = options;
    if (g_initialized)
        return;
    g_initialized = true;
    qInstallMessageHandler(&Logging::messageHandler);
}

QtMsgType Logging::levelFromString(const QString &name)
{
    const auto n = name.trimmed().toLower();
    if (n == "debug")
        return QtDebugMsg;
    if (n == "warning" || n == "warn")
        return QtWarningMsg;
    if (n == "critical" || n == "error")
        return QtCriticalMsg;
    return QtInfoMsg;
}

bool Logging::isEnabled(QtMsgType type)
{
    QMutexLocker locker(&g_logMutex);
    return type == QtFatalMsg || severity(type) >= severity(g_options.minimumLevel);
}

void Logging::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (!isEnabled(type))
        return;

    QMutexLocker locker(&g_logMutex);

    const auto ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString line = QString("%1 [%2] %3").arg(ts, levelToString(type), msg);
    if (context.file && context.line > 0)
        line += QString(" (%1:%2)").arg(QString::fromUtf8(context.file)).arg(context.line);

    if (g_options.echoToStderr) {
        QTextStream err(stderr);
        err.setEncoding(QStringConverter::Utf8);
        err << line << Qt::endl;
    }

    QFile file(AppPaths::logFilePath());
    if (file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        QTextStream out(&file);
        out.setEncoding(QStringConverter::Utf8);
        out << line << "\n";
    }

    if (type == QtFatalMsg)
        abort();
}
