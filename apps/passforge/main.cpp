#include "cli/passforgecli.h"
#include "core/appsettings.h"
#include "core/logging.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName("Passforge");
    QCoreApplication::setApplicationName("passforge");
    QCoreApplication::setApplicationVersion("1.0");

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("生成随机密码或口令短语。");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("mode", "password（默认）或 passphrase。", "[password|passphrase]");

    const PassforgeCli::Options opts;
    opts.addTo(parser);
    parser.process(app);

    LoggingOptions logOptions;
    logOptions.minimumLevel = Logging::levelFromString(AppSettings::logLevel());
    if (parser.isSet(opts.verbose)) {
        logOptions.minimumLevel = QtDebugMsg;
        logOptions.echoToStderr = true;
    }
    Logging::init(logOptions);

    QTextStream out(stdout);
    QTextStream err(stderr);
    return PassforgeCli::run(parser, opts, out, err);
}
