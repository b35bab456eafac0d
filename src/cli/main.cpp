#include <QCoreApplication>

#include <vector>

#include "cli/TimekeepCli.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("timekeep"));

    bool trace = timekeep::traceRequestedByEnvironment();
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    timekeep::logging::initLogging(QStringLiteral("timekeep"), trace);
    TIMEKEEP_LOG_DEBUG(QStringLiteral("main"),
                       QStringLiteral("main"),
                       QStringLiteral("cli_start"),
                       QStringLiteral("user_invocation"),
                       QStringLiteral("cli"),
                       timekeep::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"args", filteredArgs.size()}}));

    // CLI entry point: delegate to TimekeepCli for argument parsing and output.
    timekeep::TimekeepCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
