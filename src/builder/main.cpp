#include <QCoreApplication>

#include "builder/BuildCli.hpp"
#include "common/crystalbuild_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("crystal-build"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CRYSTALBUILD_VERSION));

    bool trace = qEnvironmentVariableIntValue("CRYSTALBUILD_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    crystalbuild::logging::initLogging(QStringLiteral("crystal-build"), trace);
    CBLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("build_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               crystalbuild::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", argc - 1},
                               {"version", CRYSTALBUILD_VERSION}}));

    // The pipeline is synchronous; no event loop is needed.
    crystalbuild::BuildCli cli;
    return cli.run(argc, argv);
}
