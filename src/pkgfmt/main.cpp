#include <QCoreApplication>

#include "common/logging.hpp"
#include "pkgfmt/FormatCli.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("crystal-pkgfmt"));

    bool trace = qEnvironmentVariableIntValue("CRYSTALBUILD_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    crystalbuild::logging::initLogging(QStringLiteral("crystal-pkgfmt"), trace);
    CBLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("pkgfmt_start"),
                QStringLiteral("user_invocation"),
                QStringLiteral("cli"),
                crystalbuild::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"args", argc - 1}}));

    crystalbuild::FormatCli cli;
    return cli.run(argc, argv);
}
