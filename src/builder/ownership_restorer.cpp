#include "builder/ownership_restorer.hpp"

#include <QStringList>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

bool restoreOwnership(const BuildConfig &config, QString *error)
{
    const QString user = originalInvokingUser();
    if (user.isEmpty()) {
        CBLOG_INFO(QStringLiteral("OwnershipRestorer"),
                   QStringLiteral("restoreOwnership"),
                   QStringLiteral("ownership_skipped"),
                   QStringLiteral("no_original_user"),
                   QStringLiteral("env_lookup"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return true;
    }

    const QStringList command = config.privilege.apply(
        {QStringLiteral("chown"), QStringLiteral("-R"), user, config.outputDir});

    QString output;
    const int exitCode = runCommand(command, &output);
    if (exitCode != 0) {
        if (error) {
            *error = QStringLiteral("Could not change ownership of %1 to '%2' (exit %3): %4")
                         .arg(config.outputDir, user)
                         .arg(exitCode)
                         .arg(output);
        }
        CBLOG_WARN(QStringLiteral("OwnershipRestorer"),
                   QStringLiteral("restoreOwnership"),
                   QStringLiteral("ownership_failed"),
                   QStringLiteral("chown_nonzero"),
                   QStringLiteral("chown_r"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"user", user.toStdString()},
                                   {"exitCode", exitCode}}));
        return false;
    }

    CBLOG_INFO(QStringLiteral("OwnershipRestorer"),
               QStringLiteral("restoreOwnership"),
               QStringLiteral("ownership_restored"),
               QStringLiteral("elevated_build"),
               QStringLiteral("chown_r"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"user", user.toStdString()},
                               {"outputDir", config.outputDir.toStdString()}}));
    return true;
}

} // namespace crystalbuild
