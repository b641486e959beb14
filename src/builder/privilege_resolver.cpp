#include "builder/privilege_resolver.hpp"

#include <unistd.h>

#include <QStringList>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

PrivilegeEnvironment PrivilegeEnvironment::system()
{
    PrivilegeEnvironment environment;
    environment.isSuperuser = []() { return geteuid() == 0; };
    environment.hasExecutable = [](const QString &name) { return commandExists(name); };
    return environment;
}

std::optional<PrivilegeCommand> resolvePrivilegeCommand(const PrivilegeEnvironment &environment)
{
    if (environment.isSuperuser()) {
        CBLOG_INFO(QStringLiteral("PrivilegeResolver"),
                   QStringLiteral("resolvePrivilegeCommand"),
                   QStringLiteral("privilege_not_needed"),
                   QStringLiteral("euid_zero"),
                   QStringLiteral("geteuid"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return PrivilegeCommand{};
    }

    // Preference order matters: doas, then sudo.
    const QStringList helpers = {QStringLiteral("doas"), QStringLiteral("sudo")};
    for (const QString &helper : helpers) {
        if (!environment.hasExecutable(helper)) {
            continue;
        }

        CBLOG_INFO(QStringLiteral("PrivilegeResolver"),
                   QStringLiteral("resolvePrivilegeCommand"),
                   QStringLiteral("privilege_helper_selected"),
                   QStringLiteral("not_root"),
                   QStringLiteral("path_lookup"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"helper", helper.toStdString()}}));

        PrivilegeCommand command;
        command.prefix = QStringList{helper};
        command.helper = helper;
        return command;
    }

    CBLOG_ERROR(QStringLiteral("PrivilegeResolver"),
                QStringLiteral("resolvePrivilegeCommand"),
                QStringLiteral("privilege_helper_missing"),
                QStringLiteral("not_root"),
                QStringLiteral("path_lookup"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"candidates", {"doas", "sudo"}}}));
    return std::nullopt;
}

} // namespace crystalbuild
