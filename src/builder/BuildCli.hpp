#pragma once

#include <optional>
#include <utility>

#include <QString>
#include <QStringList>

#include "builder/privilege_resolver.hpp"
#include "common/models.hpp"

namespace crystalbuild {

class BuildCli
{
public:
    BuildCli();

    // Parses arguments, resolves privileges and runs the pipeline.
    // returns exit code
    int run(int argc, char *argv[]);

    /**
     * Turn the argument list (argv[0] included) into a BuildConfig.
     * Privileges are not resolved here. Returns std::nullopt on a usage
     * error (message in *error) or when --help/--version was handled
     * (*exitEarly set, error empty).
     */
    std::optional<BuildConfig> parseConfig(const QStringList &args,
                                           QString *error,
                                           bool *exitEarly) const;

    void setPrivilegeEnvironment(PrivilegeEnvironment environment) { m_privilegeEnv = std::move(environment); }

    // Directory the relative defaults hang off; the executable's directory
    // unless CRYSTALBUILD_BASE_DIR is set.
    static QString baseDir();

    static QString usageText();

private:
    PrivilegeEnvironment m_privilegeEnv;
};

} // namespace crystalbuild
