#pragma once

#include <functional>
#include <optional>

#include <QString>

#include "common/models.hpp"

namespace crystalbuild {

struct PrivilegeEnvironment {
    std::function<bool()> isSuperuser;
    std::function<bool(const QString &)> hasExecutable;

    // geteuid() and a PATH lookup.
    static PrivilegeEnvironment system();
};

/**
 * Decide how privileged commands are run.
 *
 * - already root: empty prefix, no helper lookup
 * - otherwise the first of doas, sudo found on PATH
 * - std::nullopt when neither helper exists; callers must abort
 */
std::optional<PrivilegeCommand> resolvePrivilegeCommand(
    const PrivilegeEnvironment &environment = PrivilegeEnvironment::system());

} // namespace crystalbuild
