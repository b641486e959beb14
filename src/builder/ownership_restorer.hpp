#pragma once

#include <QString>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace crystalbuild {

/**
 * chown -R the output directory back to the user that invoked sudo/doas.
 *
 * Returns true when there is nothing to do. A false return is only a
 * warning for the caller: the image is usable either way.
 */
bool restoreOwnership(const BuildConfig &config, QString *error);

} // namespace crystalbuild
