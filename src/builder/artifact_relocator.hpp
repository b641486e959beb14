#pragma once

#include <optional>

#include <QString>

#include "common/models.hpp"

namespace crystalbuild {

// Where mkarchiso leaves the package manifest inside work_dir.
QString packageListSourcePath(const QString &workDir);

// "<output>/<image stem>.pkgs.txt"
QString packageListDestinationPath(const QString &outputDir, const QString &artifactPath);

/**
 * Copy the package manifest next to the final image.
 * Returns the destination, or std::nullopt with *error set. Callers treat a
 * missing manifest as a warning.
 */
std::optional<QString> relocatePackageList(const BuildConfig &config,
                                           const QString &artifactPath,
                                           QString *error);

} // namespace crystalbuild
