#pragma once

#include <functional>
#include <iostream>
#include <optional>

#include <QDate>
#include <QString>

#include "common/models.hpp"

namespace crystalbuild {

struct BuildOutcome {
    QString artifactPath;
    std::optional<QString> checksumPath;
    std::optional<QString> packageListPath;
};

/**
 * BuildPipeline sequences one ISO build:
 *   stage workspace -> mkarchiso -> finalize image -> chown -> package list
 *
 * The privilege prefix in the config must already be resolved. The first
 * fatal failure stops the run; warnings are printed and the run goes on.
 */
class BuildPipeline
{
public:
    explicit BuildPipeline(BuildConfig config);

    // Returns the process exit code.
    int run(std::ostream &out = std::cout, std::ostream &err = std::cerr);

    const BuildConfig &config() const { return m_config; }
    const std::optional<BuildOutcome> &outcome() const { return m_outcome; }

    void setDateProvider(std::function<QDate()> provider);
    void setRsyncAllowed(bool allowed) { m_rsyncAllowed = allowed; }

private:
    int fail(std::ostream &err, const QString &stage, const QString &message);

    BuildConfig m_config;
    std::function<QDate()> m_today;
    bool m_rsyncAllowed = true;
    std::optional<BuildOutcome> m_outcome;
};

} // namespace crystalbuild
