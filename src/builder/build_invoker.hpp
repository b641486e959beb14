#pragma once

#include <iostream>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace crystalbuild {

/**
 * Runs mkarchiso against the staged profile.
 *
 * The child's merged stdout/stderr is forwarded to `out` one line at a time
 * as it arrives. The process working directory is switched to the project
 * root for the duration of the call and restored on every exit path.
 */
class BuildInvoker
{
public:
    explicit BuildInvoker(const BuildConfig &config);

    // Full command line, privilege prefix included.
    QStringList command() const;

    // True only when the builder exited normally with status 0.
    bool run(std::ostream &out, QString *error);

    int lastExitCode() const { return m_lastExitCode; }
    int lastLineCount() const { return m_lastLineCount; }

private:
    const BuildConfig &m_config;
    int m_lastExitCode = -1;
    int m_lastLineCount = 0;
};

} // namespace crystalbuild
