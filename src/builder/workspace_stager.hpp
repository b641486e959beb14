#pragma once

#include <QDate>
#include <QString>

#include "common/models.hpp"

namespace crystalbuild {

enum class StagingMethod {
    None,
    Rsync,
    Copy
};

/**
 * WorkspaceStager prepares work_dir before the builder runs:
 * - creates work_dir and output_dir
 * - optionally wipes work_dir (through the privilege prefix, since an earlier
 *   build leaves root-owned files behind)
 * - mirrors the profile into work_dir/archiso
 * - writes the version stamp into the staged airootfs
 *
 * Every operation returns false and fills *error on failure.
 */
class WorkspaceStager
{
public:
    explicit WorkspaceStager(const BuildConfig &config);

    bool ensureDirectories(QString *error);

    // No-op unless the config asks for a clean build.
    bool cleanWorkDir(QString *error);

    // rsync when available, recursive copy otherwise.
    bool stageProfile(QString *error);

    bool mirrorWithRsync(QString *error);
    bool mirrorWithCopy(QString *error);

    bool stampVersion(const QDate &date, QString *error);

    StagingMethod lastStagingMethod() const { return m_lastMethod; }
    void setRsyncAllowed(bool allowed) { m_rsyncAllowed = allowed; }

    QString versionFilePath() const;

    static QString versionToken(const QDate &date);

private:
    const BuildConfig &m_config;
    StagingMethod m_lastMethod = StagingMethod::None;
    bool m_rsyncAllowed = true;
};

} // namespace crystalbuild
