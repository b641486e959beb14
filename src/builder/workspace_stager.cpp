#include "builder/workspace_stager.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace fs = std::filesystem;

namespace {

const QString kVcsDirName = QStringLiteral(".git");

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

struct PendingMode {
    fs::path path;
    fs::perms perms;
};

// Directories are created writable and only receive their source mode once
// the walk is done, so read-only profile directories can still be filled.
bool copyEntry(const fs::directory_entry &entry, const fs::path &target,
               std::vector<PendingMode> &pendingDirs, std::error_code &ec)
{
    if (entry.is_symlink(ec)) {
        fs::copy_symlink(entry.path(), target, ec);
        return !ec;
    }
    const fs::perms perms = fs::status(entry.path(), ec).permissions();
    if (ec) {
        return false;
    }
    if (entry.is_directory(ec)) {
        fs::create_directory(target, ec);
        if (ec) {
            return false;
        }
        pendingDirs.push_back({target, perms});
        return true;
    }
    fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }
    fs::permissions(target, perms, ec);
    return !ec;
}

// An earlier copy may contain read-only directories that remove_all cannot empty.
void makeTreeRemovable(const fs::path &root, std::error_code &ec)
{
    if (!fs::is_directory(fs::symlink_status(root, ec)) || ec) {
        ec.clear();
        return;
    }
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
    }
}

} // namespace

WorkspaceStager::WorkspaceStager(const BuildConfig &config)
    : m_config(config)
{
}

bool WorkspaceStager::ensureDirectories(QString *error)
{
    const QFileInfo workInfo(m_config.workDir);
    QDir dir;
    if (!dir.mkpath(workInfo.absolutePath())
        || !dir.mkpath(m_config.workDir)
        || !dir.mkpath(m_config.outputDir)) {
        setError(error, QStringLiteral("could not create %1 or %2")
                            .arg(m_config.workDir, m_config.outputDir));
        return false;
    }

    if (!QFileInfo(m_config.profileSourceDir).isDir()) {
        setError(error, QStringLiteral("Archiso source directory not found at %1")
                            .arg(m_config.profileSourceDir));
        return false;
    }
    return true;
}

bool WorkspaceStager::cleanWorkDir(QString *error)
{
    if (!m_config.clean || !QFileInfo::exists(m_config.workDir)) {
        return true;
    }

    CBLOG_INFO(QStringLiteral("WorkspaceStager"),
               QStringLiteral("cleanWorkDir"),
               QStringLiteral("clean_work_dir"),
               QStringLiteral("clean_requested"),
               QStringLiteral("rm_rf"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"workDir", m_config.workDir.toStdString()},
                               {"helper", m_config.privilege.helper.toStdString()}}));

    QString output;
    const QStringList command = m_config.privilege.apply(
        {QStringLiteral("rm"), QStringLiteral("-rf"), m_config.workDir});
    const int exitCode = runCommand(command, &output);
    if (exitCode != 0) {
        setError(error, QStringLiteral("'%1' failed (exit %2): %3")
                            .arg(joinCommand(command))
                            .arg(exitCode)
                            .arg(output));
        return false;
    }

    if (!QDir().mkpath(m_config.workDir)) {
        setError(error, QStringLiteral("could not recreate %1").arg(m_config.workDir));
        return false;
    }
    return true;
}

bool WorkspaceStager::stageProfile(QString *error)
{
    m_lastMethod = StagingMethod::None;

    if (!QFileInfo(m_config.profileSourceDir).isDir()) {
        setError(error, QStringLiteral("Archiso source directory not found at %1")
                            .arg(m_config.profileSourceDir));
        return false;
    }

    if (m_rsyncAllowed && commandExists(QStringLiteral("rsync"))) {
        QString rsyncError;
        if (mirrorWithRsync(&rsyncError)) {
            return true;
        }
        CBLOG_WARN(QStringLiteral("WorkspaceStager"),
                   QStringLiteral("stageProfile"),
                   QStringLiteral("rsync_failed"),
                   QStringLiteral("nonzero_exit"),
                   QStringLiteral("fallback_copy"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", rsyncError.toStdString()}}));
    }

    return mirrorWithCopy(error);
}

bool WorkspaceStager::mirrorWithRsync(QString *error)
{
    const QString target = m_config.stagedProfileDir();
    if (!QDir().mkpath(target)) {
        setError(error, QStringLiteral("could not create %1").arg(target));
        return false;
    }

    // Trailing slash: copy the contents of the profile, not the directory itself.
    const QStringList command = {
        QStringLiteral("rsync"),
        QStringLiteral("-a"),
        QStringLiteral("--delete"),
        QStringLiteral("--exclude"),
        kVcsDirName,
        m_config.profileSourceDir + QChar('/'),
        target,
    };

    QString output;
    const int exitCode = runCommand(command, &output);
    if (exitCode != 0) {
        setError(error, QStringLiteral("rsync exited with %1: %2").arg(exitCode).arg(output));
        return false;
    }

    m_lastMethod = StagingMethod::Rsync;
    return true;
}

bool WorkspaceStager::mirrorWithCopy(QString *error)
{
    const fs::path source(m_config.profileSourceDir.toStdString());
    const fs::path target(m_config.stagedProfileDir().toStdString());

    std::error_code ec;
    makeTreeRemovable(target, ec);
    if (!ec) {
        fs::remove_all(target, ec);
    }
    if (ec) {
        setError(error, QStringLiteral("could not remove stale %1: %2")
                            .arg(QString::fromStdString(target.string()),
                                 QString::fromStdString(ec.message())));
        return false;
    }

    fs::create_directories(target, ec);
    if (ec) {
        setError(error, QStringLiteral("could not create %1: %2")
                            .arg(QString::fromStdString(target.string()),
                                 QString::fromStdString(ec.message())));
        return false;
    }

    std::vector<PendingMode> pendingDirs;
    fs::recursive_directory_iterator it(source, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const fs::directory_entry entry = *it;
        if (entry.path().filename() == kVcsDirName.toStdString()) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            it.increment(ec);
            continue;
        }

        const fs::path relative = fs::relative(entry.path(), source, ec);
        if (ec) {
            break;
        }
        if (!copyEntry(entry, target / relative, pendingDirs, ec)) {
            setError(error, QStringLiteral("could not copy %1: %2")
                                .arg(QString::fromStdString(entry.path().string()),
                                     QString::fromStdString(ec.message())));
            return false;
        }
        it.increment(ec);
    }

    if (ec) {
        setError(error, QStringLiteral("could not walk %1: %2")
                            .arg(m_config.profileSourceDir,
                                 QString::fromStdString(ec.message())));
        return false;
    }

    // Deepest first, so a parent never loses write access before its children.
    for (auto pending = pendingDirs.rbegin(); pending != pendingDirs.rend(); ++pending) {
        fs::permissions(pending->path, pending->perms, ec);
        if (ec) {
            setError(error, QStringLiteral("could not set mode on %1: %2")
                                .arg(QString::fromStdString(pending->path.string()),
                                     QString::fromStdString(ec.message())));
            return false;
        }
    }

    m_lastMethod = StagingMethod::Copy;
    return true;
}

QString WorkspaceStager::versionFilePath() const
{
    return m_config.stagedProfileDir()
        + QStringLiteral("/airootfs/etc/crystallinux-version");
}

QString WorkspaceStager::versionToken(const QDate &date)
{
    return date.toString(QStringLiteral("yyyy.MM"));
}

bool WorkspaceStager::stampVersion(const QDate &date, QString *error)
{
    const QString path = versionFilePath();
    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        setError(error, QStringLiteral("Error writing to version file %1: %2")
                            .arg(path, file.errorString()));
        return false;
    }

    const QByteArray line = (versionToken(date) + QChar('\n')).toUtf8();
    if (file.write(line) != line.size()) {
        setError(error, QStringLiteral("Error writing to version file %1: %2")
                            .arg(path, file.errorString()));
        return false;
    }

    CBLOG_INFO(QStringLiteral("WorkspaceStager"),
               QStringLiteral("stampVersion"),
               QStringLiteral("version_stamped"),
               QStringLiteral("pre_build"),
               QStringLiteral("file_write"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                               {"version", versionToken(date).toStdString()}}));
    return true;
}

} // namespace crystalbuild
