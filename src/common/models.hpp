#pragma once

#include <optional>

#include <QString>
#include <QStringList>

namespace crystalbuild {

inline constexpr char kIsoNamePrefix[] = "CrystalLinux-";
inline constexpr char kIsoExtension[] = ".iso";
inline constexpr char kIsoArch[] = "x86_64";
inline constexpr char kChecksumSuffix[] = ".sha256";
inline constexpr char kPackageListSuffix[] = ".pkgs.txt";

// Leading tokens prepended to every command that needs root.
// Empty when the process already runs as root.
struct PrivilegeCommand {
    QStringList prefix;
    QString helper;

    bool isElevated() const { return !prefix.isEmpty(); }

    QStringList apply(const QStringList &command) const
    {
        return prefix + command;
    }
};

struct BuildConfig {
    QString workDir;
    QString outputDir;
    QString projectRoot;
    QString profileSourceDir;

    bool clean = false;
    bool verbose = false;
    bool renameArtifact = true;
    QString builderProgram = QStringLiteral("mkarchiso");

    PrivilegeCommand privilege;

    // Writable copy of the profile handed to the builder.
    QString stagedProfileDir() const
    {
        return workDir + QStringLiteral("/archiso");
    }
};

struct FinalizeResult {
    std::optional<QString> artifactPath;
    std::optional<QString> checksumPath;
    QString checksum;
    QString error;
};

} // namespace crystalbuild
