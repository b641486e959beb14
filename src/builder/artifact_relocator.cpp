#include "builder/artifact_relocator.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

QString packageListSourcePath(const QString &workDir)
{
    return QDir(workDir).filePath(
        QStringLiteral("iso/arch/pkglist.%1.txt").arg(QLatin1String(kIsoArch)));
}

QString packageListDestinationPath(const QString &outputDir, const QString &artifactPath)
{
    QString stem = QFileInfo(artifactPath).fileName();
    if (stem.endsWith(QLatin1String(kIsoExtension))) {
        stem.chop(static_cast<int>(qstrlen(kIsoExtension)));
    }
    return QDir(outputDir).filePath(stem + QLatin1String(kPackageListSuffix));
}

std::optional<QString> relocatePackageList(const BuildConfig &config,
                                           const QString &artifactPath,
                                           QString *error)
{
    const QString source = packageListSourcePath(config.workDir);
    const QString destination = packageListDestinationPath(config.outputDir, artifactPath);

    if (!QFileInfo::exists(source)) {
        if (error) {
            *error = QStringLiteral("Package list file not found at %1").arg(source);
        }
        CBLOG_WARN(QStringLiteral("ArtifactRelocator"),
                   QStringLiteral("relocatePackageList"),
                   QStringLiteral("package_list_missing"),
                   QStringLiteral("builder_output"),
                   QStringLiteral("file_check"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"source", source.toStdString()}}));
        return std::nullopt;
    }

    // QFile::copy refuses to overwrite.
    if (QFileInfo::exists(destination) && !QFile::remove(destination)) {
        if (error) {
            *error = QStringLiteral("Could not replace existing %1").arg(destination);
        }
        return std::nullopt;
    }

    QFile sourceFile(source);
    if (!sourceFile.copy(destination)) {
        if (error) {
            *error = QStringLiteral("Error copying package list: %1")
                         .arg(sourceFile.errorString());
        }
        return std::nullopt;
    }

    CBLOG_INFO(QStringLiteral("ArtifactRelocator"),
               QStringLiteral("relocatePackageList"),
               QStringLiteral("package_list_copied"),
               QStringLiteral("artifact_finalized"),
               QStringLiteral("file_copy"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", source.toStdString()},
                               {"destination", destination.toStdString()}}));
    return destination;
}

} // namespace crystalbuild
