#include "builder/output_finalizer.hpp"

#include <filesystem>
#include <system_error>

#include <QByteArray>
#include <QByteArrayView>
#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace {

constexpr qint64 kChecksumChunkBytes = 64 * 1024;

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

bool renameReplacing(const QString &from, const QString &to, QString *error)
{
    std::error_code ec;
    std::filesystem::rename(from.toStdString(), to.toStdString(), ec);
    if (ec) {
        setError(error, QStringLiteral("Error renaming ISO: %1")
                            .arg(QString::fromStdString(ec.message())));
        return false;
    }
    return true;
}

} // namespace

QString canonicalIsoName(const QDate &date)
{
    return QStringLiteral("%1%2-%3%4")
        .arg(QLatin1String(kIsoNamePrefix),
             date.toString(QStringLiteral("yyyyMMdd")),
             QLatin1String(kIsoArch),
             QLatin1String(kIsoExtension));
}

std::optional<QString> findLatestIso(const QString &outputDir)
{
    const QFileInfoList entries =
        QDir(outputDir).entryInfoList(QDir::Files | QDir::NoDotAndDotDot);

    std::optional<QFileInfo> newest;
    for (const QFileInfo &info : entries) {
        const QString name = info.fileName();
        if (!name.startsWith(QLatin1String(kIsoNamePrefix))
            || !name.endsWith(QLatin1String(kIsoExtension))) {
            continue;
        }
        if (!newest || info.lastModified() > newest->lastModified()) {
            newest = info;
        }
    }

    if (!newest) {
        return std::nullopt;
    }
    return newest->absoluteFilePath();
}

std::optional<QString> sha256File(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("Error reading file for checksum: %1")
                            .arg(file.errorString()));
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer(kChecksumChunkBytes, Qt::Uninitialized);
    for (;;) {
        const qint64 bytesRead = file.read(buffer.data(), buffer.size());
        if (bytesRead < 0) {
            setError(error, QStringLiteral("Error reading file for checksum: %1")
                                .arg(file.errorString()));
            return std::nullopt;
        }
        if (bytesRead == 0) {
            break;
        }
        hash.addData(QByteArrayView(buffer.constData(), bytesRead));
    }

    return QString::fromLatin1(hash.result().toHex());
}

std::optional<QString> writeChecksumFile(const QString &artifactPath,
                                         const QString &digest,
                                         QString *error)
{
    const QString checksumPath = artifactPath + QLatin1String(kChecksumSuffix);
    QSaveFile file(checksumPath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("Error saving checksum file: %1")
                            .arg(file.errorString()));
        return std::nullopt;
    }

    // Two spaces: the layout sha256sum -c expects.
    const QByteArray line = QStringLiteral("%1  %2\n")
                                .arg(digest, QFileInfo(artifactPath).fileName())
                                .toUtf8();
    if (file.write(line) != line.size() || !file.commit()) {
        setError(error, QStringLiteral("Error saving checksum file: %1")
                            .arg(file.errorString()));
        return std::nullopt;
    }
    return checksumPath;
}

FinalizeResult finalizeOutput(const QString &outputDir,
                              const QDate &today,
                              bool renameArtifact)
{
    FinalizeResult result;

    const auto discovered = findLatestIso(outputDir);
    if (!discovered) {
        result.error = QStringLiteral(
                           "Could not find the generated ISO file in %1 matching pattern '%2*%3'")
                           .arg(outputDir,
                                QLatin1String(kIsoNamePrefix),
                                QLatin1String(kIsoExtension));
        CBLOG_ERROR(QStringLiteral("OutputFinalizer"),
                    QStringLiteral("finalizeOutput"),
                    QStringLiteral("artifact_missing"),
                    QStringLiteral("no_match"),
                    QStringLiteral("dir_scan"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"outputDir", outputDir.toStdString()}}));
        return result;
    }

    QString finalPath = *discovered;
    if (renameArtifact) {
        const QString target = QDir(outputDir).absoluteFilePath(canonicalIsoName(today));
        if (target != finalPath) {
            if (!renameReplacing(finalPath, target, &result.error)) {
                return result;
            }
            CBLOG_INFO(QStringLiteral("OutputFinalizer"),
                       QStringLiteral("finalizeOutput"),
                       QStringLiteral("artifact_renamed"),
                       QStringLiteral("canonical_name"),
                       QStringLiteral("rename"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"from", finalPath.toStdString()},
                                       {"to", target.toStdString()}}));
        }
        finalPath = target;
    }

    if (!QFileInfo::exists(finalPath)) {
        result.error = QStringLiteral("Final ISO file not found at %1 for checksumming.")
                           .arg(finalPath);
        return result;
    }
    result.artifactPath = finalPath;

    QString checksumError;
    const auto digest = sha256File(finalPath, &checksumError);
    if (!digest) {
        result.error = checksumError;
        // A sidecar left by an earlier image of the same name would not match.
        const QString staleSidecar = finalPath + QLatin1String(kChecksumSuffix);
        if (QFileInfo(staleSidecar).isFile() && !QFile::remove(staleSidecar)) {
            result.error += QStringLiteral("; stale %1 could not be removed").arg(staleSidecar);
        }
        CBLOG_WARN(QStringLiteral("OutputFinalizer"),
                   QStringLiteral("finalizeOutput"),
                   QStringLiteral("checksum_failed"),
                   QStringLiteral("read_error"),
                   QStringLiteral("sha256"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", checksumError.toStdString()}}));
        return result;
    }
    result.checksum = *digest;

    result.checksumPath = writeChecksumFile(finalPath, *digest, &checksumError);
    if (!result.checksumPath) {
        result.error = checksumError;
        CBLOG_WARN(QStringLiteral("OutputFinalizer"),
                   QStringLiteral("finalizeOutput"),
                   QStringLiteral("checksum_write_failed"),
                   QStringLiteral("write_error"),
                   QStringLiteral("file_write"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", checksumError.toStdString()}}));
        return result;
    }

    CBLOG_INFO(QStringLiteral("OutputFinalizer"),
               QStringLiteral("finalizeOutput"),
               QStringLiteral("artifact_finalized"),
               QStringLiteral("build_complete"),
               QStringLiteral("sha256"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"artifact", finalPath.toStdString()},
                               {"sha256", digest->toStdString()}}));
    return result;
}

} // namespace crystalbuild
