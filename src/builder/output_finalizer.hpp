#pragma once

#include <optional>

#include <QDate>
#include <QString>

#include "common/models.hpp"

namespace crystalbuild {

// "CrystalLinux-<yyyyMMdd>-x86_64.iso"
QString canonicalIsoName(const QDate &date);

/**
 * Find the newest "CrystalLinux-*.iso" in outputDir.
 * Stale images from earlier runs lose to the most recently modified one.
 */
std::optional<QString> findLatestIso(const QString &outputDir);

// Streaming SHA-256 in fixed-size chunks; lowercase hex.
std::optional<QString> sha256File(const QString &path, QString *error);

// Writes "<digest>  <basename>\n" to "<artifact>.sha256".
std::optional<QString> writeChecksumFile(const QString &artifactPath,
                                         const QString &digest,
                                         QString *error);

/**
 * Discover, optionally rename, and checksum the image in outputDir.
 *
 * The canonical name comes from `today`, not from the discovered file, so a
 * build finishing after midnight gets the new date.
 *
 * artifactPath is empty on a fatal failure (no image, rename failed, image
 * gone). A checksum failure only leaves checksumPath empty.
 */
FinalizeResult finalizeOutput(const QString &outputDir,
                              const QDate &today,
                              bool renameArtifact = true);

} // namespace crystalbuild
