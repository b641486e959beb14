#pragma once

#include <QString>
#include <QStringList>

namespace crystalbuild {

enum class FormatMode {
    // Whole file: trim, drop blanks, dedupe, sort.
    Flat,
    // Sort and dedupe each block that follows a "#" header; comments,
    // blank lines and indentation stay where they are.
    Sections
};

enum class FormatStatus {
    Ok,
    NotFound,
    ReadError,
    WriteError
};

QStringList formatPackageLines(const QStringList &lines);
QStringList formatPackageSections(const QStringList &lines);

// Newline-terminated join of the formatted lines.
QString renderPackageList(const QStringList &lines);

/**
 * Rewrite the package list at path in place.
 * The file is replaced atomically; on error it is left untouched.
 */
FormatStatus formatPackageFile(const QString &path, FormatMode mode, QString *error);

} // namespace crystalbuild
