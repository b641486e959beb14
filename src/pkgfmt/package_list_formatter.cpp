#include "pkgfmt/package_list_formatter.hpp"

#include <QFile>
#include <QFileInfo>
#include <QMap>
#include <QRegularExpression>
#include <QSaveFile>

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace {

bool isCommentLine(const QString &line)
{
    return line.trimmed().startsWith(QChar('#'));
}

bool isBlankLine(const QString &line)
{
    return line.trimmed().isEmpty();
}

bool isPackageLine(const QString &line)
{
    static const QRegularExpression packageStart(QStringLiteral("^\\s*[A-Za-z0-9]"));
    return packageStart.match(line).hasMatch();
}

// Keyed by trimmed name; the first spelling (with its indentation) wins.
void flushSection(const QStringList &section, QStringList &out)
{
    QMap<QString, QString> unique;
    for (const QString &line : section) {
        if (!isPackageLine(line)) {
            continue;
        }
        const QString name = line.trimmed();
        if (!unique.contains(name)) {
            unique.insert(name, line);
        }
    }
    for (auto it = unique.cbegin(); it != unique.cend(); ++it) {
        out << it.value();
    }
}

QStringList splitLines(const QString &content)
{
    QStringList lines = content.split(QChar('\n'));
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }
    for (QString &line : lines) {
        if (line.endsWith(QChar('\r'))) {
            line.chop(1);
        }
    }
    return lines;
}

} // namespace

QStringList formatPackageLines(const QStringList &lines)
{
    QStringList packages;
    packages.reserve(lines.size());
    for (const QString &line : lines) {
        const QString name = line.trimmed();
        if (!name.isEmpty()) {
            packages << name;
        }
    }
    packages.removeDuplicates();
    packages.sort(Qt::CaseSensitive);
    return packages;
}

QStringList formatPackageSections(const QStringList &lines)
{
    QStringList out;
    QStringList section;
    bool inSection = false;

    for (const QString &line : lines) {
        const bool comment = isCommentLine(line);
        if (comment || isBlankLine(line)) {
            if (inSection && !section.isEmpty()) {
                flushSection(section, out);
                section.clear();
                inSection = false;
            }
            out << line;
            if (comment) {
                inSection = true;
            }
            continue;
        }

        if (inSection) {
            section << line;
        } else {
            out << line;
        }
    }

    if (!section.isEmpty()) {
        flushSection(section, out);
    }
    return out;
}

QString renderPackageList(const QStringList &lines)
{
    QString rendered;
    for (const QString &line : lines) {
        rendered += line;
        rendered += QChar('\n');
    }
    return rendered;
}

FormatStatus formatPackageFile(const QString &path, FormatMode mode, QString *error)
{
    const QFileInfo info(path);
    if (!info.isFile()) {
        if (error) {
            *error = QStringLiteral("Error: File '%1' not found.").arg(info.absoluteFilePath());
        }
        return FormatStatus::NotFound;
    }

    QFile input(info.absoluteFilePath());
    if (!input.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error) {
            *error = QStringLiteral("An error occurred while reading '%1': %2")
                         .arg(path, input.errorString());
        }
        return FormatStatus::ReadError;
    }
    const QStringList lines = splitLines(QString::fromUtf8(input.readAll()));
    input.close();

    const QStringList formatted = mode == FormatMode::Sections
        ? formatPackageSections(lines)
        : formatPackageLines(lines);

    QSaveFile output(info.absoluteFilePath());
    if (!output.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (error) {
            *error = QStringLiteral("An error occurred while writing to '%1': %2")
                         .arg(path, output.errorString());
        }
        return FormatStatus::WriteError;
    }
    output.write(renderPackageList(formatted).toUtf8());
    if (!output.commit()) {
        if (error) {
            *error = QStringLiteral("An error occurred while writing to '%1': %2")
                         .arg(path, output.errorString());
        }
        return FormatStatus::WriteError;
    }

    CBLOG_INFO(QStringLiteral("PackageListFormatter"),
               QStringLiteral("formatPackageFile"),
               QStringLiteral("package_list_formatted"),
               QStringLiteral("user_invocation"),
               mode == FormatMode::Sections ? QStringLiteral("per_section")
                                            : QStringLiteral("flat"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", info.absoluteFilePath().toStdString()},
                               {"linesIn", lines.size()},
                               {"linesOut", formatted.size()}}));
    return FormatStatus::Ok;
}

} // namespace crystalbuild
