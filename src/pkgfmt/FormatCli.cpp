#include "pkgfmt/FormatCli.hpp"

#include <iostream>

#include <QFileInfo>
#include <QStringList>

#include "pkgfmt/package_list_formatter.hpp"

namespace crystalbuild {

QString FormatCli::defaultPackageListPath()
{
    return QStringLiteral("../archiso/packages.x86_64");
}

QString FormatCli::usageText()
{
    return QStringLiteral(
        "Usage: crystal-pkgfmt [--sections] [FILE_PATH]\n"
        "\n"
        "Formats the content of a package list file alphabetically and removes duplicates.\n"
        "\n"
        "Arguments:\n"
        "    FILE_PATH    Path to the package list file (default: ../archiso/packages.x86_64)\n"
        "\n"
        "Options:\n"
        "    --sections   Sort within the sections introduced by '#' comments,\n"
        "                 keeping comments, blank lines and indentation\n"
        "    --trace      Write debug events to the trace log\n"
        "    -h, --help   Show this help message\n");
}

int FormatCli::run(int argc, char *argv[])
{
    QString filePath = defaultPackageListPath();
    FormatMode mode = FormatMode::Flat;

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("-h") || arg == QStringLiteral("--help")) {
            std::cout << usageText().toStdString();
            return 0;
        }
        if (arg == QStringLiteral("--sections")) {
            mode = FormatMode::Sections;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        if (arg.startsWith(QChar('-'))) {
            std::cerr << "Unknown option: " << arg.toStdString() << "\n"
                      << usageText().toStdString();
            return 1;
        }
        filePath = arg;
    }

    QString error;
    const FormatStatus status = formatPackageFile(filePath, mode, &error);
    if (status != FormatStatus::Ok) {
        std::cerr << error.toStdString() << std::endl;
        return 1;
    }

    std::cout << "File '" << QFileInfo(filePath).absoluteFilePath().toStdString()
              << "' formatted and duplicates removed successfully." << std::endl;
    return 0;
}

} // namespace crystalbuild
