#pragma once

#include <QString>

namespace crystalbuild {

class FormatCli
{
public:
    // Sorts and deduplicates a package list file in place.
    // returns exit code
    int run(int argc, char *argv[]);

    static QString usageText();
    static QString defaultPackageListPath();
};

} // namespace crystalbuild
