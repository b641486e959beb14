#include "builder/BuildCli.hpp"

#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>

#include "builder/build_pipeline.hpp"
#include "common/crystalbuild_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace {

QString absoluteFromCurrent(const QString &path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

QString relativeToBase(const QString &base, const QString &relative)
{
    return QDir::cleanPath(QDir(base).absoluteFilePath(relative));
}

} // namespace

BuildCli::BuildCli()
    : m_privilegeEnv(PrivilegeEnvironment::system())
{
}

QString BuildCli::usageText()
{
    return QStringLiteral(
        "Usage: crystal-build [OPTIONS]\n"
        "\n"
        "Build CrystalLinux ISO.\n"
        "\n"
        "OPTIONS:\n"
        "    --work-dir DIR      Working directory for the build (default: ../build/work)\n"
        "    --output-dir DIR    Output directory for the ISO (default: ../build/out)\n"
        "    -c, --clean         Clean the work directory before building\n"
        "    -v, --verbose       Run mkarchiso in verbose mode\n"
        "    --keep-name         Keep the file name mkarchiso produced\n"
        "    --trace             Write debug events to the trace log\n"
        "    --version           Show the version\n"
        "    -h, --help          Show this help message\n");
}

QString BuildCli::baseDir()
{
    const QString fromEnv = qEnvironmentVariable("CRYSTALBUILD_BASE_DIR");
    if (!fromEnv.isEmpty()) {
        return absoluteFromCurrent(fromEnv);
    }
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationDirPath();
    }
    return QDir::currentPath();
}

std::optional<BuildConfig> BuildCli::parseConfig(const QStringList &args,
                                                 QString *error,
                                                 bool *exitEarly) const
{
    if (exitEarly) {
        *exitEarly = false;
    }

    QCommandLineParser parser;
    const QCommandLineOption workDirOption(QStringList() << "work-dir",
                                           "Working directory for the build.", "DIR");
    const QCommandLineOption outputDirOption(QStringList() << "output-dir",
                                             "Output directory for the ISO.", "DIR");
    const QCommandLineOption cleanOption(QStringList() << "c" << "clean",
                                         "Clean the work directory before building.");
    const QCommandLineOption verboseOption(QStringList() << "v" << "verbose",
                                           "Run mkarchiso in verbose mode.");
    const QCommandLineOption keepNameOption(QStringList() << "keep-name",
                                            "Keep the file name mkarchiso produced.");
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         "Write debug events to the trace log.");
    const QCommandLineOption versionOption(QStringList() << "version",
                                           "Show the version.");
    const QCommandLineOption helpOption(QStringList() << "h" << "help",
                                        "Show this help message.");
    parser.addOptions({workDirOption, outputDirOption, cleanOption, verboseOption,
                       keepNameOption, traceOption, versionOption, helpOption});

    if (!parser.parse(args)) {
        if (error) {
            *error = parser.errorText();
        }
        return std::nullopt;
    }

    if (parser.isSet(helpOption)) {
        std::cout << usageText().toStdString();
        if (exitEarly) {
            *exitEarly = true;
        }
        return std::nullopt;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "crystal-build " << CRYSTALBUILD_VERSION << std::endl;
        if (exitEarly) {
            *exitEarly = true;
        }
        return std::nullopt;
    }
    if (!parser.positionalArguments().isEmpty()) {
        if (error) {
            *error = QStringLiteral("Unknown option: %1")
                         .arg(parser.positionalArguments().first());
        }
        return std::nullopt;
    }

    const QString base = baseDir();

    BuildConfig config;
    config.workDir = parser.isSet(workDirOption)
        ? absoluteFromCurrent(parser.value(workDirOption))
        : relativeToBase(base, QStringLiteral("../build/work"));
    config.outputDir = parser.isSet(outputDirOption)
        ? absoluteFromCurrent(parser.value(outputDirOption))
        : relativeToBase(base, QStringLiteral("../build/out"));
    config.profileSourceDir = relativeToBase(base, QStringLiteral("../archiso"));
    config.projectRoot = relativeToBase(base, QStringLiteral("../.."));
    config.clean = parser.isSet(cleanOption);
    config.verbose = parser.isSet(verboseOption);
    config.renameArtifact = !parser.isSet(keepNameOption);

    const QString builder = qEnvironmentVariable("CRYSTALBUILD_MKARCHISO");
    if (!builder.isEmpty()) {
        config.builderProgram = builder;
    }

    return config;
}

int BuildCli::run(int argc, char *argv[])
{
    QStringList args;
    for (int i = 0; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    if (args.isEmpty()) {
        args << QStringLiteral("crystal-build");
    }

    QString error;
    bool exitEarly = false;
    std::optional<BuildConfig> config = parseConfig(args, &error, &exitEarly);
    if (!config) {
        if (exitEarly) {
            return 0;
        }
        std::cerr << error.toStdString() << "\n" << usageText().toStdString();
        return 1;
    }

    const std::optional<PrivilegeCommand> privilege = resolvePrivilegeCommand(m_privilegeEnv);
    if (!privilege) {
        std::cerr << "Error: Not running as root, and neither 'doas' nor 'sudo' found in PATH."
                  << std::endl;
        return 1;
    }
    if (privilege->isElevated()) {
        std::cout << "Using '" << privilege->helper.toStdString()
                  << "' for privilege escalation." << std::endl;
    } else {
        std::cout << "Running as root. Privilege escalation tool is not needed." << std::endl;
    }
    config->privilege = *privilege;

    CBLOG_INFO(QStringLiteral("BuildCli"),
               QStringLiteral("run"),
               QStringLiteral("config_resolved"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli_and_env"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"builder", config->builderProgram.toStdString()},
                               {"verbose", config->verbose},
                               {"rename", config->renameArtifact}}));

    BuildPipeline pipeline(*config);
    return pipeline.run(std::cout, std::cerr);
}

} // namespace crystalbuild
