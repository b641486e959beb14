#include "builder/build_pipeline.hpp"

#include <optional>
#include <utility>

#include <QDateTime>

#include "builder/artifact_relocator.hpp"
#include "builder/build_invoker.hpp"
#include "builder/output_finalizer.hpp"
#include "builder/ownership_restorer.hpp"
#include "builder/workspace_stager.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace {

QString newRunId()
{
    return QStringLiteral("build-%1").arg(QDateTime::currentMSecsSinceEpoch());
}

std::string str(const QString &value)
{
    return value.toStdString();
}

} // namespace

BuildPipeline::BuildPipeline(BuildConfig config)
    : m_config(std::move(config))
    , m_today([]() { return QDate::currentDate(); })
{
}

void BuildPipeline::setDateProvider(std::function<QDate()> provider)
{
    m_today = std::move(provider);
}

int BuildPipeline::fail(std::ostream &err, const QString &stage, const QString &message)
{
    err << "Error: " << str(message) << "\n";
    err << str(stage) << " Exiting." << std::endl;
    CBLOG_ERROR(QStringLiteral("BuildPipeline"),
                QStringLiteral("run"),
                QStringLiteral("build_aborted"),
                stage,
                QStringLiteral("fatal_stage"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"error", str(message)}}));
    return 1;
}

int BuildPipeline::run(std::ostream &out, std::ostream &err)
{
    logging::CorrelationScope scope(newRunId());
    m_outcome.reset();

    CBLOG_INFO(QStringLiteral("BuildPipeline"),
               QStringLiteral("run"),
               QStringLiteral("build_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("linear_pipeline"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"workDir", str(m_config.workDir)},
                               {"outputDir", str(m_config.outputDir)},
                               {"profile", str(m_config.profileSourceDir)},
                               {"clean", m_config.clean},
                               {"helper", str(m_config.privilege.helper)}}));

    QString error;
    WorkspaceStager stager(m_config);
    stager.setRsyncAllowed(m_rsyncAllowed);

    // Reassigned per stage; emplace() restores the previous stage first.
    std::optional<logging::StageScope> stage;

    stage.emplace(QStringLiteral("prepare"));
    if (!stager.ensureDirectories(&error)) {
        return fail(err, QStringLiteral("Failed to set up paths."), error);
    }

    if (m_config.clean) {
        out << "Cleaning work directory: " << str(m_config.workDir) << std::endl;
    }
    if (!stager.cleanWorkDir(&error)) {
        return fail(err, QStringLiteral("Failed to clean work directory."), error);
    }

    stage.emplace(QStringLiteral("stage"));
    out << "Copying archiso profile from " << str(m_config.profileSourceDir)
        << " to " << str(m_config.stagedProfileDir()) << std::endl;
    if (!stager.stageProfile(&error)) {
        return fail(err, QStringLiteral("Failed to copy archiso profile."), error);
    }
    out << (stager.lastStagingMethod() == StagingMethod::Rsync
                ? "Archiso profile copied using rsync."
                : "Archiso profile copied using recursive copy.")
        << std::endl;

    // Fatal: the stamp is baked into the image.
    const QDate stampDate = m_today();
    if (!stager.stampVersion(stampDate, &error)) {
        return fail(err, QStringLiteral("Failed to update version file."), error);
    }
    out << "Updated version file: " << str(stager.versionFilePath()) << " with date "
        << str(WorkspaceStager::versionToken(stampDate)) << std::endl;

    stage.emplace(QStringLiteral("build"));
    BuildInvoker invoker(m_config);
    out << "Starting ISO build in " << str(m_config.stagedProfileDir()) << std::endl;
    out << "Executing command: " << str(joinCommand(invoker.command())) << std::endl;
    if (!invoker.run(out, &error)) {
        return fail(err, QStringLiteral("mkarchiso build failed."), error);
    }

    stage.emplace(QStringLiteral("finalize"));
    // Taken after the build; may differ from stampDate across midnight.
    const FinalizeResult finalized =
        finalizeOutput(m_config.outputDir, m_today(), m_config.renameArtifact);
    if (!finalized.artifactPath) {
        err << "\nISO output processing failed. The build may not have completed successfully."
            << std::endl;
        return fail(err, QStringLiteral("Output processing failed."), finalized.error);
    }

    BuildOutcome outcome;
    outcome.artifactPath = *finalized.artifactPath;
    outcome.checksumPath = finalized.checksumPath;
    out << "Final ISO: " << str(outcome.artifactPath) << std::endl;
    if (finalized.checksumPath) {
        out << "Checksum saved to " << str(*finalized.checksumPath) << std::endl;
    } else {
        err << "Warning: Failed to generate checksum: " << str(finalized.error) << std::endl;
    }

    stage.emplace(QStringLiteral("ownership"));
    if (!restoreOwnership(m_config, &error)) {
        err << "Warning: " << str(error) << " Manual intervention may be required."
            << std::endl;
    }

    stage.emplace(QStringLiteral("relocate"));
    outcome.packageListPath = relocatePackageList(m_config, outcome.artifactPath, &error);
    if (!outcome.packageListPath) {
        err << "Warning: " << str(error) << std::endl;
    }

    out << "\nBuild process completed.\n";
    out << "Final ISO located at: " << str(outcome.artifactPath) << "\n";
    if (outcome.packageListPath) {
        out << "Package list located at: " << str(*outcome.packageListPath) << "\n";
    }
    out.flush();

    stage.reset();
    CBLOG_INFO(QStringLiteral("BuildPipeline"),
               QStringLiteral("run"),
               QStringLiteral("build_complete"),
               QStringLiteral("all_stages_ok"),
               QStringLiteral("linear_pipeline"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"artifact", str(outcome.artifactPath)},
                               {"checksum", finalized.checksum.toStdString()}}));

    m_outcome = outcome;
    return 0;
}

} // namespace crystalbuild
