#include "builder/build_invoker.hpp"

#include <QByteArray>
#include <QList>
#include <QProcess>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

#include <nlohmann/json.hpp>

namespace crystalbuild {

namespace {

// Owns the child for the duration of one build. A child still running when
// the scope unwinds is killed and reaped.
class ScopedChildProcess
{
public:
    ScopedChildProcess()
    {
        m_process.setProcessChannelMode(QProcess::MergedChannels);
    }

    ~ScopedChildProcess()
    {
        if (m_process.state() != QProcess::NotRunning) {
            m_process.kill();
            m_process.waitForFinished();
        }
    }

    ScopedChildProcess(const ScopedChildProcess &) = delete;
    ScopedChildProcess &operator=(const ScopedChildProcess &) = delete;

    QProcess &process() { return m_process; }

private:
    QProcess m_process;
};

void forwardLine(QByteArray line, std::ostream &out)
{
    while (line.endsWith('\n') || line.endsWith('\r')) {
        line.chop(1);
    }
    out.write(line.constData(), line.size());
    out << std::endl;
}

} // namespace

BuildInvoker::BuildInvoker(const BuildConfig &config)
    : m_config(config)
{
}

QStringList BuildInvoker::command() const
{
    QStringList builder = {m_config.builderProgram};
    if (m_config.verbose) {
        builder << QStringLiteral("-v");
    }
    builder << QStringLiteral("-w") << m_config.workDir
            << QStringLiteral("-o") << m_config.outputDir
            << m_config.stagedProfileDir();
    return m_config.privilege.apply(builder);
}

bool BuildInvoker::run(std::ostream &out, QString *error)
{
    m_lastExitCode = -1;
    m_lastLineCount = 0;

    const QStringList cmd = command();

    WorkingDirectoryGuard cwdGuard(m_config.projectRoot);
    if (!cwdGuard.isValid()) {
        if (error) {
            *error = QStringLiteral("could not change directory to %1")
                         .arg(m_config.projectRoot);
        }
        return false;
    }

    CBLOG_INFO(QStringLiteral("BuildInvoker"),
               QStringLiteral("run"),
               QStringLiteral("builder_start"),
               QStringLiteral("profile_staged"),
               QStringLiteral("qprocess_merged_channels"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", joinCommand(cmd).toStdString()},
                               {"cwd", m_config.projectRoot.toStdString()}}));

    ScopedChildProcess child;
    QProcess &process = child.process();
    process.start(cmd.first(), cmd.mid(1));
    if (!process.waitForStarted(-1)) {
        if (error) {
            *error = QStringLiteral("could not start %1: %2")
                         .arg(cmd.first(), process.errorString());
        }
        return false;
    }
    process.closeWriteChannel();

    // Blocks until the builder closes its output; no timeout.
    for (;;) {
        while (process.canReadLine()) {
            forwardLine(process.readLine(), out);
            ++m_lastLineCount;
        }
        if (!process.waitForReadyRead(-1)) {
            break;
        }
    }

    const QByteArray rest = process.readAll();
    if (!rest.isEmpty()) {
        QList<QByteArray> lines = rest.split('\n');
        if (rest.endsWith('\n')) {
            lines.removeLast();
        }
        for (const QByteArray &line : lines) {
            forwardLine(line, out);
            ++m_lastLineCount;
        }
    }

    if (process.state() != QProcess::NotRunning) {
        process.waitForFinished(-1);
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        if (error) {
            *error = QStringLiteral("%1 crashed: %2")
                         .arg(m_config.builderProgram, process.errorString());
        }
        CBLOG_ERROR(QStringLiteral("BuildInvoker"),
                    QStringLiteral("run"),
                    QStringLiteral("builder_crashed"),
                    QStringLiteral("abnormal_exit"),
                    QStringLiteral("qprocess"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        return false;
    }

    m_lastExitCode = process.exitCode();
    CBLOG_INFO(QStringLiteral("BuildInvoker"),
               QStringLiteral("run"),
               QStringLiteral("builder_finished"),
               QStringLiteral("process_exit"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"exitCode", m_lastExitCode},
                               {"lines", m_lastLineCount}}));

    if (m_lastExitCode != 0) {
        if (error) {
            *error = QStringLiteral("%1 exited with error code: %2")
                         .arg(m_config.builderProgram)
                         .arg(m_lastExitCode);
        }
        return false;
    }
    return true;
}

} // namespace crystalbuild
