#include "common/process_utils.hpp"

#include <QDir>
#include <QProcess>
#include <QStandardPaths>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace crystalbuild {

QString findExecutable(const QString &name)
{
    return QStandardPaths::findExecutable(name);
}

bool commandExists(const QString &name)
{
    return !findExecutable(name).isEmpty();
}

int runCommand(const QStringList &command, QString *output)
{
    if (command.isEmpty()) {
        return -1;
    }

    CBLOG_DEBUG(QStringLiteral("ProcessUtils"),
                QStringLiteral("runCommand"),
                QStringLiteral("run_command"),
                QStringLiteral("pipeline_step"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"command", joinCommand(command).toStdString()}}));

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(command.first(), command.mid(1));
    if (!process.waitForStarted()) {
        if (output) {
            *output = process.errorString();
        }
        return -1;
    }

    process.closeWriteChannel();

    // rm -rf and chown -R over a full work tree can take minutes.
    if (!process.waitForFinished(-1)) {
        if (output) {
            *output = process.errorString();
        }
        return -1;
    }

    if (output) {
        *output = QString::fromUtf8(process.readAll()).trimmed();
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        return -1;
    }
    return process.exitCode();
}

QString joinCommand(const QStringList &command)
{
    return command.join(QChar(' '));
}

QString originalInvokingUser()
{
    const QString sudoUser = qEnvironmentVariable("SUDO_USER");
    if (!sudoUser.isEmpty()) {
        return sudoUser;
    }
    return qEnvironmentVariable("DOAS_USER");
}

WorkingDirectoryGuard::WorkingDirectoryGuard(const QString &path)
    : m_previous(QDir::currentPath())
{
    m_changed = QDir::setCurrent(path);
}

WorkingDirectoryGuard::~WorkingDirectoryGuard()
{
    if (m_changed) {
        QDir::setCurrent(m_previous);
    }
}

} // namespace crystalbuild
