#pragma once

#include <QString>
#include <QStringList>

namespace crystalbuild {

// Returns the absolute path of an executable found on PATH, or an empty string.
QString findExecutable(const QString &name);

bool commandExists(const QString &name);

/**
 * Run command[0] with the remaining tokens as arguments and wait for it.
 *
 * Returns the exit code, or -1 if the program could not be started or
 * crashed. When output is non-null it receives the merged stdout/stderr.
 */
int runCommand(const QStringList &command, QString *output = nullptr);

QString joinCommand(const QStringList &command);

// User that invoked sudo/doas, from SUDO_USER or DOAS_USER. Empty if neither.
QString originalInvokingUser();

// Switches the process working directory for the lifetime of the guard.
class WorkingDirectoryGuard {
public:
    explicit WorkingDirectoryGuard(const QString &path);
    ~WorkingDirectoryGuard();

    WorkingDirectoryGuard(const WorkingDirectoryGuard &) = delete;
    WorkingDirectoryGuard &operator=(const WorkingDirectoryGuard &) = delete;

    bool isValid() const { return m_changed; }

private:
    QString m_previous;
    bool m_changed = false;
};

} // namespace crystalbuild
