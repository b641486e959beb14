#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QThread>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <optional>

#include "common/process_utils.hpp"

namespace crystalbuild::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr char kLogsSubdir[] = "/.local/share/crystalbuild/logs";

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;

thread_local QString t_corrId;
thread_local QString t_stage;

struct FileOwner {
    uid_t uid;
    gid_t gid;
};

// Where the logs go and, for an elevated build, who should own what we create.
struct LogLocation {
    QString dir;
    std::optional<FileOwner> owner;
};

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

LogLocation resolveLogLocation()
{
    LogLocation location;

    if (geteuid() == 0) {
        const QString invoker = originalInvokingUser();
        if (!invoker.isEmpty() && invoker != QStringLiteral("root")) {
            const QByteArray name = invoker.toLocal8Bit();
            if (const passwd *pw = getpwnam(name.constData())) {
                location.dir = QString::fromLocal8Bit(pw->pw_dir) + QLatin1String(kLogsSubdir);
                location.owner = FileOwner{pw->pw_uid, pw->pw_gid};
                return location;
            }
        }
    }

    const QString home = qEnvironmentVariable("HOME");
    location.dir = home.isEmpty()
        ? QString(QLatin1String(kLogsSubdir)).mid(1)
        : home + QLatin1String(kLogsSubdir);
    return location;
}

void handOver(const QString &path, const FileOwner &owner)
{
    const QByteArray native = QFile::encodeName(path);
    if (::chown(native.constData(), owner.uid, owner.gid) != 0) {
        fprintf(stderr, "crystalbuild: could not hand %s to uid %u: %s\n",
                native.constData(), static_cast<unsigned>(owner.uid), std::strerror(errno));
    }
}

// mkpath, then give every directory it had to create to the log owner.
void ensureLogsDir(const LogLocation &location)
{
    QStringList created;
    QString current = QDir::cleanPath(location.dir);
    while (!QFileInfo::exists(current)) {
        created.prepend(current);
        const QString parent = QFileInfo(current).absolutePath();
        if (parent == current) {
            break;
        }
        current = parent;
    }

    if (created.isEmpty() || !QDir().mkpath(location.dir) || !location.owner) {
        return;
    }
    for (const QString &dir : created) {
        handOver(dir, *location.owner);
    }
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const LogLocation &location, const QString &fileName, const QString &line)
{
    ensureLogsDir(location);
    const QString path = location.dir + QDir::separator() + fileName;
    rotateIfNeeded(path);

    const bool isNew = !QFileInfo::exists(path);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }
    if (isNew && location.owner) {
        handOver(path, *location.owner);
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString currentCorrelationId()
{
    return t_corrId;
}

StageScope::StageScope(const QString &stage)
    : m_prev(t_stage)
{
    t_stage = stage;
}

StageScope::~StageScope()
{
    t_stage = m_prev;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("crystalbuild");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    QString who = QStringLiteral("host:%1,uid:%2,euid:%3")
                      .arg(QString::fromUtf8(hostname))
                      .arg(static_cast<int>(getuid()))
                      .arg(static_cast<int>(geteuid()));

    const QString invoker = originalInvokingUser();
    if (!invoker.isEmpty()) {
        who += QStringLiteral(",invoker:") + invoker;
    }
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? t_corrId : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"stage", t_stage.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(payload.dump());
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const LogLocation location = resolveLogLocation();
    writeLine(location, process + QStringLiteral(".log"), line);
    if (g_traceEnabled) {
        writeLine(location, process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace crystalbuild::logging
