#include <QtTest/QtTest>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QMap>
#include <QStandardPaths>
#include <QTemporaryDir>

#include "builder/workspace_stager.hpp"

class WorkspaceStagerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testEnsureDirectoriesIdempotent();
    void testMissingProfileFails();
    void testCleanEmptiesWorkDir();
    void testCleanSkippedWhenNotRequested();
    void testCopyMirrorsAndExcludesGit();
    void testCopyKeepsExecutableBit();
    void testRsyncMatchesCopy();
    void testStampVersion();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    crystalbuild::BuildConfig m_config;

    QString root() const { return m_tempDir.path(); }
};

static bool writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to open file:" << path << file.errorString();
        return false;
    }
    return file.write(content) == content.size();
}

// Relative path -> content for every file below dir.
static QMap<QString, QByteArray> snapshotTree(const QString &dir)
{
    QMap<QString, QByteArray> tree;
    QDirIterator it(dir, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        QFile file(path);
        if (file.open(QIODevice::ReadOnly)) {
            tree.insert(QDir(dir).relativeFilePath(path), file.readAll());
        }
    }
    return tree;
}

static QMap<QString, QByteArray> withoutGit(QMap<QString, QByteArray> tree)
{
    for (auto it = tree.begin(); it != tree.end();) {
        if (it.key().startsWith(QStringLiteral(".git/"))) {
            it = tree.erase(it);
        } else {
            ++it;
        }
    }
    return tree;
}

// Read-only directories left by a test would block removeRecursively().
static void makeTreeWritable(const QString &dir)
{
    if (!QFileInfo(dir).isDir()) {
        return;
    }
    QFile::setPermissions(dir, QFileInfo(dir).permissions() | QFile::WriteOwner);
    QDirIterator it(dir, QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        QFile::setPermissions(path, QFileInfo(path).permissions() | QFile::WriteOwner);
    }
}

void WorkspaceStagerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void WorkspaceStagerTests::cleanupTestCase()
{
    makeTreeWritable(root() + "/build");
    makeTreeWritable(root() + "/archiso");
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void WorkspaceStagerTests::init()
{
    makeTreeWritable(root() + "/build");
    makeTreeWritable(root() + "/archiso");
    QDir(root() + "/build").removeRecursively();
    QDir(root() + "/archiso").removeRecursively();

    m_config = crystalbuild::BuildConfig{};
    m_config.workDir = root() + "/build/work";
    m_config.outputDir = root() + "/build/out";
    m_config.profileSourceDir = root() + "/archiso";
    m_config.projectRoot = root();

    QVERIFY(writeFile(root() + "/archiso/profiledef.sh", "iso_name=\"CrystalLinux\"\n"));
    QVERIFY(writeFile(root() + "/archiso/packages.x86_64", "base\nlinux\n"));
    QVERIFY(writeFile(root() + "/archiso/airootfs/etc/hostname", "crystal\n"));
    QVERIFY(writeFile(root() + "/archiso/.git/HEAD", "ref: refs/heads/main\n"));
}

void WorkspaceStagerTests::testEnsureDirectoriesIdempotent()
{
    crystalbuild::WorkspaceStager stager(m_config);
    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(QFileInfo(m_config.workDir).isDir());
    QVERIFY(QFileInfo(m_config.outputDir).isDir());
}

void WorkspaceStagerTests::testMissingProfileFails()
{
    m_config.profileSourceDir = root() + "/no-such-profile";
    crystalbuild::WorkspaceStager stager(m_config);

    QString error;
    QVERIFY(!stager.ensureDirectories(&error));
    QVERIFY(error.contains(QStringLiteral("no-such-profile")));
    QVERIFY(!stager.stageProfile(&error));
}

void WorkspaceStagerTests::testCleanEmptiesWorkDir()
{
    m_config.clean = true;
    crystalbuild::WorkspaceStager stager(m_config);
    stager.setRsyncAllowed(false);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(writeFile(m_config.workDir + "/x86_64/airootfs/stale", "old"));

    QVERIFY2(stager.cleanWorkDir(&error), qPrintable(error));
    QVERIFY(QFileInfo(m_config.workDir).isDir());
    QVERIFY(QDir(m_config.workDir).isEmpty(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot));

    QVERIFY(stager.stageProfile(&error));
    QVERIFY(!QDir(m_config.workDir).isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot));
}

void WorkspaceStagerTests::testCleanSkippedWhenNotRequested()
{
    crystalbuild::WorkspaceStager stager(m_config);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(writeFile(m_config.workDir + "/keep", "cache"));

    QVERIFY(stager.cleanWorkDir(&error));
    QVERIFY(QFile::exists(m_config.workDir + "/keep"));
}

void WorkspaceStagerTests::testCopyMirrorsAndExcludesGit()
{
    // A directory without owner write must still be filled, then end up 0555.
    const QString readOnlyDir = m_config.profileSourceDir + "/airootfs/etc/pacman.d";
    QVERIFY(writeFile(readOnlyDir + "/mirrorlist", "Server = https://mirror.example/$repo\n"));
    const QFileDevice::Permissions readOnly = QFile::ReadOwner | QFile::ExeOwner
        | QFile::ReadGroup | QFile::ExeGroup | QFile::ReadOther | QFile::ExeOther;
    QVERIFY(QFile::setPermissions(readOnlyDir, readOnly));

    crystalbuild::WorkspaceStager stager(m_config);
    stager.setRsyncAllowed(false);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY2(stager.stageProfile(&error), qPrintable(error));
    QCOMPARE(stager.lastStagingMethod(), crystalbuild::StagingMethod::Copy);

    const QString staged = m_config.stagedProfileDir();
    QVERIFY(!QFileInfo::exists(staged + "/.git"));
    QCOMPARE(snapshotTree(staged), withoutGit(snapshotTree(m_config.profileSourceDir)));
    QCOMPARE(QFileInfo(staged + "/airootfs/etc/pacman.d").permissions(),
             QFileInfo(readOnlyDir).permissions());

    // Second pass must drop files removed from the source.
    QVERIFY(QFile::remove(m_config.profileSourceDir + "/packages.x86_64"));
    QVERIFY(writeFile(m_config.profileSourceDir + "/airootfs/etc/motd", "welcome\n"));
    QVERIFY(stager.stageProfile(&error));

    QVERIFY(!QFileInfo::exists(staged + "/packages.x86_64"));
    QCOMPARE(snapshotTree(staged), withoutGit(snapshotTree(m_config.profileSourceDir)));
    QCOMPARE(QFileInfo(staged + "/airootfs/etc/pacman.d").permissions(),
             QFileInfo(readOnlyDir).permissions());
}

void WorkspaceStagerTests::testCopyKeepsExecutableBit()
{
    const QString script = m_config.profileSourceDir + "/airootfs/usr/local/bin/welcome-center";
    QVERIFY(writeFile(script, "#!/bin/sh\necho hi\n"));
    QVERIFY(QFile::setPermissions(script, QFile::permissions(script) | QFile::ExeOwner));

    crystalbuild::WorkspaceStager stager(m_config);
    stager.setRsyncAllowed(false);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(stager.stageProfile(&error));

    const QString staged = m_config.stagedProfileDir() + "/airootfs/usr/local/bin/welcome-center";
    QVERIFY(QFileInfo(staged).isExecutable());
}

void WorkspaceStagerTests::testRsyncMatchesCopy()
{
    if (QStandardPaths::findExecutable(QStringLiteral("rsync")).isEmpty()) {
        QSKIP("rsync not installed");
    }

    crystalbuild::WorkspaceStager stager(m_config);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(writeFile(m_config.stagedProfileDir() + "/leftover", "stale"));

    QVERIFY2(stager.mirrorWithRsync(&error), qPrintable(error));
    QCOMPARE(stager.lastStagingMethod(), crystalbuild::StagingMethod::Rsync);
    const auto viaRsync = snapshotTree(m_config.stagedProfileDir());

    QVERIFY(stager.mirrorWithCopy(&error));
    const auto viaCopy = snapshotTree(m_config.stagedProfileDir());

    QCOMPARE(viaRsync, viaCopy);
    QCOMPARE(viaRsync, withoutGit(snapshotTree(m_config.profileSourceDir)));
}

void WorkspaceStagerTests::testStampVersion()
{
    crystalbuild::WorkspaceStager stager(m_config);

    QString error;
    QVERIFY(stager.ensureDirectories(&error));
    QVERIFY(stager.stageProfile(&error));
    QVERIFY2(stager.stampVersion(QDate(2026, 3, 5), &error), qPrintable(error));

    QFile file(stager.versionFilePath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("2026.03\n"));
    QVERIFY(stager.versionFilePath().endsWith(
        QStringLiteral("/archiso/airootfs/etc/crystallinux-version")));
}

QTEST_MAIN(WorkspaceStagerTests)
#include "test_workspace_stager.moc"
