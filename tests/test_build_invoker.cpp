#include <QtTest/QtTest>

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "builder/build_invoker.hpp"

// Records when each newline reaches the stream.
class LineTimingBuffer : public std::streambuf
{
public:
    explicit LineTimingBuffer(const QElapsedTimer &clock)
        : m_clock(clock)
    {
    }

    const std::string &text() const { return m_text; }
    const std::vector<qint64> &lineTimes() const { return m_lineTimes; }

protected:
    int_type overflow(int_type ch) override
    {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        m_text.push_back(traits_type::to_char_type(ch));
        if (ch == '\n') {
            m_lineTimes.push_back(m_clock.elapsed());
        }
        return ch;
    }

private:
    const QElapsedTimer &m_clock;
    std::string m_text;
    std::vector<qint64> m_lineTimes;
};

class BuildInvokerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testCommandLine();
    void testStreamsMergedOutput();
    void testForwardsLinesWhileRunning();
    void testKeepsBlankLinesAndNulBytes();
    void testRunsInProjectRoot();
    void testNonZeroExitFails();
    void testMissingBuilderFails();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    crystalbuild::BuildConfig m_config;

    QString writeBuilder(const QByteArray &body);
};

QString BuildInvokerTests::writeBuilder(const QByteArray &body)
{
    const QString path = m_tempDir.path() + "/fake-mkarchiso";
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to open file:" << path << file.errorString();
        return QString();
    }
    file.write("#!/bin/sh\n");
    file.write(body);
    file.close();
    file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

void BuildInvokerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void BuildInvokerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void BuildInvokerTests::init()
{
    m_config = crystalbuild::BuildConfig{};
    m_config.workDir = m_tempDir.path() + "/build/work";
    m_config.outputDir = m_tempDir.path() + "/build/out";
    m_config.projectRoot = m_tempDir.path() + "/project";
    m_config.profileSourceDir = m_tempDir.path() + "/archiso";
    QDir().mkpath(m_config.workDir);
    QDir().mkpath(m_config.outputDir);
    QDir().mkpath(m_config.projectRoot);
}

void BuildInvokerTests::testCommandLine()
{
    m_config.verbose = true;
    m_config.privilege.prefix = QStringList{QStringLiteral("doas")};
    m_config.privilege.helper = QStringLiteral("doas");

    crystalbuild::BuildInvoker invoker(m_config);
    const QStringList expected = {
        QStringLiteral("doas"),
        QStringLiteral("mkarchiso"),
        QStringLiteral("-v"),
        QStringLiteral("-w"), m_config.workDir,
        QStringLiteral("-o"), m_config.outputDir,
        m_config.stagedProfileDir(),
    };
    QCOMPARE(invoker.command(), expected);

    m_config.verbose = false;
    m_config.privilege = crystalbuild::PrivilegeCommand{};
    QCOMPARE(invoker.command().first(), QStringLiteral("mkarchiso"));
    QVERIFY(!invoker.command().contains(QStringLiteral("-v")));
}

void BuildInvokerTests::testStreamsMergedOutput()
{
    m_config.builderProgram = writeBuilder(
        "echo 'line one'\n"
        "echo 'line two' >&2\n"
        "echo 'line three'\n"
        "printf 'tail without newline'\n");

    crystalbuild::BuildInvoker invoker(m_config);
    std::ostringstream out;
    QString error;
    QVERIFY2(invoker.run(out, &error), qPrintable(error));
    QCOMPARE(invoker.lastExitCode(), 0);
    QCOMPARE(invoker.lastLineCount(), 4);

    const QString text = QString::fromStdString(out.str());
    QVERIFY(text.contains(QStringLiteral("line one\n")));
    QVERIFY(text.contains(QStringLiteral("line two\n")));
    QVERIFY(text.contains(QStringLiteral("tail without newline\n")));
    QVERIFY(text.indexOf(QStringLiteral("line one")) < text.indexOf(QStringLiteral("line three")));
}

void BuildInvokerTests::testForwardsLinesWhileRunning()
{
    m_config.builderProgram = writeBuilder(
        "echo 'building squashfs'\n"
        "sleep 2\n"
        "echo 'done'\n");

    QElapsedTimer clock;
    LineTimingBuffer buffer(clock);
    std::ostream out(&buffer);

    crystalbuild::BuildInvoker invoker(m_config);
    QString error;
    clock.start();
    QVERIFY2(invoker.run(out, &error), qPrintable(error));

    QCOMPARE(buffer.text(), std::string("building squashfs\ndone\n"));
    QCOMPARE(buffer.lineTimes().size(), std::size_t(2));
    // The first line arrived while the builder was still sleeping.
    QVERIFY(buffer.lineTimes()[0] + 1000 <= buffer.lineTimes()[1]);
}

void BuildInvokerTests::testKeepsBlankLinesAndNulBytes()
{
    m_config.builderProgram = writeBuilder("printf 'one\\n\\nx\\000y\\n'\n");

    crystalbuild::BuildInvoker invoker(m_config);
    std::ostringstream out;
    QString error;
    QVERIFY2(invoker.run(out, &error), qPrintable(error));

    QCOMPARE(out.str(), std::string("one\n\nx\0y\n", 9));
    QCOMPARE(invoker.lastLineCount(), 3);
}

void BuildInvokerTests::testRunsInProjectRoot()
{
    const QString marker = m_tempDir.path() + "/cwd.txt";
    m_config.builderProgram = writeBuilder(
        QStringLiteral("pwd -P > '%1'\n").arg(marker).toUtf8());

    const QString before = QDir::currentPath();
    crystalbuild::BuildInvoker invoker(m_config);
    std::ostringstream out;
    QString error;
    QVERIFY2(invoker.run(out, &error), qPrintable(error));
    QCOMPARE(QDir::currentPath(), before);

    QFile file(marker);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(file.readAll()).trimmed(),
             QFileInfo(m_config.projectRoot).canonicalFilePath());
}

void BuildInvokerTests::testNonZeroExitFails()
{
    m_config.builderProgram = writeBuilder("echo 'mkarchiso: error'\nexit 3\n");

    const QString before = QDir::currentPath();
    crystalbuild::BuildInvoker invoker(m_config);
    std::ostringstream out;
    QString error;
    QVERIFY(!invoker.run(out, &error));
    QCOMPARE(invoker.lastExitCode(), 3);
    QVERIFY(error.contains(QStringLiteral("3")));
    QVERIFY(QString::fromStdString(out.str()).contains(QStringLiteral("mkarchiso: error")));
    QCOMPARE(QDir::currentPath(), before);
}

void BuildInvokerTests::testMissingBuilderFails()
{
    m_config.builderProgram = m_tempDir.path() + "/no-such-mkarchiso";

    const QString before = QDir::currentPath();
    crystalbuild::BuildInvoker invoker(m_config);
    std::ostringstream out;
    QString error;
    QVERIFY(!invoker.run(out, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(QDir::currentPath(), before);
}

QTEST_MAIN(BuildInvokerTests)
#include "test_build_invoker.moc"
