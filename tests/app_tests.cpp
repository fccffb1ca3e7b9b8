// Front-end tests: settings, profiles, command-line parsing, the transfer
// selection and the command runner over the mock transport.
#include "AppSettings.hpp"
#include "CommandLine.hpp"
#include "CommandRunner.hpp"
#include "Logging.hpp"
#include "ProgressPrinter.hpp"
#include "TransferQueue.hpp"

#include "sshm/KnownHostsStore.hpp"
#include "sshm/MockTransport.hpp"
#include "sshm/Session.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QStringList>
#include <QTemporaryDir>
#include <QTextStream>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle,
                       const std::string &msg) {
        check(haystack.contains(needle), msg);
    }
};

bool writeText(const QString &path, const QString &text) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
        return false;
    QTextStream out(&f);
    out << text;
    return true;
}

// Connected session over the mock transport with a trusted host key.
struct RunnerFixture {
    QTemporaryDir dir;
    sshm::KnownHostsStore trust;
    sshm::MockTransport *transport = nullptr;
    std::unique_ptr<sshm::Session> session;
    sshm::AppSettings settings;
    QStringList lines;
    QStringList progress;

    RunnerFixture()
        : trust(dir.filePath(QStringLiteral("known_hosts")).toStdString()) {
        auto t = std::make_unique<sshm::MockTransport>();
        transport = t.get();
        session = std::make_unique<sshm::Session>(std::move(t), trust);
        settings.chunk_size = 4096;
    }

    sshm::Endpoint endpoint() const {
        sshm::Endpoint ep;
        ep.host = "10.0.0.5";
        ep.login = "alice";
        return ep;
    }

    sshm::ConnectionOptions options() const {
        sshm::ConnectionOptions opt;
        opt.keep_alive = false;
        return opt;
    }

    void attach(sshm::CommandRunner &runner) {
        runner.setOutput([this](const QString &line) { lines << line; });
        runner.setProgressOutput([this](const QString &line) { progress << line; });
    }
};

void test_settings_defaults_without_file(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("missing.ini"));
    sshm::AppSettings s;
    QString err;
    t.check(sshm::loadSettings(path, s, err), "missing file should load defaults");
    t.check(s.keep_alive_seconds == 30, "keepalive should default to 30 s");
    t.check(s.connect_timeout.count() == 10000, "timeout should default to 10 s");
    t.check(s.chunk_size == 32 * 1024, "chunk size should default to 32 KiB");
    t.check(s.progress_queue == 64, "progress queue should default to 64");
    t.check(s.terminal_type == QLatin1String("xterm-256color"),
            "terminal type should default to xterm-256color");
    t.check(s.known_hosts_path == dir.path() + QStringLiteral("/ssh/known_hosts"),
            "known_hosts should live beside the config file");
}

void test_settings_clamping(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("sshm.ini"));
    t.check(writeText(path, QStringLiteral("[session]\n"
                                           "keepAliveSeconds=0\n"
                                           "connectTimeoutMs=7000\n"
                                           "[transfer]\n"
                                           "chunkSize=100\n"
                                           "progressQueue=8\n"
                                           "[terminal]\n"
                                           "type=vt100\n")),
            "config should be written");
    sshm::AppSettings s;
    QString err;
    t.check(sshm::loadSettings(path, s, err), "config should load");
    t.check(s.keep_alive_seconds == 0, "keepalive 0 should disable it");
    t.check(s.connect_timeout.count() == 7000, "timeout should be read");
    t.check(s.chunk_size == sshm::AppSettings::kMinChunkSize,
            "tiny chunk size should be clamped up");
    t.check(s.progress_queue == 8, "progress queue should be read");
    t.check(s.terminal_type == QLatin1String("vt100"), "terminal type should be read");

    t.check(writeText(path, QStringLiteral("[transfer]\nchunkSize=99999999\n")),
            "config should be rewritten");
    t.check(sshm::loadSettings(path, s, err), "config should load again");
    t.check(s.chunk_size == sshm::AppSettings::kMaxChunkSize,
            "huge chunk size should be clamped down");
}

void test_profiles(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("sshm.ini"));
    t.check(writeText(path, QStringLiteral("[profile.work]\n"
                                           "host=10.0.0.5\n"
                                           "port=2222\n"
                                           "login=alice\n"
                                           "identityFile=/keys/id_ed25519\n"
                                           "compression=true\n"
                                           "[profile.bad]\n"
                                           "host=h\n"
                                           "login=l\n"
                                           "password=p\n"
                                           "identityFile=/k\n")),
            "config should be written");

    t.check(sshm::profileNames(path) ==
                QStringList({QStringLiteral("bad"), QStringLiteral("work")}),
            "profile names should be listed");

    sshm::AppSettings defaults;
    sshm::ConnectionProfile p;
    QString err;
    t.check(sshm::loadProfile(path, QStringLiteral("work"), defaults, p, err),
            "profile should load: " + err.toStdString());
    t.check(p.endpoint.host == "10.0.0.5" && p.endpoint.port == 2222 &&
                p.endpoint.login == "alice",
            "endpoint should come from the profile");
    t.check(p.credential.private_key_path &&
                *p.credential.private_key_path == "/keys/id_ed25519",
            "identity file should become a key credential");
    t.check(!p.credential.password, "key profile should have no password");
    t.check(p.options.compression, "compression flag should be read");
    t.check(p.options.terminal_type == "xterm-256color",
            "terminal type should fall back to the global default");

    t.check(!sshm::loadProfile(path, QStringLiteral("bad"), defaults, p, err),
            "profile with two credentials should be refused");
    t.check(!sshm::loadProfile(path, QStringLiteral("nope"), defaults, p, err),
            "unknown profile should be refused");
    t.checkContains(err, QStringLiteral("unknown profile"),
                    "unknown profile should be named in the error");

    sshm::ConnectionProfile saved;
    saved.name = QStringLiteral("home");
    saved.endpoint.host = "192.168.1.2";
    saved.endpoint.login = "bob";
    saved.credential = sshm::Credential::fromPassword("pw");
    t.check(sshm::saveProfile(path, saved, err), "profile should be saved");
    t.check(sshm::loadProfile(path, QStringLiteral("home"), defaults, p, err) &&
                p.endpoint.host == "192.168.1.2" && p.credential.password &&
                *p.credential.password == "pw",
            "saved profile should load back");
    t.check(sshm::profileNames(path).size() == 3,
            "saving should keep the other profiles");
}

void test_command_line(TestContext &t) {
    sshm::CommandRequest r;
    QString err, usage, version;
    t.check(sshm::parseCommandLine(
                {QStringLiteral("sshm"), QStringLiteral("-H"),
                 QStringLiteral("10.0.0.5"), QStringLiteral("-p"),
                 QStringLiteral("2200"), QStringLiteral("-l"),
                 QStringLiteral("alice"), QStringLiteral("--password-env"),
                 QStringLiteral("put"), QStringLiteral("a"),
                 QStringLiteral("b"), QStringLiteral("/srv")},
                r, err, usage, version),
            "valid command line should parse: " + err.toStdString());
    t.check(r.host == QLatin1String("10.0.0.5") && r.port == 2200 &&
                r.login == QLatin1String("alice") && r.password_from_env,
            "connection flags should be read");
    t.check(r.command == QLatin1String("put") && r.args.size() == 3,
            "command and arguments should be split");

    t.check(!sshm::parseCommandLine({QStringLiteral("sshm"), QStringLiteral("-H"),
                                     QStringLiteral("h"), QStringLiteral("frobnicate")},
                                    r, err, usage, version),
            "unknown command should be refused");
    t.check(!sshm::parseCommandLine({QStringLiteral("sshm"), QStringLiteral("-H"),
                                     QStringLiteral("h"), QStringLiteral("mv"),
                                     QStringLiteral("a")},
                                    r, err, usage, version),
            "mv with one argument should be refused");
    t.check(!sshm::parseCommandLine({QStringLiteral("sshm"), QStringLiteral("ls"),
                                     QStringLiteral("/")},
                                    r, err, usage, version),
            "a host or profile should be required");
    t.check(!sshm::parseCommandLine({QStringLiteral("sshm"), QStringLiteral("-H"),
                                     QStringLiteral("h"), QStringLiteral("-p"),
                                     QStringLiteral("70000"), QStringLiteral("ls"),
                                     QStringLiteral("/")},
                                    r, err, usage, version),
            "out-of-range port should be refused");
}

void test_resolve_connection(TestContext &t) {
    sshm::CommandRequest r;
    r.host = QStringLiteral("10.0.0.5");
    r.login = QStringLiteral("alice");
    r.password_from_env = true;
    sshm::AppSettings s;
    s.keep_alive_seconds = 0;
    sshm::ConnectionProfile p;
    QString err;

    qunsetenv("SSHM_PASSWORD");
    t.check(!sshm::resolveConnection(r, s, p, err),
            "missing SSHM_PASSWORD should be an error");
    qputenv("SSHM_PASSWORD", "from-env");
    t.check(sshm::resolveConnection(r, s, p, err),
            "password from the environment should resolve");
    t.check(p.credential.password && *p.credential.password == "from-env",
            "password should come from SSHM_PASSWORD");
    t.check(!p.options.keep_alive, "keepalive 0 should disable keepalive");
    qunsetenv("SSHM_PASSWORD");
}

void test_selection_cleared_after_batch(TestContext &t) {
    RunnerFixture f;
    sshm::Error err;
    t.check(f.session->connectWithAcceptedKey(
                f.endpoint(), sshm::Credential::fromPassword("pw"), f.options(),
                err),
            "session should connect");
    sshm::TransferEngine engine(4096);
    t.check(engine.open(f.session->transport(), err), "engine should open");

    const QString a = f.dir.filePath(QStringLiteral("a.txt"));
    const QString c = f.dir.filePath(QStringLiteral("c.txt"));
    t.check(writeText(a, QStringLiteral("a")) && writeText(c, QStringLiteral("c")),
            "local files should be written");
    f.transport->fileSystem()->addDirectory("/srv");

    sshm::TransferQueue queue(engine);
    std::vector<int> selectionSizes;
    std::vector<int> failedIndexes;
    QObject::connect(&queue, &sshm::TransferQueue::selectionChanged,
                     [&](int n) { selectionSizes.push_back(n); });
    QObject::connect(&queue, &sshm::TransferQueue::batchFinished,
                     [&](bool, int failedIndex, const QString &) {
                         failedIndexes.push_back(failedIndex);
                     });

    sshm::TransferItem item;
    item.source = a.toStdString();
    item.destination = "/srv/a.txt";
    queue.select(item);
    item.source = f.dir.filePath(QStringLiteral("missing.txt")).toStdString();
    item.destination = "/srv/b.txt";
    queue.select(item);
    item.source = c.toStdString();
    item.destination = "/srv/c.txt";
    queue.select(item);
    t.check(queue.selection().size() == 3, "three items should be selected");

    std::size_t failed = 0;
    t.check(!queue.runBatch(nullptr, failed, err), "batch should fail on item 2");
    t.check(failed == 1, "failed index should be 1");
    t.check(queue.selection().empty(),
            "selection should be cleared after a failed batch");
    t.check(!queue.isRunning(), "queue should be idle after the batch");
    t.check(failedIndexes.size() == 1 && failedIndexes[0] == 1,
            "batchFinished should report the failing item");
    t.check(!selectionSizes.empty() && selectionSizes.back() == 0,
            "selection change to empty should be signalled last");
    t.check(f.transport->fileSystem()->exists("/srv/a.txt") &&
                !f.transport->fileSystem()->exists("/srv/c.txt"),
            "batch should stop at the failure");

    sshm::Error closeErr;
    t.check(engine.close(closeErr), "engine should close");
}

void test_runner_host_key_prompt(TestContext &t) {
    RunnerFixture f;
    sshm::CommandRunner runner(*f.session, f.settings);
    f.attach(runner);

    int prompts = 0;
    runner.setHostKeyPrompt([&](const sshm::HostKeyInfo &key) {
        ++prompts;
        return key.host == "10.0.0.5";
    });
    sshm::Error err;
    const int rc = runner.connect(f.endpoint(), sshm::Credential::fromPassword("pw"),
                                  f.options(), false, err);
    t.check(rc == sshm::kExitOk, "accepted key should connect: " + err.describe());
    t.check(prompts == 1, "user should be asked once");
    t.check(!f.lines.isEmpty() && f.lines.first().contains(QStringLiteral("Fingerprint")),
            "fingerprint should be shown before asking");

    sshm::Error discErr;
    t.check(f.session->disconnect(discErr), "disconnect should succeed");
    t.check(runner.connect(f.endpoint(), sshm::Credential::fromPassword("pw"),
                           f.options(), false, err) == sshm::kExitOk,
            "second connect should not prompt");
    t.check(prompts == 1, "trusted key should not prompt again");
}

void test_runner_host_key_rejected(TestContext &t) {
    RunnerFixture f;
    sshm::CommandRunner runner(*f.session, f.settings);
    f.attach(runner);
    runner.setHostKeyPrompt([](const sshm::HostKeyInfo &) { return false; });
    sshm::Error err;
    t.check(runner.connect(f.endpoint(), sshm::Credential::fromPassword("pw"),
                           f.options(), false, err) ==
                sshm::kExitHostKeyRejected,
            "rejected key should not connect");
    t.check(!f.session->isConnected(), "session should stay disconnected");
}

void test_runner_commands(TestContext &t) {
    RunnerFixture f;
    sshm::CommandRunner runner(*f.session, f.settings);
    f.attach(runner);
    sshm::Error err;
    t.check(runner.connect(f.endpoint(), sshm::Credential::fromPassword("pw"),
                           f.options(), true, err) == sshm::kExitOk,
            "--accept-host-key should connect without asking");

    auto fs = f.transport->fileSystem();
    fs->addFile("/srv/docs/readme.md", "# docs\n", 0644);

    t.check(runner.execute(QStringLiteral("ls"), {QStringLiteral("/srv/docs")},
                           err) == sshm::kExitOk,
            "ls should succeed: " + err.describe());
    t.check(f.lines.size() == 1 && f.lines.first().endsWith(QStringLiteral("readme.md")),
            "ls should print one line per entry");
    t.check(!f.lines.isEmpty() && f.lines.first().startsWith(QStringLiteral("-rw-r--r--")),
            "ls should print permissions");

    t.check(runner.execute(QStringLiteral("mkdir"), {QStringLiteral("~/a/b")},
                           err) == sshm::kExitOk,
            "mkdir should succeed");
    t.check(fs->exists("/home/tester/a/b"), "mkdir should create parents");

    const QString local = f.dir.filePath(QStringLiteral("up.txt"));
    t.check(writeText(local, QStringLiteral("upload me")), "local file written");
    t.check(runner.execute(QStringLiteral("put"),
                           {local, QStringLiteral("~/a/b/up.txt")},
                           err) == sshm::kExitOk,
            "put should succeed: " + err.describe());
    std::string data;
    t.check(fs->readFile("/home/tester/a/b/up.txt", data) && data == "upload me",
            "put should upload the content");
    t.check(!f.progress.isEmpty() && f.progress.last().endsWith(QLatin1Char('\n')),
            "final progress line should be rendered");

    const QString back = f.dir.filePath(QStringLiteral("back"));
    t.check(runner.execute(QStringLiteral("get"), {QStringLiteral("/srv/docs"), back},
                           err) == sshm::kExitOk,
            "get of a directory should succeed: " + err.describe());
    t.check(QFile::exists(back + QStringLiteral("/readme.md")),
            "directory should be downloaded recursively");

    t.check(runner.execute(QStringLiteral("mv"),
                           {QStringLiteral("/srv/docs/readme.md"),
                            QStringLiteral("/srv/docs/README.md")},
                           err) == sshm::kExitOk,
            "mv should succeed");
    t.check(fs->exists("/srv/docs/README.md"), "mv should rename");

    t.check(runner.execute(QStringLiteral("rm"), {QStringLiteral("/srv/docs")},
                           err) == sshm::kExitOk,
            "rm should succeed");
    t.check(!fs->exists("/srv/docs"), "rm should remove the tree");

    t.check(runner.execute(QStringLiteral("stat"), {QStringLiteral("/srv/docs")},
                           err) == sshm::kExitFailure,
            "stat of a removed path should fail");
    t.check(err.kind == sshm::ErrorKind::Path, "missing path should be Path");

    t.check(runner.execute(QStringLiteral("shell"), {}, err) == sshm::kExitFailure,
            "shell without a terminal should fail");
}

void test_progress_line_format(TestContext &t) {
    sshm::TransferProgress p;
    p.file_name = "big.bin";
    p.total_bytes = 2048;
    p.transferred_bytes = 1024;
    const QString line = sshm::ProgressPrinter::formatLine(p);
    t.checkContains(line, QStringLiteral("big.bin"), "line should name the file");
    t.checkContains(line, QStringLiteral("50%"), "line should show the percentage");
    t.check(!line.endsWith(QLatin1Char('\n')), "intermediate line should not end");
    p.done = true;
    t.check(sshm::ProgressPrinter::formatLine(p).endsWith(QLatin1Char('\n')),
            "final line should end with a newline");
}

QStringList capturedLog;

void captureMessage(QtMsgType, const QMessageLogContext &, const QString &msg) {
    capturedLog << msg;
}

void test_state_log_redacts_host(TestContext &t) {
    sshm::Endpoint ep;
    ep.host = "10.0.0.5";
    ep.login = "alice";
    sshm::Error e = sshm::Error::make(
        sshm::ErrorKind::HostKeyVerificationRequired,
        "host key is not trusted for [10.0.0.5]:22");

    capturedLog.clear();
    QtMessageHandler previous = qInstallMessageHandler(captureMessage);
    sshm::logStateChange(sshm::SessionState::Connecting,
                         sshm::SessionState::Error, e, ep);
    qInstallMessageHandler(previous);

    const QString text = capturedLog.join(QLatin1Char('\n'));
    t.check(!capturedLog.isEmpty(), "transition should be logged");
    t.check(!text.contains(QStringLiteral("10.0.0.5")),
            "host should not appear in the log");
    t.checkContains(text, QStringLiteral("<redacted>"),
                    "host should be shown redacted");
    t.checkContains(text, QString::fromLatin1(sshm::toString(e.kind)),
                    "error kind should be logged");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    // The redaction policy is read once; keep it at its default.
    qunsetenv("SSHM_ENV");
    qunsetenv("SSHM_LOG_SENSITIVE");
    TestContext t;
    test_settings_defaults_without_file(t);
    test_settings_clamping(t);
    test_profiles(t);
    test_command_line(t);
    test_resolve_connection(t);
    test_selection_cleared_after_batch(t);
    test_runner_host_key_prompt(t);
    test_runner_host_key_rejected(t);
    test_runner_commands(t);
    test_progress_line_format(t);
    test_state_log_redacts_host(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sshm_app_tests\n";
    return EXIT_SUCCESS;
}
