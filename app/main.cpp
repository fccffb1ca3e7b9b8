// sshm entry point: parse flags, load settings, connect, run one command.
#include "AppSettings.hpp"
#include "CommandLine.hpp"
#include "CommandRunner.hpp"
#include "Logging.hpp"

#include "sshm/KnownHostsStore.hpp"
#include "sshm/Libssh2Transport.hpp"
#include "sshm/PosixTerminalDevice.hpp"
#include "sshm/Session.hpp"

#include <QCoreApplication>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

using namespace sshm;

static void printError(const QString &msg) {
    std::fprintf(stderr, "sshm: %s\n", msg.toLocal8Bit().constData());
}

static bool askHostKey(const HostKeyInfo &) {
    std::fputs("Trust this host key? [yes/no] ", stderr);
    std::fflush(stderr);
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "yes" || answer == "y";
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sshm"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SSHM_VERSION));

    CommandRequest request;
    QString err, usage, version;
    if (!parseCommandLine(QCoreApplication::arguments(), request, err, usage,
                          version)) {
        printError(err);
        return kExitUsage;
    }
    if (!usage.isEmpty() || !version.isEmpty()) {
        std::fputs((usage.isEmpty() ? version + '\n' : usage).toLocal8Bit().constData(),
                   stdout);
        return kExitOk;
    }
    if (request.config_path.isEmpty())
        request.config_path = defaultConfigPath();

    AppSettings settings;
    if (!loadSettings(request.config_path, settings, err)) {
        printError(err);
        return kExitUsage;
    }
    ConnectionProfile profile;
    if (!resolveConnection(request, settings, profile, err)) {
        printError(err);
        return kExitUsage;
    }

    KnownHostsStore trust(settings.known_hosts_path.toStdString());
    Session session(std::make_unique<Libssh2Transport>(), trust);
    session.setStateListener(
        [&session](SessionState from, SessionState to, const Error &e) {
            logStateChange(from, to, e, session.endpoint());
        });

    CommandRunner runner(session, settings);
    runner.setHostKeyPrompt(askHostKey);
    runner.setOutput([](const QString &line) {
        std::fputs(line.toLocal8Bit().constData(), stdout);
        std::fputc('\n', stdout);
        std::fflush(stdout);
    });

    Error sessionErr;
    int rc = runner.connect(profile.endpoint, profile.credential,
                            profile.options, request.accept_host_key,
                            sessionErr);
    if (rc != kExitOk) {
        if (rc == kExitHostKeyRejected)
            printError(QStringLiteral("host key not accepted"));
        else
            printError(QString::fromStdString(sessionErr.describe()));
        return rc;
    }

    std::unique_ptr<PosixTerminalDevice> device;
    if (request.command == QLatin1String("shell")) {
        device = std::make_unique<PosixTerminalDevice>();
        if (!device->init(sessionErr)) {
            printError(QString::fromStdString(sessionErr.describe()));
            Error closeErr;
            if (!session.disconnect(closeErr))
                qCWarning(sshmSession) << "disconnect failed"
                                       << toString(closeErr.kind);
            return kExitFailure;
        }
        runner.setTerminalDevice(device.get());
    }

    rc = runner.execute(request.command, request.args, sessionErr);
    if (rc != kExitOk && !sessionErr.ok())
        printError(QString::fromStdString(sessionErr.describe()));

    Error closeErr;
    if (!session.disconnect(closeErr)) {
        printError(QString::fromStdString(closeErr.describe()));
        if (rc == kExitOk)
            rc = kExitFailure;
    }
    return rc;
}
