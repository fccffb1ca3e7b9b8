// Executes one front-end command against a session.
#pragma once
#include "AppSettings.hpp"
#include "CommandLine.hpp"
#include "sshm/Session.hpp"
#include "sshm/TerminalDevice.hpp"
#include "sshm/TransferEngine.hpp"
#include <QString>
#include <functional>

namespace sshm {

enum ExitCode {
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
    kExitHostKeyRejected = 3
};

class CommandRunner {
public:
    using Writer = std::function<void(const QString &)>;
    // Asked when the host key is not trusted; true accepts and records it.
    using HostKeyPrompt = std::function<bool(const HostKeyInfo &)>;

    CommandRunner(Session &session, const AppSettings &settings);

    void setOutput(Writer out) { out_ = std::move(out); }
    void setProgressOutput(Writer out) { progressOut_ = std::move(out); }
    void setHostKeyPrompt(HostKeyPrompt prompt) { prompt_ = std::move(prompt); }
    // Needed by "shell" only.
    void setTerminalDevice(TerminalDevice *device) { device_ = device; }

    // Connects, asking about an untrusted host key unless acceptHostKey.
    int connect(const Endpoint &endpoint, const Credential &credential,
                const ConnectionOptions &options, bool acceptHostKey,
                Error &err);

    int execute(const QString &command, const QStringList &args, Error &err);

    static QString formatEntry(const DirectoryEntry &e);
    static QString formatHostKey(const HostKeyInfo &key);

private:
    int shell(Error &err);
    int list(const QString &path, Error &err);
    int stat(const QString &path, Error &err);
    int transfer(TransferDirection dir, const QStringList &args, Error &err);
    int mkdir(const QString &path, Error &err);
    int remove(const QString &path, Error &err);
    int rename(const QString &from, const QString &to, Error &err);

    // Runs fn over a transfer channel opened for this command only.
    int withEngine(const std::function<bool(TransferEngine &, Error &)> &fn,
                   Error &err);
    void write(const QString &line);

    Session &session_;
    AppSettings settings_;
    TerminalDevice *device_ = nullptr;
    Writer out_;
    Writer progressOut_;
    HostKeyPrompt prompt_;
};

} // namespace sshm
