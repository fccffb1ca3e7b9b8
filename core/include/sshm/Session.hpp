// Session lifecycle: owns one transport, the optional interactive channel
// and the keepalive task. All cross-thread state is guarded by stateMutex_.
#pragma once
#include "KnownHostsStore.hpp"
#include "Transport.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace sshm {

class Session {
public:
    // Invoked outside the session lock, on the thread that caused the
    // transition (keepalive failures arrive from the keepalive thread).
    using StateListener =
        std::function<void(SessionState from, SessionState to, const Error &)>;

    Session(std::unique_ptr<Transport> transport, KnownHostsStore &trust);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    bool connect(const Endpoint &endpoint, const Credential &credential,
                 const ConnectionOptions &options, Error &err);

    // Records the key presented by the host, then connects once. The key is
    // the one captured by the last HostKeyVerificationRequired for this
    // endpoint; without one the host is asked for it first.
    bool connectWithAcceptedKey(const Endpoint &endpoint,
                                const Credential &credential,
                                const ConnectionOptions &options, Error &err);

    // Idempotent and safe from any thread. Always ends in Disconnected;
    // returns the first release failure.
    bool disconnect(Error &err);

    bool isConnected() const;
    SessionState state() const;
    Error lastError() const;
    Endpoint endpoint() const;
    std::optional<HostKeyInfo> pendingHostKey() const;

    TerminalSize terminalSize() const;
    void setTerminalSize(TerminalSize size);

    std::chrono::milliseconds keepAliveInterval() const;
    // Applies to the running keepalive task too. Zero disables it.
    void setKeepAliveInterval(std::chrono::milliseconds interval);

    void setStateListener(StateListener listener);

    // The session keeps a reference so disconnect() can close it.
    std::shared_ptr<ShellChannel> openShellChannel(Error &err);
    void releaseShellChannel(const std::shared_ptr<ShellChannel> &channel);

    // Backend for independent channels (file transfers).
    Transport &transport() { return *transport_; }

private:
    bool connectLocked(const Endpoint &endpoint, const Credential &credential,
                       const ConnectionOptions &options, Error &err);
    bool disconnectLocked(Error &err, std::thread &toJoin);
    void joinStaleKeepAlive();
    bool validate(const Endpoint &endpoint, const Credential &credential,
                  Error &err) const;
    bool fetchHostKey(const Endpoint &endpoint, const Credential &credential,
                      const ConnectionOptions &options, HostKeyInfo &out,
                      Error &err);

    void setState(SessionState next);
    void setError(const Error &e);
    void notify(SessionState from, SessionState to, const Error &e);

    void startKeepAlive();
    void keepAliveLoop();
    std::thread takeKeepAliveThread();
    void stopKeepAlive();

    std::unique_ptr<Transport> transport_;
    KnownHostsStore &trust_;

    mutable std::mutex stateMutex_;
    SessionState state_ = SessionState::Disconnected;
    Error lastError_;
    Endpoint endpoint_;
    TerminalSize termSize_;
    std::chrono::milliseconds keepAlive_{30000};
    std::optional<HostKeyInfo> pendingHostKey_;
    std::shared_ptr<ShellChannel> shell_;
    StateListener listener_;

    // Serializes connect/disconnect against each other.
    std::mutex lifecycleMutex_;

    std::thread keepAliveThread_;
    std::mutex keepAliveMutex_;
    std::condition_variable keepAliveCv_;
    bool keepAliveStop_ = false;
    bool keepAliveWake_ = false;
};

} // namespace sshm
