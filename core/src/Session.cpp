// Session state machine: Disconnected -> Connecting -> Connected | Error,
// and back to Disconnected on close. A failed keepalive is fatal.
#include "sshm/Session.hpp"

namespace sshm {

Session::Session(std::unique_ptr<Transport> transport, KnownHostsStore &trust)
    : transport_(std::move(transport)), trust_(trust) {}

Session::~Session() {
    // Release failures have nowhere to go from here; disconnect() still
    // frees everything it owns.
    Error err;
    disconnect(err);
    std::thread t = std::move(keepAliveThread_);
    if (t.joinable())
        t.join();
}

bool Session::validate(const Endpoint &endpoint, const Credential &credential,
                       Error &err) const {
    if (endpoint.host.empty()) {
        err = Error::make(ErrorKind::InvalidArgument, "host is required");
        return false;
    }
    if (endpoint.login.empty()) {
        err = Error::make(ErrorKind::InvalidArgument, "login is required");
        return false;
    }
    if (endpoint.port == 0) {
        err = Error::make(ErrorKind::InvalidArgument, "invalid port");
        return false;
    }
    const bool hasPassword = credential.password.has_value();
    const bool hasKey = credential.private_key_path.has_value();
    if (hasPassword == hasKey) {
        err = Error::make(ErrorKind::InvalidArgument,
                          "exactly one of password or private key is required");
        return false;
    }
    if (hasKey && credential.private_key_path->empty()) {
        err = Error::make(ErrorKind::InvalidArgument,
                          "private key path is empty");
        return false;
    }
    return true;
}

void Session::joinStaleKeepAlive() {
    std::thread stale;
    {
        std::lock_guard<std::mutex> lk(lifecycleMutex_);
        stale = takeKeepAliveThread();
    }
    // A keepalive task that already failed may still be finishing its own
    // disconnect; it must be gone before a new transport is opened.
    if (stale.joinable())
        stale.join();
}

bool Session::connect(const Endpoint &endpoint, const Credential &credential,
                      const ConnectionOptions &options, Error &err) {
    joinStaleKeepAlive();
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    return connectLocked(endpoint, credential, options, err);
}

bool Session::connectLocked(const Endpoint &endpoint,
                            const Credential &credential,
                            const ConnectionOptions &options, Error &err) {
    err.clear();
    if (state() == SessionState::Connected) {
        err = Error::make(ErrorKind::InvalidArgument, "already connected");
        return false;
    }

    setState(SessionState::Connecting);
    if (!validate(endpoint, credential, err)) {
        setError(err);
        return false;
    }

    HostKeyVerifier verifier = [this](const HostKeyInfo &key) {
        std::string storeErr;
        const HostKeyVerdict verdict = trust_.verify(key, storeErr);
        // An unreadable store trusts nothing.
        if (!storeErr.empty())
            return HostKeyVerdict::Unknown;
        return verdict;
    };

    Error openErr;
    if (!transport_->open(endpoint, credential, options, verifier, openErr)) {
        if (openErr.kind == ErrorKind::HostKeyVerificationRequired &&
            openErr.host_key) {
            std::lock_guard<std::mutex> lk(stateMutex_);
            pendingHostKey_ = openErr.host_key;
        }
        err = openErr;
        setError(err);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        endpoint_ = endpoint;
        pendingHostKey_.reset();
        lastError_.clear();
        keepAlive_ = options.keep_alive ? options.keep_alive_interval
                                        : std::chrono::milliseconds(0);
    }
    setState(SessionState::Connected);
    startKeepAlive();
    return true;
}

bool Session::fetchHostKey(const Endpoint &endpoint,
                           const Credential &credential,
                           const ConnectionOptions &options, HostKeyInfo &out,
                           Error &err) {
    HostKeyVerifier rejectAll = [](const HostKeyInfo &) {
        return HostKeyVerdict::Unknown;
    };
    Error openErr;
    if (transport_->open(endpoint, credential, options, rejectAll, openErr)) {
        Error closeErr;
        if (!transport_->close(closeErr)) {
            err = closeErr;
            return false;
        }
        err = Error::make(ErrorKind::Connection,
                          "host key fetch did not stop at verification");
        return false;
    }
    if (openErr.kind != ErrorKind::HostKeyVerificationRequired ||
        !openErr.host_key) {
        err = openErr;
        return false;
    }
    out = *openErr.host_key;
    return true;
}

bool Session::connectWithAcceptedKey(const Endpoint &endpoint,
                                     const Credential &credential,
                                     const ConnectionOptions &options,
                                     Error &err) {
    joinStaleKeepAlive();
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    err.clear();
    if (state() == SessionState::Connected) {
        err = Error::make(ErrorKind::InvalidArgument, "already connected");
        return false;
    }
    if (!validate(endpoint, credential, err)) {
        setError(err);
        return false;
    }

    std::optional<HostKeyInfo> key;
    {
        std::lock_guard<std::mutex> slk(stateMutex_);
        if (pendingHostKey_ && pendingHostKey_->host == endpoint.host &&
            pendingHostKey_->port == endpoint.port)
            key = pendingHostKey_;
    }
    if (!key) {
        HostKeyInfo fetched;
        if (!fetchHostKey(endpoint, credential, options, fetched, err)) {
            setError(err);
            return false;
        }
        key = fetched;
    }

    std::string storeErr;
    if (!trust_.replace(*key, storeErr)) {
        err = Error::make(ErrorKind::Connection,
                          "cannot record host key: " + storeErr, trust_.path());
        setError(err);
        return false;
    }
    return connectLocked(endpoint, credential, options, err);
}

bool Session::disconnect(Error &err) {
    std::thread toJoin;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lk(lifecycleMutex_);
        ok = disconnectLocked(err, toJoin);
    }
    if (toJoin.joinable())
        toJoin.join();
    return ok;
}

bool Session::disconnectLocked(Error &err, std::thread &toJoin) {
    err.clear();
    stopKeepAlive();
    toJoin = takeKeepAliveThread();

    std::shared_ptr<ShellChannel> shell;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        shell = std::move(shell_);
        shell_.reset();
    }

    // Best effort: every resource is released even if an earlier one fails.
    Error first;
    if (shell) {
        Error e;
        if (!shell->close(e) && first.ok())
            first = e;
    }
    Error e;
    if (!transport_->close(e) && first.ok())
        first = e;

    setState(SessionState::Disconnected);

    if (!first.ok()) {
        err = Error::make(ErrorKind::ResourceRelease,
                          "close failed: " + first.describe());
        return false;
    }
    return true;
}

bool Session::isConnected() const {
    return state() == SessionState::Connected;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return state_;
}

Error Session::lastError() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return lastError_;
}

Endpoint Session::endpoint() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return endpoint_;
}

std::optional<HostKeyInfo> Session::pendingHostKey() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return pendingHostKey_;
}

TerminalSize Session::terminalSize() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return termSize_;
}

void Session::setTerminalSize(TerminalSize size) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    termSize_ = size;
}

std::chrono::milliseconds Session::keepAliveInterval() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return keepAlive_;
}

void Session::setKeepAliveInterval(std::chrono::milliseconds interval) {
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        keepAlive_ = interval;
    }
    {
        std::lock_guard<std::mutex> lk(keepAliveMutex_);
        keepAliveWake_ = true;
    }
    keepAliveCv_.notify_all();
}

void Session::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    listener_ = std::move(listener);
}

std::shared_ptr<ShellChannel> Session::openShellChannel(Error &err) {
    err.clear();
    if (!isConnected()) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return nullptr;
    }
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (shell_) {
            err = Error::make(ErrorKind::InvalidArgument,
                              "an interactive shell is already open");
            return nullptr;
        }
    }
    std::unique_ptr<ShellChannel> ch = transport_->openShell(err);
    if (!ch)
        return nullptr;
    std::shared_ptr<ShellChannel> shared(std::move(ch));
    std::lock_guard<std::mutex> lk(stateMutex_);
    shell_ = shared;
    return shared;
}

void Session::releaseShellChannel(
    const std::shared_ptr<ShellChannel> &channel) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    if (shell_ == channel)
        shell_.reset();
}

void Session::setState(SessionState next) {
    SessionState prev;
    Error current;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        prev = state_;
        if (prev == next)
            return;
        state_ = next;
        current = lastError_;
    }
    notify(prev, next, next == SessionState::Error ? current : Error{});
}

void Session::setError(const Error &e) {
    SessionState prev;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        prev = state_;
        lastError_ = e;
        state_ = SessionState::Error;
    }
    notify(prev, SessionState::Error, e);
}

void Session::notify(SessionState from, SessionState to, const Error &e) {
    StateListener cb;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        cb = listener_;
    }
    if (cb)
        cb(from, to, e);
}

void Session::startKeepAlive() {
    {
        std::lock_guard<std::mutex> lk(keepAliveMutex_);
        keepAliveStop_ = false;
        keepAliveWake_ = false;
    }
    keepAliveThread_ = std::thread([this] { keepAliveLoop(); });
}

void Session::stopKeepAlive() {
    {
        std::lock_guard<std::mutex> lk(keepAliveMutex_);
        keepAliveStop_ = true;
    }
    keepAliveCv_.notify_all();
}

std::thread Session::takeKeepAliveThread() {
    // The keepalive task cannot join itself; it is collected later.
    if (keepAliveThread_.joinable() &&
        keepAliveThread_.get_id() == std::this_thread::get_id())
        return std::thread();
    return std::move(keepAliveThread_);
}

void Session::keepAliveLoop() {
    std::unique_lock<std::mutex> lk(keepAliveMutex_);
    while (!keepAliveStop_) {
        const std::chrono::milliseconds interval = keepAliveInterval();
        if (interval.count() <= 0) {
            keepAliveCv_.wait(lk,
                              [this] { return keepAliveStop_ || keepAliveWake_; });
            keepAliveWake_ = false;
            continue;
        }
        if (keepAliveCv_.wait_for(lk, interval, [this] {
                return keepAliveStop_ || keepAliveWake_;
            })) {
            keepAliveWake_ = false;
            continue;
        }

        lk.unlock();
        Error sendErr;
        const bool ok = transport_->sendKeepalive(sendErr);
        lk.lock();
        if (ok)
            continue;
        if (keepAliveStop_)
            break;
        lk.unlock();

        // Fail fast: one missed round-trip means the transport is gone.
        setError(Error::make(ErrorKind::Keepalive,
                             "keepalive failed: " + sendErr.describe()));
        Error closeErr;
        if (!disconnect(closeErr)) {
            std::lock_guard<std::mutex> slk(stateMutex_);
            lastError_.message += "; " + closeErr.describe();
        }
        return;
    }
}

} // namespace sshm
