#include "sshm/MockTransport.hpp"
#include "sshm/PathUtils.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace sshm {

namespace {

std::string mockFingerprint(const std::string &blob) {
    // FNV-1a; stable across runs, good enough to tell keys apart.
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : blob) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llX", (unsigned long long)h);
    std::string out = "FNV1A:";
    for (int i = 0; i < 16; i += 2) {
        if (i)
            out += ':';
        out.append(buf + i, 2);
    }
    return out;
}

Error notConnected() {
    return Error::make(ErrorKind::NotConnected, "not connected");
}

} // namespace

// ---------------------------------------------------------------------------
// MockFileSystem

MockFileSystem::MockFileSystem() {
    addDirectory(home());
}

std::string MockFileSystem::absolute(const std::string &path) const {
    const std::string p = normalizeRemotePath(path);
    if (p == ".")
        return home();
    if (!p.empty() && p[0] == '/')
        return p;
    return normalizeRemotePath(home() + "/" + p);
}

void MockFileSystem::addDirectory(const std::string &path) {
    std::lock_guard<std::mutex> lk(mutex);
    std::string cur;
    const std::string abs = absolute(path);
    nodes["/"].is_dir = true;
    nodes["/"].mode = 040755;
    std::size_t start = 1;
    while (start <= abs.size()) {
        std::size_t slash = abs.find('/', start);
        if (slash == std::string::npos)
            slash = abs.size();
        if (slash > start) {
            cur += "/" + abs.substr(start, slash - start);
            Node &n = nodes[cur];
            n.is_dir = true;
            n.mode = 040755;
        }
        start = slash + 1;
    }
}

void MockFileSystem::addFile(const std::string &path, const std::string &data,
                             std::uint32_t mode) {
    const std::string abs = absolute(path);
    addDirectory(remoteParentPath(abs));
    std::lock_guard<std::mutex> lk(mutex);
    Node &n = nodes[abs];
    n.is_dir = false;
    n.data = data;
    n.mode = 0100000 | (mode & 0777);
}

bool MockFileSystem::exists(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mutex);
    return nodes.count(absolute(path)) != 0;
}

bool MockFileSystem::readFile(const std::string &path, std::string &out) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = nodes.find(absolute(path));
    if (it == nodes.end() || it->second.is_dir)
        return false;
    out = it->second.data;
    return true;
}

std::vector<std::string> MockFileSystem::paths() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<std::string> out;
    for (const auto &kv : nodes)
        out.push_back(kv.first);
    return out;
}

void MockFileSystem::denyPath(const std::string &path) {
    const std::string abs = absolute(path);
    std::lock_guard<std::mutex> lk(mutex);
    denied.push_back(abs);
}

void MockFileSystem::setReportedSize(const std::string &path,
                                     std::uint64_t size) {
    const std::string abs = absolute(path);
    std::lock_guard<std::mutex> lk(mutex);
    auto it = nodes.find(abs);
    if (it != nodes.end())
        it->second.reported_size = size;
}

bool MockFileSystem::isDenied(const std::string &path) const {
    return std::find(denied.begin(), denied.end(), path) != denied.end();
}

// ---------------------------------------------------------------------------
// Mock SFTP

namespace {

struct MockSftpState {
    std::shared_ptr<MockFileSystem> fs;
    std::shared_ptr<std::atomic<bool>> alive;
    std::atomic<bool> closed{false};

    bool usable(Error &err) const {
        if (closed || !*alive) {
            err = Error::make(ErrorKind::TransferIO, "channel closed");
            return false;
        }
        return true;
    }
};

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockSftpState> st, std::string path,
                   bool writing)
        : st_(std::move(st)), path_(std::move(path)), writing_(writing) {}

    long read(char *buf, std::size_t len, Error &err) override {
        if (!st_->usable(err)) {
            err.path = path_;
            return -1;
        }
        std::lock_guard<std::mutex> lk(st_->fs->mutex);
        auto it = st_->fs->nodes.find(path_);
        if (it == st_->fs->nodes.end()) {
            err = Error::make(ErrorKind::TransferIO, "remote read failed: no such file", path_);
            return -1;
        }
        const std::string &data = it->second.data;
        if (offset_ >= data.size())
            return 0;
        const std::size_t n = std::min(len, data.size() - offset_);
        std::memcpy(buf, data.data() + offset_, n);
        offset_ += n;
        return (long)n;
    }

    bool write(const char *buf, std::size_t len, Error &err) override {
        if (!st_->usable(err)) {
            err.path = path_;
            return false;
        }
        std::lock_guard<std::mutex> lk(st_->fs->mutex);
        auto it = st_->fs->nodes.find(path_);
        if (!writing_ || it == st_->fs->nodes.end()) {
            err = Error::make(ErrorKind::TransferIO, "remote write failed", path_);
            return false;
        }
        it->second.data.append(buf, len);
        return true;
    }

    bool close(Error &) override { return true; }

private:
    std::shared_ptr<MockSftpState> st_;
    std::string path_;
    bool writing_;
    std::size_t offset_ = 0;
};

class MockSftpChannel : public SftpChannel {
public:
    explicit MockSftpChannel(std::shared_ptr<MockSftpState> st)
        : st_(std::move(st)) {}

    bool isOpen() const override { return !st_->closed && *st_->alive; }

    bool close(Error &) override {
        st_->closed = true;
        return true;
    }

    bool list(const std::string &path, std::vector<DirectoryEntry> &out,
              Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        if (fs.isDenied(abs)) {
            err = Error::make(ErrorKind::TransferIO, "sftp_opendir failed: permission denied", abs);
            return false;
        }
        auto it = fs.nodes.find(abs);
        if (it == fs.nodes.end() || !it->second.is_dir) {
            err = Error::make(ErrorKind::TransferIO, "sftp_opendir failed: no such file", abs);
            return false;
        }
        out.clear();
        const std::string prefix = abs == "/" ? "/" : abs + "/";
        for (auto c = fs.nodes.lower_bound(prefix); c != fs.nodes.end(); ++c) {
            const std::string &p = c->first;
            if (p.compare(0, prefix.size(), prefix) != 0)
                break;
            const std::string rest = p.substr(prefix.size());
            if (rest.empty() || rest.find('/') != std::string::npos)
                continue;
            out.push_back(entry(rest, c->second));
        }
        return true;
    }

    bool stat(const std::string &path, DirectoryEntry &info,
              Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        if (fs.isDenied(abs)) {
            err = Error::make(ErrorKind::TransferIO, "sftp_stat failed: permission denied", abs);
            return false;
        }
        auto it = fs.nodes.find(abs);
        if (it == fs.nodes.end()) {
            err.clear();
            return false;
        }
        info = entry(remoteBaseName(abs), it->second);
        return true;
    }

    bool lstat(const std::string &path, DirectoryEntry &info,
               Error &err) override {
        // No symbolic links in the mock.
        return stat(path, info, err);
    }

    bool mkdir(const std::string &path, std::uint32_t mode,
               Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        if (fs.isDenied(abs) || !parentIsDir(fs, abs) || fs.nodes.count(abs)) {
            err = Error::make(ErrorKind::TransferIO, "sftp_mkdir failed", abs);
            return false;
        }
        MockFileSystem::Node &n = fs.nodes[abs];
        n.is_dir = true;
        n.mode = 040000 | (mode & 0777);
        return true;
    }

    bool removeFile(const std::string &path, Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        auto it = fs.nodes.find(abs);
        if (fs.isDenied(abs) || it == fs.nodes.end() || it->second.is_dir) {
            err = Error::make(ErrorKind::TransferIO, "sftp_unlink failed", abs);
            return false;
        }
        fs.nodes.erase(it);
        return true;
    }

    bool removeDir(const std::string &path, Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        auto it = fs.nodes.find(abs);
        if (fs.isDenied(abs) || it == fs.nodes.end() || !it->second.is_dir) {
            err = Error::make(ErrorKind::TransferIO, "sftp_rmdir failed", abs);
            return false;
        }
        const std::string prefix = abs == "/" ? "/" : abs + "/";
        auto child = fs.nodes.lower_bound(prefix);
        if (child != fs.nodes.end() &&
            child->first.compare(0, prefix.size(), prefix) == 0) {
            err = Error::make(ErrorKind::TransferIO,
                              "sftp_rmdir failed: directory not empty", abs);
            return false;
        }
        fs.nodes.erase(it);
        return true;
    }

    bool rename(const std::string &from, const std::string &to,
                Error &err) override {
        if (!st_->usable(err))
            return false;
        MockFileSystem &fs = *st_->fs;
        const std::string src = fs.absolute(from);
        const std::string dst = fs.absolute(to);
        std::lock_guard<std::mutex> lk(fs.mutex);
        if (!fs.nodes.count(src) || !parentIsDir(fs, dst)) {
            err = Error::make(ErrorKind::TransferIO, "sftp_rename failed", src);
            return false;
        }
        std::map<std::string, MockFileSystem::Node> moved;
        const std::string prefix = src + "/";
        for (auto it = fs.nodes.begin(); it != fs.nodes.end();) {
            if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
                moved[dst + it->first.substr(src.size())] = it->second;
                it = fs.nodes.erase(it);
            } else {
                ++it;
            }
        }
        for (auto &kv : moved)
            fs.nodes[kv.first] = kv.second;
        return true;
    }

    bool realpath(const std::string &path, std::string &out,
                  Error &err) override {
        if (!st_->usable(err))
            return false;
        out = st_->fs->absolute(path);
        return true;
    }

    std::unique_ptr<RemoteFile> openRead(const std::string &path,
                                         Error &err) override {
        if (!st_->usable(err))
            return nullptr;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        auto it = fs.nodes.find(abs);
        if (fs.isDenied(abs) || it == fs.nodes.end() || it->second.is_dir) {
            err = Error::make(ErrorKind::TransferIO, "sftp_open failed", abs);
            return nullptr;
        }
        return std::make_unique<MockRemoteFile>(st_, abs, false);
    }

    std::unique_ptr<RemoteFile> openWrite(const std::string &path,
                                          std::uint32_t mode,
                                          Error &err) override {
        if (!st_->usable(err))
            return nullptr;
        MockFileSystem &fs = *st_->fs;
        const std::string abs = fs.absolute(path);
        std::lock_guard<std::mutex> lk(fs.mutex);
        auto it = fs.nodes.find(abs);
        if (fs.isDenied(abs) || !parentIsDir(fs, abs) ||
            (it != fs.nodes.end() && it->second.is_dir)) {
            err = Error::make(ErrorKind::TransferIO, "sftp_open failed", abs);
            return nullptr;
        }
        MockFileSystem::Node &n = fs.nodes[abs];
        n.is_dir = false;
        n.data.clear();
        n.mode = 0100000 | (mode & 0777);
        return std::make_unique<MockRemoteFile>(st_, abs, true);
    }

private:
    static DirectoryEntry entry(const std::string &name,
                                const MockFileSystem::Node &n) {
        DirectoryEntry e;
        e.name = name;
        e.is_dir = n.is_dir;
        e.size = n.is_dir ? 0 : n.reported_size.value_or(n.data.size());
        e.mtime = n.mtime;
        e.mode = n.mode;
        return e;
    }

    // Caller holds fs.mutex.
    static bool parentIsDir(const MockFileSystem &fs, const std::string &abs) {
        auto it = fs.nodes.find(remoteParentPath(abs));
        return it != fs.nodes.end() && it->second.is_dir;
    }

    std::shared_ptr<MockSftpState> st_;
};

} // namespace

// ---------------------------------------------------------------------------
// Mock shell

void MockShell::pushOutput(const std::string &data, bool isStderr) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        output_.emplace_back(data, isStderr);
    }
    cv_.notify_all();
}

void MockShell::finish(int exitStatus, const std::string &exitSignal) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        finished_ = true;
        exit_.exit_status = exitStatus;
        exit_.exit_signal = exitSignal;
        exit_.benign = isBenignShellExit(exitStatus, exitSignal);
    }
    cv_.notify_all();
}

std::string MockShell::input() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return input_;
}

std::vector<TerminalSize> MockShell::windowChanges() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return windowChanges_;
}

bool MockShell::ptyRequested() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ptyRequested_;
}

std::string MockShell::termType() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return termType_;
}

TerminalModes MockShell::modes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return modes_;
}

TerminalSize MockShell::ptySize() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ptySize_;
}

bool MockShell::started() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return started_;
}

bool MockShell::eofSent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return eofSent_;
}

bool MockShell::closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

void MockShell::wake() {
    { std::lock_guard<std::mutex> lk(mutex_); }
    cv_.notify_all();
}

bool MockShell::hasInputHandler() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<bool>(inputHandler_);
}

void MockShell::setInputHandler(
    std::function<void(const std::string &)> handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    inputHandler_ = std::move(handler);
}

class MockShellChannel : public ShellChannel {
public:
    MockShellChannel(std::shared_ptr<MockShell> shell,
                     std::shared_ptr<std::atomic<bool>> alive)
        : shell_(std::move(shell)), alive_(std::move(alive)) {}

    ~MockShellChannel() override {
        Error ignored;
        close(ignored);
    }

    bool requestPty(const std::string &termType, const TerminalModes &modes,
                    TerminalSize size, Error &err) override {
        std::lock_guard<std::mutex> lk(shell_->mutex_);
        if (!usable(err))
            return false;
        shell_->ptyRequested_ = true;
        shell_->termType_ = termType;
        shell_->modes_ = modes;
        shell_->ptySize_ = size;
        return true;
    }

    bool startShell(Error &err) override {
        std::lock_guard<std::mutex> lk(shell_->mutex_);
        if (!usable(err))
            return false;
        shell_->started_ = true;
        return true;
    }

    bool windowChange(TerminalSize size, Error &err) override {
        std::lock_guard<std::mutex> lk(shell_->mutex_);
        if (!usable(err))
            return false;
        shell_->windowChanges_.push_back(size);
        return true;
    }

    long read(char *buf, std::size_t len, int timeoutMs, bool &isStderr,
              Error &) override {
        std::unique_lock<std::mutex> lk(shell_->mutex_);
        shell_->cv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] {
            return !shell_->output_.empty() || shell_->finished_ ||
                   shell_->closed_ || !*alive_;
        });
        if (shell_->closed_ || !*alive_)
            return -1;
        if (!shell_->output_.empty()) {
            auto &front = shell_->output_.front();
            const std::size_t n = std::min(len, front.first.size());
            std::memcpy(buf, front.first.data(), n);
            isStderr = front.second;
            front.first.erase(0, n);
            if (front.first.empty())
                shell_->output_.pop_front();
            return (long)n;
        }
        if (shell_->finished_)
            return -1;
        return 0;
    }

    bool write(const char *buf, std::size_t len, Error &err) override {
        std::function<void(const std::string &)> handler;
        const std::string chunk(buf, len);
        {
            std::lock_guard<std::mutex> lk(shell_->mutex_);
            if (!usable(err))
                return false;
            shell_->input_ += chunk;
            handler = shell_->inputHandler_;
        }
        if (handler)
            handler(chunk);
        return true;
    }

    bool sendEof(Error &err) override {
        std::lock_guard<std::mutex> lk(shell_->mutex_);
        if (!usable(err))
            return false;
        shell_->eofSent_ = true;
        return true;
    }

    ShellExit exitInfo() const override {
        std::lock_guard<std::mutex> lk(shell_->mutex_);
        return shell_->exit_;
    }

    bool close(Error &) override {
        // Released outside the lock; it may own the shell.
        std::function<void(const std::string &)> handler;
        {
            std::lock_guard<std::mutex> lk(shell_->mutex_);
            shell_->closed_ = true;
            handler.swap(shell_->inputHandler_);
        }
        shell_->cv_.notify_all();
        return true;
    }

private:
    // Caller holds shell_->mutex_.
    bool usable(Error &err) const {
        if (shell_->closed_ || shell_->finished_ || !*alive_) {
            err = Error::make(ErrorKind::Connection, "channel closed");
            return false;
        }
        return true;
    }

    std::shared_ptr<MockShell> shell_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

// ---------------------------------------------------------------------------
// MockTransport

MockTransport::MockTransport()
    : fs_(std::make_shared<MockFileSystem>()),
      alive_(std::make_shared<std::atomic<bool>>(false)) {}

MockTransport::~MockTransport() {
    Error ignored;
    close(ignored);
}

void MockTransport::setHostKey(const std::string &algorithm,
                               const std::string &keyBlob) {
    std::lock_guard<std::mutex> lk(mutex_);
    algorithm_ = algorithm;
    keyBlob_ = keyBlob;
}

void MockTransport::setPassword(const std::string &password) {
    std::lock_guard<std::mutex> lk(mutex_);
    password_ = password;
}

void MockTransport::setOpenFailure(const Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    openFailure_ = err;
}

void MockTransport::setKeepaliveFailure(bool fail) {
    std::lock_guard<std::mutex> lk(mutex_);
    keepaliveFails_ = fail;
}

void MockTransport::setCloseFailure(bool fail) {
    std::lock_guard<std::mutex> lk(mutex_);
    closeFails_ = fail;
}

int MockTransport::openCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return openCount_;
}

int MockTransport::authAttempts() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return authAttempts_;
}

int MockTransport::keepaliveCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return keepaliveCount_;
}

int MockTransport::closeCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closeCount_;
}

Endpoint MockTransport::lastEndpoint() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastEndpoint_;
}

ConnectionOptions MockTransport::lastOptions() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastOptions_;
}

std::shared_ptr<MockShell> MockTransport::lastShell() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastShell_;
}

bool MockTransport::open(const Endpoint &endpoint, const Credential &credential,
                         const ConnectionOptions &options,
                         const HostKeyVerifier &verifier, Error &err) {
    HostKeyInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++openCount_;
        lastEndpoint_ = endpoint;
        lastOptions_ = options;
        if (open_) {
            err = Error::make(ErrorKind::InvalidArgument, "transport already open");
            return false;
        }
        if (!openFailure_.ok()) {
            err = openFailure_;
            return false;
        }
        info.host = endpoint.host;
        info.port = endpoint.port;
        info.algorithm = algorithm_;
        info.key_blob = keyBlob_;
        info.fingerprint = mockFingerprint(keyBlob_);
    }

    // The verifier runs without the lock, as a real handshake would.
    const HostKeyVerdict verdict =
        verifier ? verifier(info) : HostKeyVerdict::Unknown;
    if (verdict != HostKeyVerdict::Trusted) {
        err = Error::make(ErrorKind::HostKeyVerificationRequired,
                          verdict == HostKeyVerdict::Mismatch
                              ? "host key does not match the trusted record"
                              : "host key is not trusted");
        err.host_key = info;
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    ++authAttempts_;
    if (password_ && credential.password && *credential.password != *password_) {
        err = Error::make(ErrorKind::Connection,
                          "password authentication failed");
        return false;
    }
    open_ = true;
    alive_ = std::make_shared<std::atomic<bool>>(true);
    return true;
}

bool MockTransport::close(Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_)
        return true;
    ++closeCount_;
    open_ = false;
    *alive_ = false;
    if (lastShell_)
        lastShell_->wake();
    if (closeFails_) {
        err = Error::make(ErrorKind::ResourceRelease, "socket close failed");
        return false;
    }
    return true;
}

bool MockTransport::isOpen() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_;
}

bool MockTransport::sendKeepalive(Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) {
        err = notConnected();
        return false;
    }
    ++keepaliveCount_;
    if (keepaliveFails_) {
        err = Error::make(ErrorKind::Keepalive, "connection reset by peer");
        return false;
    }
    return true;
}

std::unique_ptr<ShellChannel> MockTransport::openShell(Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) {
        err = notConnected();
        return nullptr;
    }
    lastShell_ = std::make_shared<MockShell>();
    return std::make_unique<MockShellChannel>(lastShell_, alive_);
}

std::unique_ptr<SftpChannel> MockTransport::openSftp(Error &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) {
        err = notConnected();
        return nullptr;
    }
    auto st = std::make_shared<MockSftpState>();
    st->fs = fs_;
    st->alive = alive_;
    return std::make_unique<MockSftpChannel>(std::move(st));
}

} // namespace sshm
