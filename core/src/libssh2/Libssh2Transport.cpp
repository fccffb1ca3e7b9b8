// libssh2 backend: TCP socket, SSH session, interactive shell channel and
// SFTP channel. The session runs non-blocking; every library call is made
// under the connection's io lock and retried on EAGAIN until its deadline.
#include "sshm/Libssh2Transport.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sshm {

using Clock = std::chrono::steady_clock;

namespace {

// Returned by Libssh2Connection::call when the owner was closed meanwhile.
constexpr long kAborted = -10000;

constexpr std::chrono::milliseconds kOperationTimeout{30000};
constexpr std::chrono::milliseconds kCloseTimeout{3000};
constexpr int kPollSliceMs = 50;

std::once_flag g_initOnce;
int g_initRc = 0;

const char *hostKeyTypeName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "ssh-rsa";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "ssh-dss";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ecdsa-sha2-nistp256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ecdsa-sha2-nistp384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ssh-ed25519";
#endif
    default:
        return "unknown";
    }
}

std::string hexFingerprint(const char *prefix, const unsigned char *h,
                           int n) {
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < n; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

std::string lastSessionError(LIBSSH2_SESSION *session) {
    if (!session)
        return "no session";
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0)
        return "unknown error";
    return std::string(msg, (std::size_t)len);
}

const char *sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FAILURE:
        return "failure";
    case LIBSSH2_FX_NO_CONNECTION:
    case LIBSSH2_FX_CONNECTION_LOST:
        return "connection lost";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        return "no space left";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    default:
        return "sftp error";
    }
}

struct KbdIntCtx {
    const char *pass;
};

// keyboard-interactive: every prompt is answered with the password.
void kbdintPasswordCallback(const char *, int, const char *, int,
                            int num_prompts,
                            const LIBSSH2_USERAUTH_KBDINT_PROMPT *,
                            LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                            void **abstract) {
    const KbdIntCtx *ctx =
        (abstract && *abstract) ? static_cast<const KbdIntCtx *>(*abstract)
                                : nullptr;
    const std::size_t plen = (ctx && ctx->pass) ? std::strlen(ctx->pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0)
            continue;
        char *buf = static_cast<char *>(std::malloc(plen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, ctx->pass, plen + 1);
        responses[i].text = buf;
        responses[i].length = (unsigned int)plen;
    }
}

} // namespace

struct Libssh2Connection {
    int sock = -1;
    LIBSSH2_SESSION *session = nullptr;
    // Serializes every libssh2 call on this session.
    std::mutex io;
    // Set (under io) once the session has been freed.
    bool released = false;

    ~Libssh2Connection() { release(); }

    // Waits for the socket in the direction libssh2 is blocked on.
    void waitSocket(int timeoutMs) {
        struct pollfd pfd{};
        pfd.fd = sock;
        int dir = 0;
        {
            std::lock_guard<std::mutex> lk(io);
            if (released || !session)
                return;
            dir = libssh2_session_block_directions(session);
        }
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
            pfd.events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
            pfd.events |= POLLOUT;
        if (pfd.events == 0)
            pfd.events = POLLIN;
        ::poll(&pfd, 1, timeoutMs);
    }

    int remainingMs(Clock::time_point deadline) const {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                              deadline - Clock::now())
                              .count();
        return (int)std::max<long long>(0, std::min<long long>(left, kPollSliceMs));
    }

    // Runs fn under the io lock until it stops returning EAGAIN. Returns
    // LIBSSH2_ERROR_TIMEOUT past the deadline and kAborted when *closed
    // (checked under the lock) becomes true.
    template <typename Fn>
    long call(Clock::time_point deadline, const bool *closed, Fn &&fn) {
        for (;;) {
            long rc;
            {
                std::lock_guard<std::mutex> lk(io);
                if (released || (closed && *closed))
                    return kAborted;
                rc = (long)fn();
            }
            if (rc != LIBSSH2_ERROR_EAGAIN)
                return rc;
            if (Clock::now() >= deadline)
                return LIBSSH2_ERROR_TIMEOUT;
            waitSocket(remainingMs(deadline));
        }
    }

    // Same for calls that return a handle and signal EAGAIN through
    // libssh2_session_last_errno.
    template <typename T, typename Fn>
    T *callHandle(Clock::time_point deadline, const bool *closed, long &rc,
                  Fn &&fn) {
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(io);
                if (released || (closed && *closed)) {
                    rc = kAborted;
                    return nullptr;
                }
                T *h = fn();
                if (h) {
                    rc = 0;
                    return h;
                }
                rc = libssh2_session_last_errno(session);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN)
                return nullptr;
            if (Clock::now() >= deadline) {
                rc = LIBSSH2_ERROR_TIMEOUT;
                return nullptr;
            }
            waitSocket(remainingMs(deadline));
        }
    }

    std::string lastError() {
        std::lock_guard<std::mutex> lk(io);
        if (released)
            return "connection closed";
        return lastSessionError(session);
    }

    // Builds an error for a failed call, naming the operation.
    Error failure(long rc, const std::string &op, const std::string &path,
                  ErrorKind kind) {
        if (rc == kAborted)
            return Error::make(kind, op + " failed: channel closed", path);
        if (rc == LIBSSH2_ERROR_TIMEOUT)
            return Error::make(ErrorKind::Timeout, op + " timed out", path);
        return Error::make(kind, op + " failed: " + lastError(), path);
    }

    // Frees the session and closes the socket. Returns the libssh2 error
    // text of a failed disconnect, empty otherwise.
    std::string release() {
        std::string err;
        if (session) {
            const auto deadline = Clock::now() + kCloseTimeout;
            long rc = call(deadline, nullptr, [&] {
                return libssh2_session_disconnect(session, "bye");
            });
            if (rc != 0 && rc != kAborted)
                err = "session disconnect: " + lastSessionError(session);
            std::lock_guard<std::mutex> lk(io);
            libssh2_session_free(session);
            session = nullptr;
            released = true;
        }
        if (sock != -1) {
            if (::close(sock) != 0 && err.empty())
                err = std::string("socket close: ") + std::strerror(errno);
            sock = -1;
        }
        return err;
    }
};

namespace {

// ---------------------------------------------------------------------------
// Shell channel

class Libssh2ShellChannel : public ShellChannel {
public:
    Libssh2ShellChannel(std::shared_ptr<Libssh2Connection> conn,
                        LIBSSH2_CHANNEL *ch)
        : conn_(std::move(conn)), ch_(ch) {}

    ~Libssh2ShellChannel() override {
        Error ignored;
        close(ignored);
    }

    bool requestPty(const std::string &termType, const TerminalModes &modes,
                    TerminalSize size, Error &err) override {
        const std::string encoded = modes.encode();
        const long rc =
            conn_->call(Clock::now() + kOperationTimeout, &closed_, [&] {
                return libssh2_channel_request_pty_ex(
                    ch_, termType.c_str(), (unsigned)termType.size(),
                    encoded.data(), (unsigned)encoded.size(), size.cols,
                    size.rows, 0, 0);
            });
        if (rc != 0) {
            err = conn_->failure(rc, "pty request", {}, ErrorKind::Connection);
            return false;
        }
        return true;
    }

    bool startShell(Error &err) override {
        const long rc = conn_->call(Clock::now() + kOperationTimeout,
                                    &closed_,
                                    [&] { return libssh2_channel_shell(ch_); });
        if (rc != 0) {
            err = conn_->failure(rc, "shell request", {}, ErrorKind::Connection);
            return false;
        }
        return true;
    }

    bool windowChange(TerminalSize size, Error &err) override {
        const long rc =
            conn_->call(Clock::now() + kOperationTimeout, &closed_, [&] {
                return libssh2_channel_request_pty_size(ch_, size.cols,
                                                        size.rows);
            });
        if (rc != 0) {
            err = conn_->failure(rc, "window change", {}, ErrorKind::Connection);
            return false;
        }
        return true;
    }

    long read(char *buf, std::size_t len, int timeoutMs, bool &isStderr,
              Error &err) override {
        const auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        for (;;) {
            bool eof = false;
            {
                std::lock_guard<std::mutex> lk(conn_->io);
                if (conn_->released || closed_ || finished_)
                    return -1;
                ssize_t n = libssh2_channel_read(ch_, buf, len);
                if (n > 0) {
                    isStderr = false;
                    return (long)n;
                }
                if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    err = Error::make(ErrorKind::Connection,
                                      "shell read failed: " +
                                          lastSessionError(conn_->session));
                    return -1;
                }
                n = libssh2_channel_read_stderr(ch_, buf, len);
                if (n > 0) {
                    isStderr = true;
                    return (long)n;
                }
                if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    err = Error::make(ErrorKind::Connection,
                                      "shell read failed: " +
                                          lastSessionError(conn_->session));
                    return -1;
                }
                eof = libssh2_channel_eof(ch_) != 0;
            }
            if (eof) {
                finish();
                return -1;
            }
            if (Clock::now() >= deadline)
                return 0;
            conn_->waitSocket(conn_->remainingMs(deadline));
        }
    }

    bool write(const char *buf, std::size_t len, Error &err) override {
        std::size_t total = 0;
        const auto deadline = Clock::now() + kOperationTimeout;
        while (total < len) {
            const long rc = conn_->call(deadline, &closed_, [&] {
                return libssh2_channel_write(ch_, buf + total, len - total);
            });
            if (rc < 0) {
                err = conn_->failure(rc, "shell write", {}, ErrorKind::Connection);
                return false;
            }
            total += (std::size_t)rc;
        }
        return true;
    }

    bool sendEof(Error &err) override {
        const long rc = conn_->call(Clock::now() + kOperationTimeout, &closed_,
                                    [&] { return libssh2_channel_send_eof(ch_); });
        if (rc != 0) {
            err = conn_->failure(rc, "send eof", {}, ErrorKind::Connection);
            return false;
        }
        return true;
    }

    ShellExit exitInfo() const override {
        std::lock_guard<std::mutex> lk(conn_->io);
        return exit_;
    }

    bool close(Error &err) override {
        std::lock_guard<std::mutex> closeLock(closeMutex_);
        bool finished = false;
        {
            std::lock_guard<std::mutex> lk(conn_->io);
            if (closed_)
                return true;
            finished = finished_;
        }
        bool ok = true;
        if (!finished) {
            const long rc = conn_->call(Clock::now() + kCloseTimeout, &closed_,
                                        [&] { return libssh2_channel_close(ch_); });
            if (rc != 0 && rc != kAborted) {
                err = conn_->failure(rc, "channel close", {},
                                     ErrorKind::ResourceRelease);
                ok = false;
            }
        }
        std::lock_guard<std::mutex> lk(conn_->io);
        // A freed session already took its channels with it.
        if (!conn_->released && ch_)
            libssh2_channel_free(ch_);
        ch_ = nullptr;
        closed_ = true;
        return ok;
    }

private:
    // Remote end of stream: close our side and collect the exit status.
    void finish() {
        const long rc = conn_->call(Clock::now() + kCloseTimeout, &closed_,
                                    [&] { return libssh2_channel_close(ch_); });
        std::lock_guard<std::mutex> lk(conn_->io);
        finished_ = true;
        if (conn_->released || closed_)
            return;
        if (rc == 0)
            exit_.exit_status = libssh2_channel_get_exit_status(ch_);
        char *sig = nullptr;
        size_t siglen = 0;
        if (libssh2_channel_get_exit_signal(ch_, &sig, &siglen, nullptr,
                                            nullptr, nullptr, nullptr) == 0 &&
            sig) {
            exit_.exit_signal.assign(sig, siglen);
            libssh2_free(conn_->session, sig);
        }
        exit_.benign = isBenignShellExit(exit_.exit_status, exit_.exit_signal);
    }

    std::shared_ptr<Libssh2Connection> conn_;
    LIBSSH2_CHANNEL *ch_ = nullptr;
    // Guarded by conn_->io.
    bool closed_ = false;
    bool finished_ = false;
    ShellExit exit_;
    std::mutex closeMutex_;
};

// ---------------------------------------------------------------------------
// SFTP channel

struct SftpState {
    std::shared_ptr<Libssh2Connection> conn;
    LIBSSH2_SFTP *sftp = nullptr;
    // Guarded by conn->io.
    bool closed = false;

    Error failure(long rc, const std::string &op, const std::string &path,
                  ErrorKind kind) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long code = 0;
            {
                std::lock_guard<std::mutex> lk(conn->io);
                if (!conn->released && !closed)
                    code = libssh2_sftp_last_error(sftp);
            }
            return Error::make(kind, op + " failed: " + sftpStatusText(code),
                               path);
        }
        return conn->failure(rc, op, path, kind);
    }

    unsigned long lastStatus() {
        std::lock_guard<std::mutex> lk(conn->io);
        if (conn->released || closed)
            return LIBSSH2_FX_CONNECTION_LOST;
        return libssh2_sftp_last_error(sftp);
    }
};

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<SftpState> st, LIBSSH2_SFTP_HANDLE *h,
                      std::string path)
        : st_(std::move(st)), h_(h), path_(std::move(path)) {}

    ~Libssh2RemoteFile() override {
        Error ignored;
        close(ignored);
    }

    long read(char *buf, std::size_t len, Error &err) override {
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed,
            [&] { return libssh2_sftp_read(h_, buf, len); });
        if (rc < 0) {
            err = st_->failure(rc, "remote read", path_, ErrorKind::TransferIO);
            return -1;
        }
        return rc;
    }

    bool write(const char *buf, std::size_t len, Error &err) override {
        std::size_t total = 0;
        while (total < len) {
            const long rc = st_->conn->call(
                Clock::now() + kOperationTimeout, &st_->closed, [&] {
                    return libssh2_sftp_write(h_, buf + total, len - total);
                });
            if (rc < 0) {
                err = st_->failure(rc, "remote write", path_,
                                   ErrorKind::TransferIO);
                return false;
            }
            total += (std::size_t)rc;
        }
        return true;
    }

    bool close(Error &err) override {
        if (!h_)
            return true;
        const long rc =
            st_->conn->call(Clock::now() + kCloseTimeout, &st_->closed,
                            [&] { return libssh2_sftp_close_handle(h_); });
        h_ = nullptr;
        // An aborted channel has released the handle already.
        if (rc != 0 && rc != kAborted) {
            err = st_->failure(rc, "remote close", path_,
                               ErrorKind::ResourceRelease);
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<SftpState> st_;
    LIBSSH2_SFTP_HANDLE *h_ = nullptr;
    std::string path_;
};

void fillEntry(const LIBSSH2_SFTP_ATTRIBUTES &attrs, DirectoryEntry &fi) {
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                       LIBSSH2_SFTP_S_IFDIR)
                    : false;
    fi.size = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)attrs.filesize : 0;
    fi.mtime = (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)attrs.mtime : 0;
    fi.mode = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? (std::uint32_t)attrs.permissions : 0;
}

class Libssh2SftpChannel : public SftpChannel {
public:
    explicit Libssh2SftpChannel(std::shared_ptr<SftpState> st)
        : st_(std::move(st)) {}

    ~Libssh2SftpChannel() override {
        Error ignored;
        close(ignored);
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lk(st_->conn->io);
        return !st_->closed && !st_->conn->released;
    }

    bool close(Error &err) override {
        LIBSSH2_SFTP *sftp = nullptr;
        {
            std::lock_guard<std::mutex> lk(st_->conn->io);
            if (st_->closed)
                return true;
            // Operations in flight on other threads see this and abort.
            st_->closed = true;
            if (!st_->conn->released)
                sftp = st_->sftp;
            st_->sftp = nullptr;
        }
        if (!sftp)
            return true;
        const long rc = st_->conn->call(Clock::now() + kCloseTimeout, nullptr,
                                        [&] { return libssh2_sftp_shutdown(sftp); });
        if (rc != 0 && rc != kAborted) {
            err = st_->conn->failure(rc, "sftp shutdown", {},
                                     ErrorKind::ResourceRelease);
            return false;
        }
        return true;
    }

    bool list(const std::string &path, std::vector<DirectoryEntry> &out,
              Error &err) override {
        const std::string p = path.empty() ? "/" : path;
        const auto deadline = Clock::now() + kOperationTimeout;
        long rc = 0;
        LIBSSH2_SFTP_HANDLE *dir =
            st_->conn->callHandle<LIBSSH2_SFTP_HANDLE>(
                deadline, &st_->closed, rc, [&] {
                    return libssh2_sftp_open_ex(st_->sftp, p.c_str(),
                                                (unsigned)p.size(), 0, 0,
                                                LIBSSH2_SFTP_OPENDIR);
                });
        if (!dir) {
            err = st_->failure(rc, "sftp_opendir", p, ErrorKind::TransferIO);
            return false;
        }

        out.clear();
        char filename[512];
        char longentry[1024];
        bool ok = true;
        for (;;) {
            LIBSSH2_SFTP_ATTRIBUTES attrs;
            std::memset(&attrs, 0, sizeof(attrs));
            rc = st_->conn->call(deadline, &st_->closed, [&] {
                return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
            });
            if (rc == 0)
                break;
            if (rc < 0) {
                err = st_->failure(rc, "sftp_readdir", p, ErrorKind::TransferIO);
                ok = false;
                break;
            }
            DirectoryEntry fi;
            fi.name.assign(filename, (std::size_t)rc);
            if (fi.name == "." || fi.name == "..")
                continue;
            fillEntry(attrs, fi);
            out.push_back(std::move(fi));
        }

        rc = st_->conn->call(Clock::now() + kCloseTimeout, &st_->closed,
                             [&] { return libssh2_sftp_close_handle(dir); });
        if (ok && rc != 0 && rc != kAborted) {
            err = st_->failure(rc, "sftp_closedir", p, ErrorKind::ResourceRelease);
            return false;
        }
        return ok;
    }

    bool stat(const std::string &path, DirectoryEntry &info,
              Error &err) override {
        return statImpl(path, LIBSSH2_SFTP_STAT, info, err);
    }

    bool lstat(const std::string &path, DirectoryEntry &info,
               Error &err) override {
        return statImpl(path, LIBSSH2_SFTP_LSTAT, info, err);
    }

    bool mkdir(const std::string &path, std::uint32_t mode,
               Error &err) override {
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_mkdir_ex(st_->sftp, path.c_str(),
                                             (unsigned)path.size(), (long)mode);
            });
        if (rc != 0) {
            err = st_->failure(rc, "sftp_mkdir", path, ErrorKind::TransferIO);
            return false;
        }
        return true;
    }

    bool removeFile(const std::string &path, Error &err) override {
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_unlink_ex(st_->sftp, path.c_str(),
                                              (unsigned)path.size());
            });
        if (rc != 0) {
            err = st_->failure(rc, "sftp_unlink", path, ErrorKind::TransferIO);
            return false;
        }
        return true;
    }

    bool removeDir(const std::string &path, Error &err) override {
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_rmdir_ex(st_->sftp, path.c_str(),
                                             (unsigned)path.size());
            });
        if (rc != 0) {
            err = st_->failure(rc, "sftp_rmdir", path, ErrorKind::TransferIO);
            return false;
        }
        return true;
    }

    bool rename(const std::string &from, const std::string &to,
                Error &err) override {
        const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE |
                           LIBSSH2_SFTP_RENAME_ATOMIC |
                           LIBSSH2_SFTP_RENAME_NATIVE;
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_rename_ex(st_->sftp, from.c_str(),
                                              (unsigned)from.size(), to.c_str(),
                                              (unsigned)to.size(), flags);
            });
        if (rc != 0) {
            err = st_->failure(rc, "sftp_rename", from, ErrorKind::TransferIO);
            return false;
        }
        return true;
    }

    bool realpath(const std::string &path, std::string &out,
                  Error &err) override {
        std::vector<char> buf(4096);
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_symlink_ex(
                    st_->sftp, path.c_str(), (unsigned)path.size(), buf.data(),
                    (unsigned)buf.size(), LIBSSH2_SFTP_REALPATH);
            });
        if (rc < 0) {
            err = st_->failure(rc, "sftp_realpath", path, ErrorKind::Path);
            return false;
        }
        out.assign(buf.data(), (std::size_t)rc);
        return true;
    }

    std::unique_ptr<RemoteFile> openRead(const std::string &path,
                                         Error &err) override {
        return openFile(path, LIBSSH2_FXF_READ, 0, err);
    }

    std::unique_ptr<RemoteFile> openWrite(const std::string &path,
                                          std::uint32_t mode,
                                          Error &err) override {
        return openFile(path,
                        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                            LIBSSH2_FXF_TRUNC,
                        (long)mode, err);
    }

private:
    bool statImpl(const std::string &path, int statType, DirectoryEntry &info,
                  Error &err) {
        LIBSSH2_SFTP_ATTRIBUTES st;
        std::memset(&st, 0, sizeof(st));
        const long rc = st_->conn->call(
            Clock::now() + kOperationTimeout, &st_->closed, [&] {
                return libssh2_sftp_stat_ex(st_->sftp, path.c_str(),
                                            (unsigned)path.size(), statType,
                                            &st);
            });
        if (rc != 0) {
            if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
                st_->lastStatus() == LIBSSH2_FX_NO_SUCH_FILE) {
                err.clear();
                return false; // does not exist
            }
            err = st_->failure(rc, "sftp_stat", path, ErrorKind::TransferIO);
            return false;
        }
        const std::size_t slash = path.find_last_of('/');
        info.name = slash == std::string::npos ? path : path.substr(slash + 1);
        fillEntry(st, info);
        return true;
    }

    std::unique_ptr<RemoteFile> openFile(const std::string &path,
                                         unsigned long flags, long mode,
                                         Error &err) {
        long rc = 0;
        LIBSSH2_SFTP_HANDLE *h = st_->conn->callHandle<LIBSSH2_SFTP_HANDLE>(
            Clock::now() + kOperationTimeout, &st_->closed, rc, [&] {
                return libssh2_sftp_open_ex(st_->sftp, path.c_str(),
                                            (unsigned)path.size(), flags, mode,
                                            LIBSSH2_SFTP_OPENFILE);
            });
        if (!h) {
            err = st_->failure(rc, "sftp_open", path, ErrorKind::TransferIO);
            return nullptr;
        }
        return std::make_unique<Libssh2RemoteFile>(st_, h, path);
    }

    std::shared_ptr<SftpState> st_;
};

} // namespace

// ---------------------------------------------------------------------------
// Transport

bool initLibssh2() {
    std::call_once(g_initOnce, [] { g_initRc = libssh2_init(0); });
    return g_initRc == 0;
}

// libssh2 is initialized by the first open().
Libssh2Transport::Libssh2Transport() = default;

Libssh2Transport::~Libssh2Transport() {
    Error ignored;
    close(ignored);
}

bool Libssh2Transport::tcpConnect(const std::string &host, std::uint16_t port,
                                  int &sock, Error &err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = Error::make(ErrorKind::Connection,
                          std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    std::string lastErr = "no usable address";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // TCP keepalive underneath the application-level one.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        const int flags = ::fcntl(s, F_GETFL, 0);
        if (flags == -1 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) == -1) {
            lastErr = std::string("fcntl: ") + std::strerror(errno);
            ::close(s);
            continue;
        }
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            const auto left =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline_ - Clock::now())
                    .count();
            const int ready = ::poll(&pfd, 1, (int)std::max<long long>(0, left));
            if (ready == 0) {
                ::close(s);
                freeaddrinfo(res);
                err = Error::make(ErrorKind::Timeout,
                                  "connect to " + host + " timed out");
                return false;
            }
            int soErr = 0;
            socklen_t len = sizeof(soErr);
            if (ready < 0 ||
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0) {
                soErr = errno;
            }
            rc = soErr == 0 ? 0 : -1;
            errno = soErr;
        }
        if (rc == 0) {
            sock = s;
            freeaddrinfo(res);
            return true;
        }
        lastErr = std::strerror(errno);
        ::close(s);
    }
    freeaddrinfo(res);
    err = Error::make(ErrorKind::Connection,
                      "cannot connect to " + host + ":" + portStr + ": " +
                          lastErr);
    return false;
}

bool Libssh2Transport::handshake(Libssh2Connection &conn,
                                 const Endpoint &endpoint,
                                 const ConnectionOptions &options,
                                 const HostKeyVerifier &verifier, Error &err) {
    conn.session = libssh2_session_init();
    if (!conn.session) {
        err = Error::make(ErrorKind::Connection, "libssh2_session_init failed");
        return false;
    }
    if (options.compression)
        libssh2_session_flag(conn.session, LIBSSH2_FLAG_COMPRESS, 1);
    libssh2_session_set_blocking(conn.session, 0);

    long rc = conn.call(deadline_, nullptr, [&] {
        return libssh2_session_handshake(conn.session, conn.sock);
    });
    if (rc != 0) {
        err = conn.failure(rc, "SSH handshake", {}, ErrorKind::Connection);
        return false;
    }

    // Keepalive requests are sent explicitly by the session; interval 1
    // lets every libssh2_keepalive_send go out.
    libssh2_keepalive_config(conn.session, 1, 1);

    HostKeyInfo info;
    info.host = endpoint.host;
    info.port = endpoint.port;
    {
        std::lock_guard<std::mutex> lk(conn.io);
        size_t keylen = 0;
        int keytype = 0;
        const char *hostkey =
            libssh2_session_hostkey(conn.session, &keylen, &keytype);
        if (!hostkey || keylen == 0) {
            err = Error::make(ErrorKind::Connection, "cannot read host key");
            return false;
        }
        info.algorithm = hostKeyTypeName(keytype);
        info.key_blob.assign(hostkey, keylen);
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
        const unsigned char *h = (const unsigned char *)libssh2_hostkey_hash(
            conn.session, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (h)
            info.fingerprint = hexFingerprint("SHA256:", h, 32);
#else
        const unsigned char *h = (const unsigned char *)libssh2_hostkey_hash(
            conn.session, LIBSSH2_HOSTKEY_HASH_SHA1);
        if (h)
            info.fingerprint = hexFingerprint("SHA1:", h, 20);
#endif
    }

    const HostKeyVerdict verdict =
        verifier ? verifier(info) : HostKeyVerdict::Unknown;
    if (verdict != HostKeyVerdict::Trusted) {
        const std::string id =
            "[" + endpoint.host + "]:" + std::to_string(endpoint.port);
        err = Error::make(ErrorKind::HostKeyVerificationRequired,
                          verdict == HostKeyVerdict::Mismatch
                              ? "host key for " + id +
                                    " does not match the trusted record"
                              : "host key for " + id + " is not trusted");
        err.host_key = info;
        return false;
    }
    return true;
}

bool Libssh2Transport::authenticate(Libssh2Connection &conn,
                                    const Endpoint &endpoint,
                                    const Credential &credential, Error &err) {
    const std::string &user = endpoint.login;
    long rc = 0;
    if (credential.private_key_path) {
        const char *passphrase = credential.private_key_passphrase
                                     ? credential.private_key_passphrase->c_str()
                                     : nullptr;
        rc = conn.call(deadline_, nullptr, [&] {
            return libssh2_userauth_publickey_fromfile(
                conn.session, user.c_str(), nullptr,
                credential.private_key_path->c_str(), passphrase);
        });
        if (rc != 0) {
            err = conn.failure(rc, "public key authentication",
                               *credential.private_key_path,
                               ErrorKind::Connection);
            return false;
        }
        return true;
    }

    rc = conn.call(deadline_, nullptr, [&] {
        return libssh2_userauth_password(conn.session, user.c_str(),
                                         credential.password->c_str());
    });
    if (rc == 0)
        return true;
    if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
        rc == LIBSSH2_ERROR_SOCKET_RECV || rc == LIBSSH2_ERROR_TIMEOUT) {
        err = conn.failure(rc, "password authentication", {},
                           ErrorKind::Connection);
        return false;
    }

    // Servers that only offer keyboard-interactive get the password there.
    std::string authlist;
    {
        long lrc = 0;
        char *methods = conn.callHandle<char>(deadline_, nullptr, lrc, [&] {
            return libssh2_userauth_list(conn.session, user.c_str(),
                                         (unsigned)user.size());
        });
        if (methods)
            authlist = methods;
    }
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{credential.password->c_str()};
        {
            std::lock_guard<std::mutex> lk(conn.io);
            void **abs = libssh2_session_abstract(conn.session);
            if (abs)
                *abs = &ctx;
        }
        rc = conn.call(deadline_, nullptr, [&] {
            return libssh2_userauth_keyboard_interactive(
                conn.session, user.c_str(), kbdintPasswordCallback);
        });
        {
            std::lock_guard<std::mutex> lk(conn.io);
            void **abs = libssh2_session_abstract(conn.session);
            if (abs)
                *abs = nullptr;
        }
        if (rc == 0)
            return true;
    }
    err = conn.failure(rc, "password authentication", {},
                       ErrorKind::Connection);
    if (!authlist.empty())
        err.message += " (methods: " + authlist + ")";
    return false;
}

bool Libssh2Transport::open(const Endpoint &endpoint,
                            const Credential &credential,
                            const ConnectionOptions &options,
                            const HostKeyVerifier &verifier, Error &err) {
    err.clear();
    if (conn_) {
        err = Error::make(ErrorKind::InvalidArgument, "transport already open");
        return false;
    }
    if (!initLibssh2()) {
        err = Error::make(ErrorKind::Connection, "libssh2_init failed");
        return false;
    }

    // One deadline covers TCP connect, handshake and authentication.
    deadline_ = Clock::now() + options.connect_timeout;

    auto conn = std::make_shared<Libssh2Connection>();
    if (!tcpConnect(endpoint.host, endpoint.port, conn->sock, err))
        return false;
    if (!handshake(*conn, endpoint, options, verifier, err) ||
        !authenticate(*conn, endpoint, credential, err)) {
        // The failure that brought us here is the one reported.
        conn->release();
        return false;
    }
    conn_ = std::move(conn);
    return true;
}

bool Libssh2Transport::close(Error &err) {
    err.clear();
    if (!conn_)
        return true;
    std::shared_ptr<Libssh2Connection> conn = std::move(conn_);
    conn_.reset();
    const std::string msg = conn->release();
    if (!msg.empty()) {
        err = Error::make(ErrorKind::ResourceRelease, msg);
        return false;
    }
    return true;
}

bool Libssh2Transport::isOpen() const {
    return conn_ != nullptr;
}

bool Libssh2Transport::sendKeepalive(Error &err) {
    std::shared_ptr<Libssh2Connection> conn = conn_;
    if (!conn) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return false;
    }
    int next = 0;
    const long rc = conn->call(Clock::now() + kOperationTimeout, nullptr, [&] {
        return libssh2_keepalive_send(conn->session, &next);
    });
    if (rc != 0) {
        err = conn->failure(rc, "keepalive", {}, ErrorKind::Keepalive);
        return false;
    }
    return true;
}

std::unique_ptr<ShellChannel> Libssh2Transport::openShell(Error &err) {
    std::shared_ptr<Libssh2Connection> conn = conn_;
    if (!conn) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return nullptr;
    }
    long rc = 0;
    LIBSSH2_CHANNEL *ch = conn->callHandle<LIBSSH2_CHANNEL>(
        Clock::now() + kOperationTimeout, nullptr, rc,
        [&] { return libssh2_channel_open_session(conn->session); });
    if (!ch) {
        err = conn->failure(rc, "channel open", {}, ErrorKind::Connection);
        return nullptr;
    }
    return std::make_unique<Libssh2ShellChannel>(conn, ch);
}

std::unique_ptr<SftpChannel> Libssh2Transport::openSftp(Error &err) {
    std::shared_ptr<Libssh2Connection> conn = conn_;
    if (!conn) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return nullptr;
    }
    long rc = 0;
    LIBSSH2_SFTP *sftp = conn->callHandle<LIBSSH2_SFTP>(
        Clock::now() + kOperationTimeout, nullptr, rc,
        [&] { return libssh2_sftp_init(conn->session); });
    if (!sftp) {
        err = conn->failure(rc, "sftp init", {}, ErrorKind::Connection);
        return nullptr;
    }
    auto st = std::make_shared<SftpState>();
    st->conn = conn;
    st->sftp = sftp;
    return std::make_unique<Libssh2SftpChannel>(std::move(st));
}

} // namespace sshm
