// In-memory transport for tests and offline runs: scripted host key and
// credentials, keepalive failure injection, an in-memory remote file
// system and a scriptable interactive shell.
#pragma once
#include "Transport.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sshm {

// Remote file system shared by every SFTP channel of one mock transport.
class MockFileSystem {
public:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint32_t mode = 0644;
        std::uint64_t mtime = 0;
        // Size answered by stat when set; simulates a file that changes
        // between stat and read.
        std::optional<std::uint64_t> reported_size;
    };

    MockFileSystem();

    // Test helpers. Parents are created as needed.
    void addDirectory(const std::string &path);
    void addFile(const std::string &path, const std::string &data,
                 std::uint32_t mode = 0644);
    bool exists(const std::string &path) const;
    bool readFile(const std::string &path, std::string &out) const;
    std::vector<std::string> paths() const;

    // Fails every operation on this path with a permission error.
    void denyPath(const std::string &path);
    void setReportedSize(const std::string &path, std::uint64_t size);

    std::string home() const { return "/home/tester"; }

    mutable std::mutex mutex;
    std::map<std::string, Node> nodes; // keyed by normalized absolute path
    std::vector<std::string> denied;

    bool isDenied(const std::string &path) const;
    // Absolute form of a (possibly relative) path.
    std::string absolute(const std::string &path) const;
};

// Shared state of one interactive shell.
class MockShell {
public:
    void pushOutput(const std::string &data, bool isStderr = false);
    // Ends the stream; read() drains queued output first.
    void finish(int exitStatus, const std::string &exitSignal = {});
    // Wakes a blocked reader so it re-checks the transport.
    void wake();

    std::string input() const;
    std::vector<TerminalSize> windowChanges() const;
    bool ptyRequested() const;
    std::string termType() const;
    TerminalModes modes() const;
    TerminalSize ptySize() const;
    bool started() const;
    bool eofSent() const;
    bool closed() const;

    // Called with each chunk written by the client, outside the lock.
    // Dropped when the channel closes.
    void setInputHandler(std::function<void(const std::string &)> handler);
    bool hasInputHandler() const;

private:
    friend class MockShellChannel;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::pair<std::string, bool>> output_;
    bool finished_ = false;
    ShellExit exit_;
    std::string input_;
    std::vector<TerminalSize> windowChanges_;
    bool ptyRequested_ = false;
    std::string termType_;
    TerminalModes modes_;
    TerminalSize ptySize_;
    bool started_ = false;
    bool eofSent_ = false;
    bool closed_ = false;
    std::function<void(const std::string &)> inputHandler_;
};

class MockTransport : public Transport {
public:
    MockTransport();
    ~MockTransport() override;

    // Scripting.
    void setHostKey(const std::string &algorithm, const std::string &keyBlob);
    void setPassword(const std::string &password);
    void setOpenFailure(const Error &err);
    void setKeepaliveFailure(bool fail);
    void setCloseFailure(bool fail);

    // Observations.
    int openCount() const;
    int authAttempts() const;
    int keepaliveCount() const;
    int closeCount() const;
    Endpoint lastEndpoint() const;
    ConnectionOptions lastOptions() const;
    std::shared_ptr<MockShell> lastShell() const;
    std::shared_ptr<MockFileSystem> fileSystem() const { return fs_; }

    bool open(const Endpoint &endpoint, const Credential &credential,
              const ConnectionOptions &options,
              const HostKeyVerifier &verifier, Error &err) override;
    bool close(Error &err) override;
    bool isOpen() const override;
    bool sendKeepalive(Error &err) override;
    std::unique_ptr<ShellChannel> openShell(Error &err) override;
    std::unique_ptr<SftpChannel> openSftp(Error &err) override;

private:
    mutable std::mutex mutex_;
    bool open_ = false;
    std::string algorithm_ = "ssh-ed25519";
    std::string keyBlob_ = "mock-ed25519-host-key";
    std::optional<std::string> password_;
    Error openFailure_;
    bool keepaliveFails_ = false;
    bool closeFails_ = false;
    int openCount_ = 0;
    int authAttempts_ = 0;
    int keepaliveCount_ = 0;
    int closeCount_ = 0;
    Endpoint lastEndpoint_;
    ConnectionOptions lastOptions_;
    std::shared_ptr<MockShell> lastShell_;
    std::shared_ptr<MockFileSystem> fs_;
    // Cleared on close; channels opened earlier stop working.
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace sshm
