// Abstract transport binding. Concrete backends (libssh2, mock) implement
// these interfaces so the session, terminal and transfer layers stay
// independent of the SSH library.
#pragma once
#include "SshTypes.hpp"
#include <functional>
#include <memory>

namespace sshm {

// Called once per open(), after the handshake and before authentication.
using HostKeyVerifier = std::function<HostKeyVerdict(const HostKeyInfo &)>;

// Open remote file on an SFTP channel.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // > 0: bytes read, 0: end of file, < 0: failure (err filled).
    virtual long read(char *buf, std::size_t len, Error &err) = 0;
    // Writes the whole buffer or fails.
    virtual bool write(const char *buf, std::size_t len, Error &err) = 0;
    virtual bool close(Error &err) = 0;
};

// Logical channel dedicated to file operations.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    virtual bool isOpen() const = 0;
    // Idempotent. Closing aborts any operation in flight on other threads.
    virtual bool close(Error &err) = 0;

    virtual bool list(const std::string &path, std::vector<DirectoryEntry> &out,
                      Error &err) = 0;

    // Returns false with err cleared when the path does not exist.
    virtual bool stat(const std::string &path, DirectoryEntry &info,
                      Error &err) = 0;
    // Same, without following a final symbolic link.
    virtual bool lstat(const std::string &path, DirectoryEntry &info,
                       Error &err) = 0;

    virtual bool mkdir(const std::string &path, std::uint32_t mode,
                       Error &err) = 0;
    virtual bool removeFile(const std::string &path, Error &err) = 0;
    // Removes an empty directory.
    virtual bool removeDir(const std::string &path, Error &err) = 0;
    virtual bool rename(const std::string &from, const std::string &to,
                        Error &err) = 0;
    virtual bool realpath(const std::string &path, std::string &out,
                          Error &err) = 0;

    virtual std::unique_ptr<RemoteFile> openRead(const std::string &path,
                                                 Error &err) = 0;
    // Creates or truncates.
    virtual std::unique_ptr<RemoteFile> openWrite(const std::string &path,
                                                  std::uint32_t mode,
                                                  Error &err) = 0;
};

// Interactive channel carrying one remote shell.
class ShellChannel {
public:
    virtual ~ShellChannel() = default;

    virtual bool requestPty(const std::string &termType,
                            const TerminalModes &modes, TerminalSize size,
                            Error &err) = 0;
    virtual bool startShell(Error &err) = 0;
    virtual bool windowChange(TerminalSize size, Error &err) = 0;

    // Waits up to timeoutMs for output (stdout first, then stderr).
    // > 0: bytes read, 0: nothing yet, < 0: channel finished or failed
    // (err filled on failure, left empty on a clean end of stream).
    virtual long read(char *buf, std::size_t len, int timeoutMs,
                      bool &isStderr, Error &err) = 0;
    virtual bool write(const char *buf, std::size_t len, Error &err) = 0;
    virtual bool sendEof(Error &err) = 0;

    // Valid once read() has reported the end of the stream.
    virtual ShellExit exitInfo() const = 0;

    // Idempotent.
    virtual bool close(Error &err) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Single attempt bounded by options.connect_timeout. A host key the
    // verifier does not trust fails with HostKeyVerificationRequired and
    // err.host_key filled, before any credential is sent.
    virtual bool open(const Endpoint &endpoint, const Credential &credential,
                      const ConnectionOptions &options,
                      const HostKeyVerifier &verifier, Error &err) = 0;

    // Idempotent. Releases everything, returns the first failure.
    virtual bool close(Error &err) = 0;
    virtual bool isOpen() const = 0;

    // Application-level no-op request on the transport.
    virtual bool sendKeepalive(Error &err) = 0;

    virtual std::unique_ptr<ShellChannel> openShell(Error &err) = 0;
    virtual std::unique_ptr<SftpChannel> openSftp(Error &err) = 0;
};

} // namespace sshm
