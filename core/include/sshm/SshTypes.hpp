// Shared value types for sessions, host keys, listings and transfers.
// Keep these structures plain so the front end can copy them freely.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sshm {

enum class SessionState { Disconnected, Connecting, Connected, Error };

const char *toString(SessionState state);

struct Endpoint {
    std::string host;
    std::uint16_t port = 22;
    std::string login;

    // "host:port" identity used by the trust store and in messages.
    std::string hostId() const;
};

// Exactly one of password / private_key_path must be set.
struct Credential {
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    static Credential fromPassword(std::string password);
    static Credential
    fromKeyFile(std::string path,
                std::optional<std::string> passphrase = std::nullopt);
};

struct ConnectionOptions {
    std::string terminal_type = "xterm-256color";
    bool keep_alive = true;
    std::chrono::milliseconds keep_alive_interval{30000};
    bool compression = false;
    std::chrono::milliseconds connect_timeout{10000};
};

// Public key presented by the server during the handshake.
struct HostKeyInfo {
    std::string host;
    std::uint16_t port = 22;
    std::string algorithm;   // "ssh-ed25519", "ssh-rsa", ...
    std::string key_blob;    // raw key blob as sent by the server
    std::string fingerprint; // "SHA256:AB:CD:..."
};

enum class HostKeyVerdict { Trusted, Unknown, Mismatch };

enum class ErrorKind {
    None,
    Connection,
    HostKeyVerificationRequired,
    Keepalive,
    TransferIO,
    Path,
    ResourceRelease,
    NotConnected,
    InvalidArgument,
    Timeout
};

const char *toString(ErrorKind kind);

// Tagged failure value. host_key is only set for
// HostKeyVerificationRequired.
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string path;
    std::optional<HostKeyInfo> host_key;

    static Error make(ErrorKind kind, std::string message,
                      std::string path = {});

    bool ok() const { return kind == ErrorKind::None; }
    void clear();
    std::string describe() const;
};

struct DirectoryEntry {
    std::string name; // base name
    bool is_dir = false;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode = 0;  // POSIX bits (permissions + type)
};

struct TransferProgress {
    std::string file_name;
    std::uint64_t total_bytes = 0; // 0 while unknown
    std::uint64_t transferred_bytes = 0;
    std::chrono::system_clock::time_point start_time{};
    bool done = false;
};

struct TerminalSize {
    int cols = 80;
    int rows = 24;

    bool operator==(const TerminalSize &o) const {
        return cols == o.cols && rows == o.rows;
    }
    bool operator!=(const TerminalSize &o) const { return !(*this == o); }
};

// Pseudo-terminal modes sent with the pty request (RFC 4254, section 8).
struct TerminalModes {
    std::vector<std::pair<std::uint8_t, std::uint32_t>> modes;

    static TerminalModes defaults();
    // Opcode stream terminated by TTY_OP_END.
    std::string encode() const;
};

struct ShellExit {
    int exit_status = 0;
    std::string exit_signal; // empty unless the shell died from a signal
    bool interrupted = false;
    bool benign = true;
};

// Non-zero exit codes and TERM/INT/HUP signals are normal shell endings.
bool isBenignShellExit(int exitStatus, const std::string &exitSignal);

} // namespace sshm
