#include "sshm/SshTypes.hpp"

namespace sshm {

namespace {

// RFC 4254 opcodes
constexpr std::uint8_t kTtyOpEnd = 0;
constexpr std::uint8_t kVINTR = 1;
constexpr std::uint8_t kVQUIT = 2;
constexpr std::uint8_t kVERASE = 3;
constexpr std::uint8_t kVKILL = 4;
constexpr std::uint8_t kVEOF = 5;
constexpr std::uint8_t kVSUSP = 10;
constexpr std::uint8_t kVWERASE = 14;
constexpr std::uint8_t kVLNEXT = 15;
constexpr std::uint8_t kECHO = 53;
constexpr std::uint8_t kOPOST = 70;
constexpr std::uint8_t kONLCR = 72;
constexpr std::uint8_t kTtyOpIspeed = 128;
constexpr std::uint8_t kTtyOpOspeed = 129;

} // namespace

const char *toString(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Connecting:
        return "Connecting";
    case SessionState::Connected:
        return "Connected";
    case SessionState::Error:
        return "Error";
    }
    return "Unknown";
}

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Connection:
        return "connection";
    case ErrorKind::HostKeyVerificationRequired:
        return "host-key-verification-required";
    case ErrorKind::Keepalive:
        return "keepalive";
    case ErrorKind::TransferIO:
        return "transfer-io";
    case ErrorKind::Path:
        return "path";
    case ErrorKind::ResourceRelease:
        return "resource-release";
    case ErrorKind::NotConnected:
        return "not-connected";
    case ErrorKind::InvalidArgument:
        return "invalid-argument";
    case ErrorKind::Timeout:
        return "timeout";
    }
    return "unknown";
}

std::string Endpoint::hostId() const {
    return host + ":" + std::to_string(static_cast<unsigned>(port));
}

Credential Credential::fromPassword(std::string password) {
    Credential c;
    c.password = std::move(password);
    return c;
}

Credential Credential::fromKeyFile(std::string path,
                                   std::optional<std::string> passphrase) {
    Credential c;
    c.private_key_path = std::move(path);
    c.private_key_passphrase = std::move(passphrase);
    return c;
}

Error Error::make(ErrorKind kind, std::string message, std::string path) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    e.path = std::move(path);
    return e;
}

void Error::clear() {
    kind = ErrorKind::None;
    message.clear();
    path.clear();
    host_key.reset();
}

std::string Error::describe() const {
    if (kind == ErrorKind::None)
        return {};
    if (path.empty())
        return message;
    return message + ": " + path;
}

TerminalModes TerminalModes::defaults() {
    TerminalModes m;
    m.modes = {
        {kECHO, 1},         {kTtyOpIspeed, 14400}, {kTtyOpOspeed, 14400},
        {kVINTR, 3},        {kVQUIT, 28},          {kVERASE, 127},
        {kVKILL, 21},       {kVEOF, 4},            {kVWERASE, 23},
        {kVLNEXT, 22},      {kVSUSP, 26},          {kOPOST, 1},
        {kONLCR, 1},
    };
    return m;
}

std::string TerminalModes::encode() const {
    std::string out;
    out.reserve(modes.size() * 5 + 1);
    for (const auto &m : modes) {
        out.push_back(static_cast<char>(m.first));
        // uint32, network byte order
        out.push_back(static_cast<char>((m.second >> 24) & 0xFF));
        out.push_back(static_cast<char>((m.second >> 16) & 0xFF));
        out.push_back(static_cast<char>((m.second >> 8) & 0xFF));
        out.push_back(static_cast<char>(m.second & 0xFF));
    }
    out.push_back(static_cast<char>(kTtyOpEnd));
    return out;
}

bool isBenignShellExit(int /*exitStatus*/, const std::string &exitSignal) {
    // Plain exit codes, zero or not, are regular shell endings.
    if (exitSignal.empty())
        return true;
    return exitSignal == "TERM" || exitSignal == "INT" || exitSignal == "HUP";
}

} // namespace sshm
