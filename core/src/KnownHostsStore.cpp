// known_hosts reader/writer on libssh2's knownhost collection. Only lines
// naming the exact "[host]:port" pattern of the connecting endpoint are ever
// touched.
#include "sshm/KnownHostsStore.hpp"
#include "sshm/Libssh2Transport.hpp"

#include <libssh2.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshm {

namespace {

// One libssh2 knownhost collection. libssh2 ties collections to a session;
// this one never connects.
class KnownHostList {
public:
    KnownHostList() {
        if (!initLibssh2())
            return;
        session_ = libssh2_session_init();
        if (session_)
            hosts_ = libssh2_knownhost_init(session_);
    }
    ~KnownHostList() {
        if (hosts_)
            libssh2_knownhost_free(hosts_);
        if (session_)
            libssh2_session_free(session_);
    }
    KnownHostList(const KnownHostList &) = delete;
    KnownHostList &operator=(const KnownHostList &) = delete;

    LIBSSH2_KNOWNHOSTS *get() const { return hosts_; }

    // Lines libssh2 cannot parse are left out of the collection; they stay
    // in the file and never match.
    void load(const std::vector<std::string> &lines) {
        for (const auto &line : lines) {
            if (libssh2_knownhost_readline(hosts_, line.c_str(), line.size(),
                                           LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0)
                continue;
        }
    }

private:
    LIBSSH2_SESSION *session_ = nullptr;
    LIBSSH2_KNOWNHOSTS *hosts_ = nullptr;
};

// 0 when libssh2 has no knownhost type for the algorithm.
int keyTypeMask(const std::string &algorithm) {
    if (algorithm == "ssh-rsa")
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    if (algorithm == "ssh-dss")
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    if (algorithm == "ecdsa-sha2-nistp256")
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    if (algorithm == "ecdsa-sha2-nistp384")
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    if (algorithm == "ecdsa-sha2-nistp521")
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    if (algorithm == "ssh-ed25519")
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    return 0;
}

std::string keyTypeName(int typemask) {
    switch (typemask & LIBSSH2_KNOWNHOST_KEY_MASK) {
    case LIBSSH2_KNOWNHOST_KEY_SSHRSA:
        return "ssh-rsa";
    case LIBSSH2_KNOWNHOST_KEY_SSHDSS:
        return "ssh-dss";
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_256:
        return "ecdsa-sha2-nistp256";
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_384:
        return "ecdsa-sha2-nistp384";
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_521:
        return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_KNOWNHOST_KEY_ED25519:
        return "ssh-ed25519";
#endif
    default:
        return "unknown";
    }
}

// Plain-text entries only; hashed names carry no name to compare.
bool findEntry(LIBSSH2_KNOWNHOSTS *hosts, const std::string &pattern,
               HostKeyRecord *out) {
    struct libssh2_knownhost *prev = nullptr;
    struct libssh2_knownhost *entry = nullptr;
    while (libssh2_knownhost_get(hosts, &entry, prev) == 0) {
        if (entry->name && pattern == entry->name) {
            if (out) {
                out->host_pattern = entry->name;
                out->key_type = keyTypeName(entry->typemask);
                out->key_base64 = entry->key ? entry->key : "";
            }
            return true;
        }
        prev = entry;
    }
    return false;
}

// True when the host field of a record line names the pattern.
bool lineNamesHost(const std::string &line, const std::string &pattern) {
    const std::size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line[start] == '#')
        return false;
    const std::size_t end = line.find_first_of(" \t", start);
    const std::string field =
        line.substr(start, end == std::string::npos ? std::string::npos
                                                    : end - start);
    std::size_t pos = 0;
    while (pos <= field.size()) {
        const std::size_t comma = field.find(',', pos);
        const std::size_t stop = comma == std::string::npos ? field.size() : comma;
        if (field.compare(pos, stop - pos, pattern) == 0 &&
            stop - pos == pattern.size())
            return true;
        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }
    return false;
}

// The record line libssh2 writes for the key, without the newline.
bool recordLine(const HostKeyInfo &key, const std::string &pattern,
                std::string &line, std::string &err) {
    const int mask = keyTypeMask(key.algorithm);
    if (mask == 0) {
        err = "unsupported host key type " + key.algorithm;
        return false;
    }
    KnownHostList list;
    if (!list.get()) {
        err = "cannot initialize libssh2 knownhost support";
        return false;
    }
    struct libssh2_knownhost *entry = nullptr;
    if (libssh2_knownhost_addc(list.get(), pattern.c_str(), nullptr,
                               key.key_blob.data(), key.key_blob.size(),
                               nullptr, 0,
                               LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                   LIBSSH2_KNOWNHOST_KEYENC_RAW | mask,
                               &entry) != 0) {
        err = "cannot add host key for " + pattern;
        return false;
    }
    std::vector<char> buf(key.key_blob.size() * 2 + pattern.size() + 128);
    for (;;) {
        size_t outlen = 0;
        const int rc = libssh2_knownhost_writeline(
            list.get(), entry, buf.data(), buf.size(), &outlen,
            LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL) {
            buf.resize(buf.size() * 2);
            continue;
        }
        if (rc != 0) {
            err = "cannot format host key record for " + pattern;
            return false;
        }
        line.assign(buf.data(), outlen);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();
        return true;
    }
}

} // namespace

KnownHostsStore::KnownHostsStore(std::string path) : path_(std::move(path)) {}

std::string KnownHostsStore::hostPattern(const std::string &host,
                                         std::uint16_t port) {
    return "[" + host + "]:" + std::to_string(static_cast<unsigned>(port));
}

bool KnownHostsStore::readLines(std::vector<std::string> &lines, bool &exists,
                                std::string &err) const {
    lines.clear();
    exists = false;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            err = "cannot access known_hosts " + path_ + ": " + ec.message();
            return false;
        }
        return true;
    }
    std::ifstream in(path_);
    if (!in.is_open()) {
        err = "cannot read known_hosts " + path_ + ": " +
              std::strerror(errno);
        return false;
    }
    exists = true;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    if (in.bad()) {
        err = "read error on known_hosts " + path_;
        return false;
    }
    return true;
}

bool KnownHostsStore::lookup(const std::string &host, std::uint16_t port,
                             HostKeyRecord &out, std::string &err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    err.clear();
    std::vector<std::string> lines;
    bool exists = false;
    if (!readLines(lines, exists, err) || !exists)
        return false;
    KnownHostList list;
    if (!list.get()) {
        err = "cannot initialize libssh2 knownhost support";
        return false;
    }
    list.load(lines);
    return findEntry(list.get(), hostPattern(host, port), &out);
}

HostKeyVerdict KnownHostsStore::verify(const HostKeyInfo &key,
                                       std::string &err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    err.clear();
    std::vector<std::string> lines;
    bool exists = false;
    if (!readLines(lines, exists, err) || !exists)
        return HostKeyVerdict::Unknown;

    const int mask = keyTypeMask(key.algorithm);
    if (mask == 0) {
        err = "unsupported host key type " + key.algorithm;
        return HostKeyVerdict::Unknown;
    }
    KnownHostList list;
    if (!list.get()) {
        err = "cannot initialize libssh2 knownhost support";
        return HostKeyVerdict::Unknown;
    }
    list.load(lines);

    struct libssh2_knownhost *found = nullptr;
    const int rc = libssh2_knownhost_checkp(
        list.get(), key.host.c_str(), key.port, key.key_blob.data(),
        key.key_blob.size(),
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | mask,
        &found);
    switch (rc) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return HostKeyVerdict::Trusted;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return HostKeyVerdict::Mismatch;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        // libssh2 skips records of another key type; a record of any type
        // for this endpoint still means the server identity changed.
        return findEntry(list.get(), hostPattern(key.host, key.port), nullptr)
                   ? HostKeyVerdict::Mismatch
                   : HostKeyVerdict::Unknown;
    default:
        err = "known_hosts check failed for " +
              hostPattern(key.host, key.port);
        return HostKeyVerdict::Unknown;
    }
}

bool KnownHostsStore::replace(const HostKeyInfo &key, std::string &err) {
    std::lock_guard<std::mutex> lk(mutex_);
    err.clear();
    if (key.host.empty() || key.algorithm.empty() || key.key_blob.empty()) {
        err = "incomplete host key record";
        return false;
    }

    const std::string pattern = hostPattern(key.host, key.port);
    std::string record;
    if (!recordLine(key, pattern, record, err))
        return false;

    std::vector<std::string> lines;
    bool exists = false;
    if (!readLines(lines, exists, err))
        return false;

    std::vector<std::string> kept;
    kept.reserve(lines.size() + 1);
    for (const auto &line : lines) {
        if (!lineNamesHost(line, pattern))
            kept.push_back(line);
    }
    while (!kept.empty() && kept.back().empty())
        kept.pop_back();
    kept.push_back(record);

    std::error_code ec;
    const fs::path target(path_);
    if (target.has_parent_path()) {
        const bool created = fs::create_directories(target.parent_path(), ec);
        if (ec) {
            err = "cannot create directory for known_hosts: " + ec.message();
            return false;
        }
        if (created && ::chmod(target.parent_path().c_str(), 0700) != 0) {
            err = "cannot restrict permissions on " +
                  target.parent_path().string() + ": " + std::strerror(errno);
            return false;
        }
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            err = "cannot write " + tmp + ": " + std::strerror(errno);
            return false;
        }
        for (const auto &line : kept)
            out << line << '\n';
        out.flush();
        if (!out) {
            err = "write error on " + tmp;
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    if (::chmod(tmp.c_str(), 0600) != 0) {
        err = "cannot restrict permissions on " + tmp + ": " +
              std::strerror(errno);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        err = "cannot replace known_hosts " + path_ + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

bool KnownHostsStore::records(std::vector<HostKeyRecord> &out,
                              std::string &err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    err.clear();
    out.clear();
    std::vector<std::string> lines;
    bool exists = false;
    if (!readLines(lines, exists, err) || !exists)
        return err.empty();
    KnownHostList list;
    if (!list.get()) {
        err = "cannot initialize libssh2 knownhost support";
        return false;
    }
    list.load(lines);
    struct libssh2_knownhost *prev = nullptr;
    struct libssh2_knownhost *entry = nullptr;
    while (libssh2_knownhost_get(list.get(), &entry, prev) == 0) {
        if (entry->name)
            out.push_back({entry->name, keyTypeName(entry->typemask),
                           entry->key ? entry->key : ""});
        prev = entry;
    }
    return true;
}

} // namespace sshm
