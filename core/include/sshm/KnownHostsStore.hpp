// Trust store: known_hosts-format file with one record per "[host]:port".
#pragma once
#include "SshTypes.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace sshm {

struct HostKeyRecord {
    std::string host_pattern; // "[10.0.0.5]:22"
    std::string key_type;     // "ssh-ed25519"
    std::string key_base64;
};

class KnownHostsStore {
public:
    explicit KnownHostsStore(std::string path);

    const std::string &path() const { return path_; }

    static std::string hostPattern(const std::string &host,
                                   std::uint16_t port);

    // Returns false with err empty when there is no record for the host.
    bool lookup(const std::string &host, std::uint16_t port,
                HostKeyRecord &out, std::string &err) const;

    // Read only. A missing file means every host is Unknown.
    HostKeyVerdict verify(const HostKeyInfo &key, std::string &err) const;

    // Drops every line for the host and appends the new record. Unrelated
    // lines are kept verbatim.
    bool replace(const HostKeyInfo &key, std::string &err);

    bool records(std::vector<HostKeyRecord> &out, std::string &err) const;

private:
    bool readLines(std::vector<std::string> &lines, bool &exists,
                   std::string &err) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace sshm
