#pragma once
#include "Transport.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace sshm {

// Shared libssh2 state (socket, session, io lock). Channels keep it alive
// until they are released.
struct Libssh2Connection;

// Runs libssh2_init once per process; false when it failed.
bool initLibssh2();

class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    bool open(const Endpoint &endpoint, const Credential &credential,
              const ConnectionOptions &options,
              const HostKeyVerifier &verifier, Error &err) override;
    bool close(Error &err) override;
    bool isOpen() const override;

    bool sendKeepalive(Error &err) override;

    std::unique_ptr<ShellChannel> openShell(Error &err) override;
    std::unique_ptr<SftpChannel> openSftp(Error &err) override;

private:
    bool tcpConnect(const std::string &host, std::uint16_t port, int &sock,
                    Error &err);
    bool handshake(Libssh2Connection &conn, const Endpoint &endpoint,
                   const ConnectionOptions &options,
                   const HostKeyVerifier &verifier, Error &err);
    bool authenticate(Libssh2Connection &conn, const Endpoint &endpoint,
                      const Credential &credential, Error &err);

    std::shared_ptr<Libssh2Connection> conn_;
    // Bounds the whole of open().
    std::chrono::steady_clock::time_point deadline_{};
};

} // namespace sshm
