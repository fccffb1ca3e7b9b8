// INI-backed configuration: global defaults plus named connection profiles.
#pragma once
#include "sshm/SshTypes.hpp"
#include <QString>
#include <QStringList>
#include <chrono>
#include <cstddef>

namespace sshm {

struct AppSettings {
    static constexpr std::size_t kMinChunkSize = 4 * 1024;
    static constexpr std::size_t kMaxChunkSize = 1024 * 1024;

    int keep_alive_seconds = 30; // 0 disables keepalive
    std::chrono::milliseconds connect_timeout{10000};
    QString known_hosts_path;
    std::size_t chunk_size = 32 * 1024;
    std::size_t progress_queue = 64;
    QString terminal_type = QStringLiteral("xterm-256color");
};

struct ConnectionProfile {
    QString name;
    Endpoint endpoint;
    ConnectionOptions options;
    Credential credential;
};

// $XDG_CONFIG_HOME/sshm/sshm.ini (or ~/.config/sshm/sshm.ini).
QString defaultConfigPath();
// <config dir>/ssh/known_hosts next to the given config file.
QString defaultKnownHostsPath(const QString &configPath);

// A missing file yields the defaults. Out-of-range values are clamped.
bool loadSettings(const QString &configPath, AppSettings &out, QString &err);

QStringList profileNames(const QString &configPath);
// Fields absent from the profile fall back to the global settings.
bool loadProfile(const QString &configPath, const QString &name,
                 const AppSettings &defaults, ConnectionProfile &out,
                 QString &err);
bool saveProfile(const QString &configPath, const ConnectionProfile &profile,
                 QString &err);

} // namespace sshm
