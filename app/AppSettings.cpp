#include "AppSettings.hpp"
#include "Logging.hpp"

#include "sshm/PathUtils.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include <algorithm>

namespace sshm {

static const QString kProfilePrefix = QStringLiteral("profile.");

QString defaultConfigPath() {
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.config");
    return base + QStringLiteral("/sshm/sshm.ini");
}

QString defaultKnownHostsPath(const QString &configPath) {
    return QFileInfo(configPath).absolutePath() +
           QStringLiteral("/ssh/known_hosts");
}

static bool checkStatus(const QSettings &s, QString &err) {
    if (s.status() == QSettings::FormatError) {
        err = QStringLiteral("malformed configuration file: %1").arg(s.fileName());
        return false;
    }
    if (s.status() == QSettings::AccessError) {
        err = QStringLiteral("cannot access configuration file: %1").arg(s.fileName());
        return false;
    }
    return true;
}

bool loadSettings(const QString &configPath, AppSettings &out, QString &err) {
    out = AppSettings{};
    out.known_hosts_path = defaultKnownHostsPath(configPath);
    if (!QFileInfo::exists(configPath)) {
        qCInfo(sshmConfig) << "no configuration file, using defaults";
        return true;
    }

    QSettings s(configPath, QSettings::IniFormat);
    if (!checkStatus(s, err))
        return false;

    out.keep_alive_seconds =
        std::max(0, s.value("session/keepAliveSeconds", 30).toInt());
    const int timeoutMs = s.value("session/connectTimeoutMs", 10000).toInt();
    out.connect_timeout = std::chrono::milliseconds(timeoutMs > 0 ? timeoutMs : 10000);
    const QString kh = s.value("session/knownHostsPath").toString().trimmed();
    if (!kh.isEmpty())
        out.known_hosts_path = QString::fromStdString(
            expandLocalHome(kh.toStdString(), localHomeDirectory()));

    const qlonglong chunk = s.value("transfer/chunkSize", 32 * 1024).toLongLong();
    out.chunk_size = (std::size_t)std::clamp<qlonglong>(
        chunk, (qlonglong)AppSettings::kMinChunkSize,
        (qlonglong)AppSettings::kMaxChunkSize);
    if ((qlonglong)out.chunk_size != chunk)
        qCWarning(sshmConfig) << "transfer/chunkSize clamped to" << out.chunk_size;

    const int queue = s.value("transfer/progressQueue", 64).toInt();
    out.progress_queue = (std::size_t)std::max(1, queue);

    const QString term = s.value("terminal/type").toString().trimmed();
    if (!term.isEmpty())
        out.terminal_type = term;
    return true;
}

QStringList profileNames(const QString &configPath) {
    QStringList names;
    if (!QFileInfo::exists(configPath))
        return names;
    QSettings s(configPath, QSettings::IniFormat);
    for (const QString &g : s.childGroups()) {
        if (g.startsWith(kProfilePrefix) && g.size() > kProfilePrefix.size())
            names << g.mid(kProfilePrefix.size());
    }
    names.sort();
    return names;
}

bool loadProfile(const QString &configPath, const QString &name,
                 const AppSettings &defaults, ConnectionProfile &out,
                 QString &err) {
    QSettings s(configPath, QSettings::IniFormat);
    if (!checkStatus(s, err))
        return false;
    const QString group = kProfilePrefix + name;
    if (!s.childGroups().contains(group)) {
        err = QStringLiteral("unknown profile: %1").arg(name);
        return false;
    }

    out = ConnectionProfile{};
    out.name = name;
    s.beginGroup(group);
    out.endpoint.host = s.value("host").toString().trimmed().toStdString();
    const int port = s.value("port", 22).toInt();
    out.endpoint.login = s.value("login").toString().trimmed().toStdString();
    out.options.terminal_type =
        s.value("terminalType", defaults.terminal_type).toString().toStdString();
    out.options.keep_alive =
        s.value("keepAlive", defaults.keep_alive_seconds > 0).toBool();
    out.options.keep_alive_interval =
        std::chrono::seconds(std::max(defaults.keep_alive_seconds, 1));
    out.options.compression = s.value("compression", false).toBool();
    out.options.connect_timeout = defaults.connect_timeout;
    const QString password = s.value("password").toString();
    const QString identity = s.value("identityFile").toString().trimmed();
    const QString passphrase = s.value("passphrase").toString();
    s.endGroup();

    if (port < 1 || port > 65535) {
        err = QStringLiteral("profile %1: invalid port %2").arg(name).arg(port);
        return false;
    }
    out.endpoint.port = (std::uint16_t)port;
    if (!identity.isEmpty() && !password.isEmpty()) {
        err = QStringLiteral("profile %1: set either password or identityFile, "
                             "not both")
                  .arg(name);
        return false;
    }
    if (!identity.isEmpty()) {
        std::optional<std::string> pp;
        if (!passphrase.isEmpty())
            pp = passphrase.toStdString();
        out.credential = Credential::fromKeyFile(
            expandLocalHome(identity.toStdString(), localHomeDirectory()), pp);
    } else if (!password.isEmpty()) {
        out.credential = Credential::fromPassword(password.toStdString());
    }
    qCDebug(sshmConfig) << "loaded profile" << name << "host"
                        << logHost(out.endpoint.host);
    return true;
}

bool saveProfile(const QString &configPath, const ConnectionProfile &profile,
                 QString &err) {
    if (profile.name.trimmed().isEmpty()) {
        err = QStringLiteral("profile name is empty");
        return false;
    }
    QDir().mkpath(QFileInfo(configPath).absolutePath());
    QSettings s(configPath, QSettings::IniFormat);
    const QString group = kProfilePrefix + profile.name;
    s.remove(group);
    s.beginGroup(group);
    s.setValue("host", QString::fromStdString(profile.endpoint.host));
    s.setValue("port", (int)profile.endpoint.port);
    s.setValue("login", QString::fromStdString(profile.endpoint.login));
    s.setValue("terminalType",
               QString::fromStdString(profile.options.terminal_type));
    s.setValue("keepAlive", profile.options.keep_alive);
    s.setValue("compression", profile.options.compression);
    if (profile.credential.private_key_path)
        s.setValue("identityFile",
                   QString::fromStdString(*profile.credential.private_key_path));
    else if (profile.credential.password)
        s.setValue("password",
                   QString::fromStdString(*profile.credential.password));
    s.endGroup();
    s.sync();
    return checkStatus(s, err);
}

} // namespace sshm
