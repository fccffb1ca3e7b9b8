#include "CommandLine.hpp"

#include "sshm/PathUtils.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <algorithm>

namespace sshm {

int minimumArguments(const QString &command) {
    if (command == QLatin1String("shell"))
        return 0;
    if (command == QLatin1String("ls") || command == QLatin1String("stat") ||
        command == QLatin1String("mkdir") || command == QLatin1String("rm"))
        return 1;
    if (command == QLatin1String("get") || command == QLatin1String("put") ||
        command == QLatin1String("mv"))
        return 2;
    return -1;
}

bool parseCommandLine(const QStringList &arguments, CommandRequest &out,
                      QString &err, QString &usage, QString &version) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "SSH session manager: interactive shell and file transfers.\n\n"
        "Commands:\n"
        "  shell               open an interactive shell\n"
        "  ls PATH             list a remote directory\n"
        "  stat PATH           show remote file information\n"
        "  get REMOTE... LOCAL download files or directories\n"
        "  put LOCAL... REMOTE upload files or directories\n"
        "  mkdir PATH          create a remote directory (with parents)\n"
        "  rm PATH             remove a remote file or directory tree\n"
        "  mv FROM TO          rename a remote path"));
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();
    const QCommandLineOption configOpt(
        QStringList{"c", "config"}, QStringLiteral("Configuration file."),
        QStringLiteral("file"));
    const QCommandLineOption profileOpt(
        QStringList{"P", "profile"}, QStringLiteral("Connection profile."),
        QStringLiteral("name"));
    const QCommandLineOption hostOpt(QStringList{"H", "host"},
                                     QStringLiteral("Remote host."),
                                     QStringLiteral("host"));
    const QCommandLineOption portOpt(QStringList{"p", "port"},
                                     QStringLiteral("Remote port."),
                                     QStringLiteral("port"));
    const QCommandLineOption loginOpt(QStringList{"l", "login"},
                                      QStringLiteral("Login name."),
                                      QStringLiteral("user"));
    const QCommandLineOption passwordEnvOpt(
        QStringLiteral("password-env"),
        QStringLiteral("Read the password from SSHM_PASSWORD."));
    const QCommandLineOption identityOpt(QStringList{"i", "identity"},
                                         QStringLiteral("Private key file."),
                                         QStringLiteral("file"));
    const QCommandLineOption acceptOpt(
        QStringLiteral("accept-host-key"),
        QStringLiteral("Trust the presented host key without asking."));
    parser.addOptions({configOpt, profileOpt, hostOpt, portOpt, loginOpt,
                       passwordEnvOpt, identityOpt, acceptOpt});
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run."));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));

    if (!parser.parse(arguments)) {
        err = parser.errorText();
        return false;
    }
    if (parser.isSet(helpOpt)) {
        usage = parser.helpText();
        return true;
    }
    if (parser.isSet(versionOpt)) {
        version = QCoreApplication::applicationName() + QLatin1Char(' ') +
                  QCoreApplication::applicationVersion();
        return true;
    }

    out = CommandRequest{};
    out.config_path = parser.value(configOpt);
    out.profile = parser.value(profileOpt);
    out.host = parser.value(hostOpt);
    out.login = parser.value(loginOpt);
    out.identity_file = parser.value(identityOpt);
    out.password_from_env = parser.isSet(passwordEnvOpt);
    out.accept_host_key = parser.isSet(acceptOpt);
    if (parser.isSet(portOpt)) {
        bool ok = false;
        const int port = parser.value(portOpt).toInt(&ok);
        if (!ok || port < 1 || port > 65535) {
            err = QStringLiteral("invalid port: %1").arg(parser.value(portOpt));
            return false;
        }
        out.port = port;
    }
    if (out.password_from_env && !out.identity_file.isEmpty()) {
        err = QStringLiteral("--password-env and --identity are exclusive");
        return false;
    }
    if (out.profile.isEmpty() && out.host.isEmpty()) {
        err = QStringLiteral("either --profile or --host is required");
        return false;
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err = QStringLiteral("missing command");
        return false;
    }
    out.command = positional.takeFirst();
    const int needed = minimumArguments(out.command);
    if (needed < 0) {
        err = QStringLiteral("unknown command: %1").arg(out.command);
        return false;
    }
    if (positional.size() < needed) {
        err = QStringLiteral("%1: missing arguments").arg(out.command);
        return false;
    }
    const bool variadic = out.command == QLatin1String("get") ||
                          out.command == QLatin1String("put");
    if (!variadic && positional.size() > needed) {
        err = QStringLiteral("%1: too many arguments").arg(out.command);
        return false;
    }
    out.args = positional;
    return true;
}

bool resolveConnection(const CommandRequest &request,
                       const AppSettings &settings, ConnectionProfile &out,
                       QString &err) {
    if (!request.profile.isEmpty()) {
        if (!loadProfile(request.config_path, request.profile, settings, out,
                         err))
            return false;
    } else {
        out = ConnectionProfile{};
        out.options.terminal_type = settings.terminal_type.toStdString();
        out.options.keep_alive = settings.keep_alive_seconds > 0;
        out.options.keep_alive_interval =
            std::chrono::seconds(std::max(settings.keep_alive_seconds, 1));
        out.options.connect_timeout = settings.connect_timeout;
    }

    if (!request.host.isEmpty())
        out.endpoint.host = request.host.toStdString();
    if (request.port > 0)
        out.endpoint.port = (std::uint16_t)request.port;
    if (!request.login.isEmpty())
        out.endpoint.login = request.login.toStdString();

    if (request.password_from_env) {
        if (!qEnvironmentVariableIsSet("SSHM_PASSWORD")) {
            err = QStringLiteral("SSHM_PASSWORD is not set");
            return false;
        }
        out.credential = Credential::fromPassword(
            qEnvironmentVariable("SSHM_PASSWORD").toStdString());
    } else if (!request.identity_file.isEmpty()) {
        out.credential = Credential::fromKeyFile(expandLocalHome(
            request.identity_file.toStdString(), localHomeDirectory()));
    }

    if (out.endpoint.host.empty()) {
        err = QStringLiteral("no host given");
        return false;
    }
    if (out.endpoint.login.empty()) {
        err = QStringLiteral("no login given");
        return false;
    }
    if (!out.credential.password && !out.credential.private_key_path) {
        err = QStringLiteral("no credential given (use --password-env or "
                             "--identity)");
        return false;
    }
    return true;
}

} // namespace sshm
