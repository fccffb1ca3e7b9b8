// Command-line surface of the sshm executable.
#pragma once
#include "AppSettings.hpp"
#include <QString>
#include <QStringList>

namespace sshm {

struct CommandRequest {
    QString config_path;
    QString profile;
    QString host;
    int port = 0; // 0: profile value or 22
    QString login;
    bool password_from_env = false; // SSHM_PASSWORD
    QString identity_file;
    bool accept_host_key = false;
    QString command;
    QStringList args;
};

// Parses argv (program name first). On failure err holds the reason; with
// --help or --version, usage or version holds the text to print.
bool parseCommandLine(const QStringList &arguments, CommandRequest &out,
                      QString &err, QString &usage, QString &version);

// Positional argument count accepted by a command, or -1 if unknown.
int minimumArguments(const QString &command);

// Profile values (if any) overridden by command-line flags. A password
// requested with --password-env comes from SSHM_PASSWORD.
bool resolveConnection(const CommandRequest &request,
                       const AppSettings &settings, ConnectionProfile &out,
                       QString &err);

} // namespace sshm
