// Logging categories of the front end. Filter with QT_LOGGING_RULES, e.g.
// QT_LOGGING_RULES="sshm.transfer.debug=true".
#pragma once
#include "sshm/SshTypes.hpp"

#include <QLoggingCategory>
#include <QString>
#include <string>

Q_DECLARE_LOGGING_CATEGORY(sshmSession)
Q_DECLARE_LOGGING_CATEGORY(sshmTransfer)
Q_DECLARE_LOGGING_CATEGORY(sshmTerminal)
Q_DECLARE_LOGGING_CATEGORY(sshmConfig)

namespace sshm {

// Redacted unless sensitive logging is enabled in the environment.
QString logHost(const std::string &host);
QString logPath(const std::string &path);

// Session transition for the log. Error messages may name the host, so only
// the error kind and the redacted endpoint are written.
void logStateChange(SessionState from, SessionState to, const Error &e,
                    const Endpoint &endpoint);

} // namespace sshm
