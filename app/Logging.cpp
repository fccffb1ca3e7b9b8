#include "Logging.hpp"

#include "sshm/RuntimeLogging.hpp"

Q_LOGGING_CATEGORY(sshmSession, "sshm.session")
Q_LOGGING_CATEGORY(sshmTransfer, "sshm.transfer")
Q_LOGGING_CATEGORY(sshmTerminal, "sshm.terminal")
Q_LOGGING_CATEGORY(sshmConfig, "sshm.config")

namespace sshm {

static const LogPolicy &policy() {
    static const LogPolicy p = LogPolicy::fromEnvironment();
    return p;
}

QString logHost(const std::string &host) {
    return QString::fromStdString(policy().redact(host, LogField::Host));
}

QString logPath(const std::string &path) {
    return QString::fromStdString(policy().redact(path, LogField::Path));
}

void logStateChange(SessionState from, SessionState to, const Error &e,
                    const Endpoint &endpoint) {
    if (e.ok())
        qCInfo(sshmSession) << toString(from) << "->" << toString(to);
    else
        qCWarning(sshmSession) << toString(from) << "->" << toString(to)
                               << toString(e.kind)
                               << logHost(endpoint.hostId());
}

} // namespace sshm
