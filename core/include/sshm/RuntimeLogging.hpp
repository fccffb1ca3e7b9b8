// Redaction policy for log lines. Hosts and remote paths are shown only when
// SSHM_ENV names a development environment and SSHM_LOG_SENSITIVE is set.
// Passwords and passphrases never reach a log line.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sshm {

enum class LogField { Host, Path };

struct LogPolicy {
    bool show_sensitive = false;

    static LogPolicy fromEnvironment() {
        LogPolicy p;
        const std::string env = envWord("SSHM_ENV");
        const bool dev = env == "dev" || env == "development" ||
                         env == "local" || env == "debug";
        const std::string flag = envWord("SSHM_LOG_SENSITIVE");
        p.show_sensitive =
            dev && (flag == "1" || flag == "true" || flag == "yes" ||
                    flag == "on");
        return p;
    }

    // Paths keep their last component so failures stay recognizable.
    std::string redact(const std::string &value, LogField field) const {
        if (value.empty() || show_sensitive)
            return value;
        if (field == LogField::Path) {
            const std::size_t slash = value.find_last_of('/');
            if (slash != std::string::npos && slash + 1 < value.size())
                return "<redacted>/" + value.substr(slash + 1);
        }
        return "<redacted>";
    }

private:
    // First whitespace-delimited word, lower-cased; "" when unset.
    static std::string envWord(const char *name) {
        const char *raw = std::getenv(name);
        std::string word;
        if (!raw)
            return word;
        const char *p = raw;
        while (*p && std::isspace(static_cast<unsigned char>(*p)))
            ++p;
        while (*p && !std::isspace(static_cast<unsigned char>(*p)))
            word.push_back(*p++);
        std::transform(word.begin(), word.end(), word.begin(), [](char c) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        });
        return word;
    }
};

} // namespace sshm
