#include "sshm/PathUtils.hpp"

#include <cstdlib>
#include <vector>

namespace sshm {

namespace {

// Shared by both modes: sep is the separator of the target side.
std::string normalizeWith(const std::string &path, char sep, bool keepUnc) {
    if (path.empty())
        return path;

    std::string prefix;
    std::size_t i = 0;
    if (keepUnc && path.size() >= 2 && path[0] == sep && path[1] == sep) {
        prefix.assign(2, sep);
        i = 2;
    } else if (path[0] == sep) {
        prefix.assign(1, sep);
        i = 1;
    }

    std::vector<std::string> parts;
    std::string cur;
    for (; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == sep) {
            if (!cur.empty() && cur != ".")
                parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(path[i]);
        }
    }

    std::string out = prefix;
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k)
            out.push_back(sep);
        out += parts[k];
    }
    if (out.empty())
        return ".";
    return out;
}

std::string expandHome(const std::string &path, const std::string &home,
                       char sep) {
    if (path.empty() || path[0] != '~' || home.empty())
        return path;
    if (path.size() == 1)
        return home;
    if (path[1] == '/' || path[1] == sep)
        return home + sep + path.substr(2);
    // "~user" forms are left alone.
    return path;
}

} // namespace

std::string toRemoteSeparators(const std::string &path) {
    std::string out = path;
    for (char &c : out) {
        if (c == '\\')
            c = '/';
    }
    return out;
}

std::string toLocalSeparators(const std::string &path) {
#ifdef _WIN32
    std::string out = path;
    for (char &c : out) {
        if (c == '/')
            c = '\\';
    }
    return out;
#else
    return path;
#endif
}

std::string normalizeRemotePath(const std::string &path) {
    return normalizeWith(toRemoteSeparators(path), '/', false);
}

std::string normalizeLocalPath(const std::string &path) {
#ifdef _WIN32
    return normalizeWith(toLocalSeparators(path), kLocalSeparator, true);
#else
    return normalizeWith(path, kLocalSeparator, false);
#endif
}

std::string expandRemoteHome(const std::string &path,
                             const std::string &home) {
    return normalizeRemotePath(
        expandHome(toRemoteSeparators(path), normalizeRemotePath(home), '/'));
}

std::string expandLocalHome(const std::string &path,
                            const std::string &home) {
    return normalizeLocalPath(
        expandHome(path, home, kLocalSeparator));
}

std::string localHomeDirectory() {
#ifdef _WIN32
    const char *home = std::getenv("USERPROFILE");
#else
    const char *home = std::getenv("HOME");
#endif
    return home ? std::string(home) : std::string();
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return normalizeRemotePath(name);
    return normalizeRemotePath(base + "/" + toRemoteSeparators(name));
}

std::string joinLocalPath(const std::string &base, const std::string &name) {
    if (base.empty())
        return normalizeLocalPath(name);
    return normalizeLocalPath(base + kLocalSeparator +
                              toLocalSeparators(name));
}

std::string remoteBaseName(const std::string &path) {
    const std::string p = normalizeRemotePath(path);
    if (p == "/")
        return p;
    const std::size_t slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string remoteParentPath(const std::string &path) {
    const std::string p = normalizeRemotePath(path);
    const std::size_t slash = p.rfind('/');
    if (slash == std::string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return p.substr(0, slash);
}

bool isSafeEntryName(const std::string &name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0')
            return false;
    }
    return true;
}

} // namespace sshm
