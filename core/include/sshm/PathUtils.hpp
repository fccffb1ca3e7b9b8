// Path helpers for the local/remote boundary. Remote paths always use '/';
// local paths use the host separator. Normalization is idempotent.
#pragma once
#include <string>

namespace sshm {

#ifdef _WIN32
constexpr char kLocalSeparator = '\\';
#else
constexpr char kLocalSeparator = '/';
#endif

// Converts separators to '/', collapses repeated separators, drops "."
// segments and any trailing separator ("/" stays "/").
std::string normalizeRemotePath(const std::string &path);
std::string normalizeLocalPath(const std::string &path);

std::string toRemoteSeparators(const std::string &path);
std::string toLocalSeparators(const std::string &path);

// "~" and "~/x" are rewritten against home; anything else is returned
// unchanged. The result is normalized.
std::string expandRemoteHome(const std::string &path, const std::string &home);
std::string expandLocalHome(const std::string &path, const std::string &home);

// Local home directory from $HOME (empty if unset).
std::string localHomeDirectory();

std::string joinRemotePath(const std::string &base, const std::string &name);
std::string joinLocalPath(const std::string &base, const std::string &name);
std::string remoteBaseName(const std::string &path);
std::string remoteParentPath(const std::string &path);

// A single entry name that cannot escape its directory.
bool isSafeEntryName(const std::string &name);

} // namespace sshm
