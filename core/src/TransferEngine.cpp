#include "sshm/TransferEngine.hpp"
#include "sshm/PathUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshm {

namespace {

constexpr std::size_t kMaxChunkSize = 1024 * 1024;

bool checkPath(const std::string &path, Error &err) {
    if (path.empty()) {
        err = Error::make(ErrorKind::Path, "empty path");
        return false;
    }
    if (path.find('\0') != std::string::npos) {
        err = Error::make(ErrorKind::Path, "path contains a NUL byte", path);
        return false;
    }
    return true;
}

bool startsWithHome(const std::string &path) {
    return !path.empty() && path[0] == '~' &&
           (path.size() == 1 || path[1] == '/' || path[1] == '\\');
}

bool localStat(const std::string &path, DirectoryEntry &info, Error &err) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int e = errno;
        err = Error::make(e == ENOENT ? ErrorKind::Path : ErrorKind::TransferIO,
                          std::string("stat failed: ") + std::strerror(e), path);
        return false;
    }
    info.name = fs::path(path).filename().string();
    info.is_dir = S_ISDIR(st.st_mode);
    info.size = info.is_dir ? 0 : (std::uint64_t)st.st_size;
    info.mtime = (std::uint64_t)st.st_mtime;
    info.mode = (std::uint32_t)st.st_mode;
    return true;
}

bool isSymlink(const std::string &path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

std::string ioError(const char *what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// Closes the local file; reports the first failure only.
bool closeLocal(std::FILE *f, const std::string &path, bool ok, Error &err) {
    if (std::fclose(f) != 0 && ok) {
        err = Error::make(ErrorKind::TransferIO, ioError("local close failed"),
                          path);
        return false;
    }
    return ok;
}

} // namespace

TransferEngine::TransferEngine(std::size_t chunkSize)
    : chunkSize_(chunkSize == 0 ? kDefaultChunkSize
                                : std::min(chunkSize, kMaxChunkSize)) {}

TransferEngine::~TransferEngine() {
    Error ignored;
    close(ignored);
}

bool TransferEngine::open(Transport &transport, Error &err) {
    err.clear();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (sftp_) {
            err = Error::make(ErrorKind::InvalidArgument,
                              "transfer channel already open");
            return false;
        }
    }
    if (!transport.isOpen()) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return false;
    }
    std::unique_ptr<SftpChannel> ch = transport.openSftp(err);
    if (!ch)
        return false;
    std::lock_guard<std::mutex> lk(mutex_);
    sftp_ = std::move(ch);
    home_.clear();
    return true;
}

bool TransferEngine::close(Error &err) {
    err.clear();
    std::shared_ptr<SftpChannel> ch;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ch = std::move(sftp_);
        sftp_.reset();
        home_.clear();
    }
    if (!ch)
        return true;
    Error closeErr;
    if (!ch->close(closeErr)) {
        err = Error::make(ErrorKind::ResourceRelease,
                          "close failed: " + closeErr.describe());
        return false;
    }
    return true;
}

bool TransferEngine::isOpen() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sftp_ && sftp_->isOpen();
}

std::shared_ptr<SftpChannel> TransferEngine::channel(Error &err) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!sftp_ || !sftp_->isOpen()) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return nullptr;
    }
    return sftp_;
}

bool TransferEngine::remoteHomeDirectory(std::string &out, Error &err) {
    err.clear();
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!home_.empty()) {
            out = home_;
            return true;
        }
    }
    std::string home;
    if (!ch->realpath(".", home, err))
        return false;
    home = normalizeRemotePath(home);
    std::lock_guard<std::mutex> lk(mutex_);
    if (sftp_ == ch)
        home_ = home;
    out = home;
    return true;
}

bool TransferEngine::resolveRemotePath(const std::string &path,
                                       std::string &out, Error &err) {
    err.clear();
    if (!checkPath(path, err))
        return false;
    if (!startsWithHome(path)) {
        out = normalizeRemotePath(path);
        return true;
    }
    std::string home;
    if (!remoteHomeDirectory(home, err))
        return false;
    out = expandRemoteHome(path, home);
    return true;
}

bool TransferEngine::resolveLocalPath(const std::string &path,
                                      std::string &out, Error &err) const {
    err.clear();
    if (!checkPath(path, err))
        return false;
    if (!startsWithHome(path)) {
        out = normalizeLocalPath(toLocalSeparators(path));
        return true;
    }
    const std::string home = localHomeDirectory();
    if (home.empty()) {
        err = Error::make(ErrorKind::Path, "home directory is not set", path);
        return false;
    }
    out = expandLocalHome(toLocalSeparators(path), home);
    return true;
}

bool TransferEngine::listFiles(const std::string &remotePath,
                               std::vector<DirectoryEntry> &out, Error &err) {
    std::string path;
    if (!resolveRemotePath(remotePath, path, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    return ch->list(path, out, err);
}

bool TransferEngine::listLocalFiles(const std::string &localPath,
                                    std::vector<DirectoryEntry> &out,
                                    Error &err) const {
    std::string path;
    if (!resolveLocalPath(localPath, path, err))
        return false;
    out.clear();
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        err = Error::make(ErrorKind::TransferIO,
                          "cannot list directory: " + ec.message(), path);
        return false;
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        const std::string child = it->path().string();
        DirectoryEntry e;
        Error statErr;
        if (!localStat(child, e, statErr)) {
            // Dangling links still show up, with what lstat knows.
            struct stat st{};
            if (::lstat(child.c_str(), &st) != 0) {
                err = statErr;
                return false;
            }
            e.name = it->path().filename().string();
            e.mode = (std::uint32_t)st.st_mode;
            e.mtime = (std::uint64_t)st.st_mtime;
        }
        out.push_back(std::move(e));
    }
    if (ec) {
        err = Error::make(ErrorKind::TransferIO,
                          "cannot list directory: " + ec.message(), path);
        return false;
    }
    std::sort(out.begin(), out.end(),
              [](const DirectoryEntry &a, const DirectoryEntry &b) {
                  return a.name < b.name;
              });
    return true;
}

bool TransferEngine::getFileInfo(const std::string &remotePath,
                                 DirectoryEntry &info, Error &err) {
    std::string path;
    if (!resolveRemotePath(remotePath, path, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    if (!ch->stat(path, info, err)) {
        if (err.ok())
            err = Error::make(ErrorKind::Path, "no such file", path);
        return false;
    }
    return true;
}

bool TransferEngine::getLocalFileInfo(const std::string &localPath,
                                      DirectoryEntry &info, Error &err) const {
    std::string path;
    if (!resolveLocalPath(localPath, path, err))
        return false;
    return localStat(path, info, err);
}

bool TransferEngine::uploadFile(const std::string &localPath,
                                const std::string &remotePath,
                                ProgressChannel *sink, Error &err) {
    std::string local, remote;
    if (!resolveLocalPath(localPath, local, err) ||
        !resolveRemotePath(remotePath, remote, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    return uploadResolved(*ch, local, remote, sink, err);
}

bool TransferEngine::uploadResolved(SftpChannel &sftp, const std::string &local,
                                    const std::string &remote,
                                    ProgressChannel *sink, Error &err) {
    DirectoryEntry info;
    if (!localStat(local, info, err))
        return false;
    if (info.is_dir) {
        err = Error::make(ErrorKind::Path, "is a directory", local);
        return false;
    }

    std::FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = Error::make(ErrorKind::TransferIO,
                          ioError("cannot open local file"), local);
        return false;
    }
    std::unique_ptr<RemoteFile> rf = sftp.openWrite(remote, info.mode & 0777, err);
    if (!rf) {
        Error ignored;
        closeLocal(lf, local, false, ignored);
        return false;
    }

    TransferProgress progress;
    progress.file_name = info.name;
    progress.total_bytes = info.size;
    progress.start_time = std::chrono::system_clock::now();

    std::vector<char> buf(chunkSize_);
    bool ok = true;
    for (;;) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            if (!rf->write(buf.data(), n, err)) {
                ok = false;
                break;
            }
            progress.transferred_bytes += n;
            if (sink)
                sink->offer(progress);
        }
        if (n < buf.size()) {
            if (std::ferror(lf)) {
                err = Error::make(ErrorKind::TransferIO,
                                  ioError("local read failed"), local);
                ok = false;
            }
            break;
        }
    }

    Error closeErr;
    if (!rf->close(closeErr) && ok) {
        err = closeErr;
        ok = false;
    }
    ok = closeLocal(lf, local, ok, err);
    if (!ok)
        return false;

    if (progress.transferred_bytes != progress.total_bytes) {
        err = Error::make(ErrorKind::TransferIO,
                          "file size changed during transfer", local);
        return false;
    }
    progress.done = true;
    if (sink)
        sink->publishFinal(progress);
    return true;
}

bool TransferEngine::downloadFile(const std::string &remotePath,
                                  const std::string &localPath,
                                  ProgressChannel *sink, Error &err) {
    std::string remote, local;
    if (!resolveRemotePath(remotePath, remote, err) ||
        !resolveLocalPath(localPath, local, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    return downloadResolved(*ch, remote, local, sink, err);
}

bool TransferEngine::downloadResolved(SftpChannel &sftp,
                                      const std::string &remote,
                                      const std::string &local,
                                      ProgressChannel *sink, Error &err) {
    DirectoryEntry info;
    if (!sftp.stat(remote, info, err)) {
        if (err.ok())
            err = Error::make(ErrorKind::Path, "no such file", remote);
        return false;
    }
    if (info.is_dir) {
        err = Error::make(ErrorKind::Path, "is a directory", remote);
        return false;
    }

    const fs::path parent = fs::path(local).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            err = Error::make(ErrorKind::TransferIO,
                              "cannot create local directory: " + ec.message(),
                              parent.string());
            return false;
        }
    }

    std::unique_ptr<RemoteFile> rf = sftp.openRead(remote, err);
    if (!rf)
        return false;
    std::FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = Error::make(ErrorKind::TransferIO,
                          ioError("cannot open local file for writing"), local);
        Error ignored;
        rf->close(ignored);
        return false;
    }

    TransferProgress progress;
    progress.file_name = remoteBaseName(remote);
    progress.total_bytes = info.size;
    progress.start_time = std::chrono::system_clock::now();

    std::vector<char> buf(chunkSize_);
    bool ok = true;
    for (;;) {
        const long n = rf->read(buf.data(), buf.size(), err);
        if (n == 0)
            break;
        if (n < 0) {
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, (std::size_t)n, lf) != (std::size_t)n) {
            err = Error::make(ErrorKind::TransferIO,
                              ioError("local write failed"), local);
            ok = false;
            break;
        }
        progress.transferred_bytes += (std::uint64_t)n;
        if (sink)
            sink->offer(progress);
    }

    Error closeErr;
    if (!rf->close(closeErr) && ok) {
        err = closeErr;
        ok = false;
    }
    ok = closeLocal(lf, local, ok, err);
    if (!ok)
        return false;

    // A zero size from stat means the server did not report one.
    if (progress.total_bytes == 0) {
        progress.total_bytes = progress.transferred_bytes;
    } else if (progress.transferred_bytes != progress.total_bytes) {
        err = Error::make(ErrorKind::TransferIO,
                          "file size changed during transfer", remote);
        return false;
    }
    progress.done = true;
    if (sink)
        sink->publishFinal(progress);
    return true;
}

bool TransferEngine::copyDirectoryToRemote(const std::string &localDir,
                                           const std::string &remoteDir,
                                           ProgressChannel *sink, Error &err) {
    std::string local, remote;
    if (!resolveLocalPath(localDir, local, err) ||
        !resolveRemotePath(remoteDir, remote, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    DirectoryEntry info;
    if (!localStat(local, info, err))
        return false;
    if (!info.is_dir) {
        err = Error::make(ErrorKind::Path, "not a directory", local);
        return false;
    }
    return copyToRemote(*ch, local, remote, sink, err);
}

bool TransferEngine::copyToRemote(SftpChannel &sftp, const std::string &local,
                                  const std::string &remote,
                                  ProgressChannel *sink, Error &err) {
    if (!mkdirs(sftp, remote, err))
        return false;
    std::vector<DirectoryEntry> entries;
    if (!listLocalFiles(local, entries, err))
        return false;
    for (const auto &e : entries) {
        const std::string childLocal = joinLocalPath(local, e.name);
        const std::string childRemote =
            joinRemotePath(remote, toRemoteSeparators(e.name));
        if (e.is_dir) {
            // Linked directories are not followed; a link back up the tree
            // would recurse until ELOOP.
            if (isSymlink(childLocal))
                continue;
            if (!copyToRemote(sftp, childLocal, childRemote, sink, err))
                return false;
        } else if (S_ISREG(e.mode)) {
            if (!uploadResolved(sftp, childLocal, childRemote, sink, err))
                return false;
        }
        // Sockets, fifos and dangling links have no content to copy. Linked
        // files are copied by content.
    }
    return true;
}

bool TransferEngine::copyDirectoryFromRemote(const std::string &remoteDir,
                                             const std::string &localDir,
                                             ProgressChannel *sink,
                                             Error &err) {
    std::string remote, local;
    if (!resolveRemotePath(remoteDir, remote, err) ||
        !resolveLocalPath(localDir, local, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    DirectoryEntry info;
    if (!ch->stat(remote, info, err)) {
        if (err.ok())
            err = Error::make(ErrorKind::Path, "no such file", remote);
        return false;
    }
    if (!info.is_dir) {
        err = Error::make(ErrorKind::Path, "not a directory", remote);
        return false;
    }
    return copyFromRemote(*ch, remote, local, sink, err);
}

bool TransferEngine::copyFromRemote(SftpChannel &sftp,
                                    const std::string &remote,
                                    const std::string &local,
                                    ProgressChannel *sink, Error &err) {
    std::vector<DirectoryEntry> entries;
    if (!sftp.list(remote, entries, err))
        return false;
    // Names are checked before anything is written locally.
    for (const auto &e : entries) {
        if (!isSafeEntryName(e.name)) {
            err = Error::make(ErrorKind::Path, "unsafe entry name",
                              remote + "/" + e.name);
            return false;
        }
    }

    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        err = Error::make(ErrorKind::TransferIO,
                          "cannot create local directory: " + ec.message(),
                          local);
        return false;
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry &a, const DirectoryEntry &b) {
                  return a.name < b.name;
              });
    for (const auto &e : entries) {
        const std::string childRemote = joinRemotePath(remote, e.name);
        const std::string childLocal = joinLocalPath(local, e.name);
        if (e.is_dir) {
            if (!copyFromRemote(sftp, childRemote, childLocal, sink, err))
                return false;
        } else {
            if (!downloadResolved(sftp, childRemote, childLocal, sink, err))
                return false;
        }
    }
    return true;
}

bool TransferEngine::createRemoteDirectory(const std::string &remotePath,
                                           Error &err) {
    std::string path;
    if (!resolveRemotePath(remotePath, path, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    return mkdirs(*ch, path, err);
}

bool TransferEngine::mkdirs(SftpChannel &sftp, const std::string &remote,
                            Error &err) {
    std::string prefix = remote[0] == '/' ? "/" : "";
    std::size_t start = prefix.size();
    while (start <= remote.size()) {
        std::size_t slash = remote.find('/', start);
        if (slash == std::string::npos)
            slash = remote.size();
        if (slash > start) {
            if (!prefix.empty() && prefix.back() != '/')
                prefix += '/';
            prefix += remote.substr(start, slash - start);

            DirectoryEntry info;
            if (sftp.stat(prefix, info, err)) {
                if (!info.is_dir) {
                    err = Error::make(ErrorKind::Path, "not a directory", prefix);
                    return false;
                }
            } else {
                if (!err.ok())
                    return false;
                if (!sftp.mkdir(prefix, 0755, err))
                    return false;
            }
        }
        start = slash + 1;
    }
    return true;
}

bool TransferEngine::removeRemoteFile(const std::string &remotePath,
                                      Error &err) {
    std::string path;
    if (!resolveRemotePath(remotePath, path, err))
        return false;
    if (path == "/" || path == ".") {
        err = Error::make(ErrorKind::Path, "refusing to remove", path);
        return false;
    }
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    DirectoryEntry info;
    if (!ch->lstat(path, info, err)) {
        if (err.ok())
            err = Error::make(ErrorKind::Path, "no such file", path);
        return false;
    }
    if (info.is_dir)
        return removeTree(*ch, path, err);
    return ch->removeFile(path, err);
}

bool TransferEngine::removeTree(SftpChannel &sftp, const std::string &remote,
                                Error &err) {
    std::vector<DirectoryEntry> entries;
    if (!sftp.list(remote, entries, err))
        return false;
    for (const auto &e : entries) {
        if (!isSafeEntryName(e.name)) {
            err = Error::make(ErrorKind::Path, "unsafe entry name",
                              remote + "/" + e.name);
            return false;
        }
        const std::string child = joinRemotePath(remote, e.name);
        if (e.is_dir) {
            if (!removeTree(sftp, child, err))
                return false;
        } else if (!sftp.removeFile(child, err)) {
            return false;
        }
    }
    return sftp.removeDir(remote, err);
}

bool TransferEngine::renameRemoteFile(const std::string &from,
                                      const std::string &to, Error &err) {
    std::string src, dst;
    if (!resolveRemotePath(from, src, err) || !resolveRemotePath(to, dst, err))
        return false;
    std::shared_ptr<SftpChannel> ch = channel(err);
    if (!ch)
        return false;
    return ch->rename(src, dst, err);
}

bool TransferEngine::transferBatch(const std::vector<TransferItem> &items,
                                   ProgressChannel *sink,
                                   std::size_t &failedIndex, Error &err) {
    err.clear();
    failedIndex = items.size();
    for (std::size_t i = 0; i < items.size(); ++i) {
        const TransferItem &item = items[i];
        bool ok = false;
        DirectoryEntry info;
        if (item.direction == TransferDirection::Upload) {
            ok = getLocalFileInfo(item.source, info, err) &&
                 (info.is_dir ? copyDirectoryToRemote(item.source,
                                                      item.destination, sink,
                                                      err)
                              : uploadFile(item.source, item.destination, sink,
                                           err));
        } else {
            ok = getFileInfo(item.source, info, err) &&
                 (info.is_dir ? copyDirectoryFromRemote(item.source,
                                                        item.destination, sink,
                                                        err)
                              : downloadFile(item.source, item.destination,
                                             sink, err));
        }
        if (!ok) {
            failedIndex = i;
            if (err.path.empty())
                err.path = item.source;
            err.message = "item " + std::to_string(i + 1) + " of " +
                          std::to_string(items.size()) + ": " + err.message;
            return false;
        }
    }
    return true;
}

} // namespace sshm
