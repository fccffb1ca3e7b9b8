// File and directory transfers over a dedicated SFTP channel. Every
// operation blocks the calling thread; closing the engine from another
// thread aborts whatever is in flight.
#pragma once
#include "ProgressChannel.hpp"
#include "Transport.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sshm {

enum class TransferDirection { Upload, Download };

// One entry of an ordered batch. Directories are copied recursively.
struct TransferItem {
    TransferDirection direction = TransferDirection::Upload;
    std::string source;      // local for uploads, remote for downloads
    std::string destination; // remote for uploads, local for downloads
};

class TransferEngine {
public:
    static constexpr std::size_t kDefaultChunkSize = 32 * 1024;

    explicit TransferEngine(std::size_t chunkSize = kDefaultChunkSize);
    ~TransferEngine();

    TransferEngine(const TransferEngine &) = delete;
    TransferEngine &operator=(const TransferEngine &) = delete;

    bool open(Transport &transport, Error &err);
    // Idempotent.
    bool close(Error &err);
    bool isOpen() const;

    std::size_t chunkSize() const { return chunkSize_; }

    // realpath of "." on the server, cached per channel.
    bool remoteHomeDirectory(std::string &out, Error &err);
    // Normalizes and resolves a leading "~".
    bool resolveRemotePath(const std::string &path, std::string &out,
                           Error &err);
    bool resolveLocalPath(const std::string &path, std::string &out,
                          Error &err) const;

    bool listFiles(const std::string &remotePath,
                   std::vector<DirectoryEntry> &out, Error &err);
    bool listLocalFiles(const std::string &localPath,
                        std::vector<DirectoryEntry> &out, Error &err) const;

    // A missing path is a Path error.
    bool getFileInfo(const std::string &remotePath, DirectoryEntry &info,
                     Error &err);
    bool getLocalFileInfo(const std::string &localPath, DirectoryEntry &info,
                          Error &err) const;

    // sink may be null.
    bool uploadFile(const std::string &localPath, const std::string &remotePath,
                    ProgressChannel *sink, Error &err);
    bool downloadFile(const std::string &remotePath,
                      const std::string &localPath, ProgressChannel *sink,
                      Error &err);

    // Depth-first; directories before their contents; stops at the first
    // failure.
    bool copyDirectoryToRemote(const std::string &localDir,
                               const std::string &remoteDir,
                               ProgressChannel *sink, Error &err);
    bool copyDirectoryFromRemote(const std::string &remoteDir,
                                 const std::string &localDir,
                                 ProgressChannel *sink, Error &err);

    // mkdir -p.
    bool createRemoteDirectory(const std::string &remotePath, Error &err);
    // Files are unlinked; directories are emptied recursively, then removed.
    bool removeRemoteFile(const std::string &remotePath, Error &err);
    bool renameRemoteFile(const std::string &from, const std::string &to,
                          Error &err);

    // Items run in order; the first failure stops the batch and its index is
    // stored in failedIndex.
    bool transferBatch(const std::vector<TransferItem> &items,
                       ProgressChannel *sink, std::size_t &failedIndex,
                       Error &err);

private:
    std::shared_ptr<SftpChannel> channel(Error &err) const;

    bool uploadResolved(SftpChannel &sftp, const std::string &local,
                        const std::string &remote, ProgressChannel *sink,
                        Error &err);
    bool downloadResolved(SftpChannel &sftp, const std::string &remote,
                          const std::string &local, ProgressChannel *sink,
                          Error &err);
    bool copyToRemote(SftpChannel &sftp, const std::string &local,
                      const std::string &remote, ProgressChannel *sink,
                      Error &err);
    bool copyFromRemote(SftpChannel &sftp, const std::string &remote,
                        const std::string &local, ProgressChannel *sink,
                        Error &err);
    bool mkdirs(SftpChannel &sftp, const std::string &remote, Error &err);
    bool removeTree(SftpChannel &sftp, const std::string &remote, Error &err);

    const std::size_t chunkSize_;
    mutable std::mutex mutex_;
    std::shared_ptr<SftpChannel> sftp_;
    std::string home_;
};

} // namespace sshm
