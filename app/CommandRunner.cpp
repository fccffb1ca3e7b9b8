#include "CommandRunner.hpp"
#include "Logging.hpp"
#include "ProgressPrinter.hpp"
#include "TransferQueue.hpp"

#include "sshm/PathUtils.hpp"
#include "sshm/TerminalController.hpp"

#include <QDateTime>
#include <QFileInfo>

#include <cstdio>

namespace sshm {

CommandRunner::CommandRunner(Session &session, const AppSettings &settings)
    : session_(session), settings_(settings) {
    out_ = [](const QString &line) {
        std::fputs(line.toLocal8Bit().constData(), stdout);
        std::fputc('\n', stdout);
    };
}

void CommandRunner::write(const QString &line) {
    if (out_)
        out_(line);
}

QString CommandRunner::formatHostKey(const HostKeyInfo &key) {
    return QStringLiteral("Host %1:%2 presented an untrusted %3 key.\n"
                          "Fingerprint: %4")
        .arg(QString::fromStdString(key.host))
        .arg(key.port)
        .arg(QString::fromStdString(key.algorithm),
             QString::fromStdString(key.fingerprint));
}

int CommandRunner::connect(const Endpoint &endpoint,
                           const Credential &credential,
                           const ConnectionOptions &options,
                           bool acceptHostKey, Error &err) {
    qCInfo(sshmSession) << "connecting to" << logHost(endpoint.hostId());
    if (session_.connect(endpoint, credential, options, err))
        return kExitOk;
    if (err.kind != ErrorKind::HostKeyVerificationRequired || !err.host_key)
        return kExitFailure;

    const HostKeyInfo key = *err.host_key;
    bool accepted = acceptHostKey;
    if (!accepted) {
        write(formatHostKey(key));
        accepted = prompt_ && prompt_(key);
    }
    if (!accepted) {
        qCWarning(sshmSession) << "host key rejected for"
                               << logHost(endpoint.hostId());
        return kExitHostKeyRejected;
    }
    qCInfo(sshmSession) << "host key accepted" << QString::fromStdString(key.fingerprint);
    err.clear();
    return session_.connectWithAcceptedKey(endpoint, credential, options, err)
               ? kExitOk
               : kExitFailure;
}

int CommandRunner::execute(const QString &command, const QStringList &args,
                           Error &err) {
    err.clear();
    if (!session_.isConnected()) {
        err = Error::make(ErrorKind::NotConnected, "not connected");
        return kExitFailure;
    }
    if (command == QLatin1String("shell"))
        return shell(err);
    if (command == QLatin1String("ls"))
        return list(args.value(0), err);
    if (command == QLatin1String("stat"))
        return stat(args.value(0), err);
    if (command == QLatin1String("get"))
        return transfer(TransferDirection::Download, args, err);
    if (command == QLatin1String("put"))
        return transfer(TransferDirection::Upload, args, err);
    if (command == QLatin1String("mkdir"))
        return mkdir(args.value(0), err);
    if (command == QLatin1String("rm"))
        return remove(args.value(0), err);
    if (command == QLatin1String("mv"))
        return rename(args.value(0), args.value(1), err);
    err = Error::make(ErrorKind::InvalidArgument,
                      "unknown command: " + command.toStdString());
    return kExitUsage;
}

int CommandRunner::shell(Error &err) {
    if (!device_) {
        err = Error::make(ErrorKind::InvalidArgument, "no terminal available");
        return kExitFailure;
    }
    TerminalController controller(session_, *device_);
    if (!controller.configureTerminal(settings_.terminal_type.toStdString(), err))
        return kExitFailure;
    qCInfo(sshmTerminal) << "shell started";
    ShellExit exit;
    const bool ok = controller.startShell(exit, err);
    qCInfo(sshmTerminal) << "shell ended" << "status=" << exit.exit_status
                         << "signal=" << QString::fromStdString(exit.exit_signal)
                         << "interrupted=" << exit.interrupted;
    if (!ok)
        return kExitFailure;
    return exit.exit_status >= 0 && exit.exit_status < 256 ? exit.exit_status
                                                           : kExitFailure;
}

int CommandRunner::withEngine(
    const std::function<bool(TransferEngine &, Error &)> &fn, Error &err) {
    TransferEngine engine(settings_.chunk_size);
    if (!engine.open(session_.transport(), err))
        return kExitFailure;
    const bool ok = fn(engine, err);
    Error closeErr;
    if (!engine.close(closeErr)) {
        if (ok)
            err = closeErr;
        return kExitFailure;
    }
    return ok ? kExitOk : kExitFailure;
}

static QString permissionString(const DirectoryEntry &e) {
    QString s = e.is_dir ? QStringLiteral("d") : QStringLiteral("-");
    static const char flags[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i)
        s += (e.mode & (0400u >> i)) ? QLatin1Char(flags[i]) : QLatin1Char('-');
    return s;
}

QString CommandRunner::formatEntry(const DirectoryEntry &e) {
    const QString when =
        e.mtime ? QDateTime::fromSecsSinceEpoch((qint64)e.mtime, Qt::UTC)
                      .toString(QStringLiteral("yyyy-MM-dd HH:mm"))
                : QStringLiteral("-");
    QString name = QString::fromStdString(e.name);
    if (e.is_dir)
        name += QLatin1Char('/');
    return QStringLiteral("%1 %2 %3 %4")
        .arg(permissionString(e))
        .arg((qulonglong)e.size, 12)
        .arg(when, name);
}

int CommandRunner::list(const QString &path, Error &err) {
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            std::vector<DirectoryEntry> entries;
            if (!engine.listFiles(path.toStdString(), entries, e))
                return false;
            for (const DirectoryEntry &entry : entries)
                write(formatEntry(entry));
            return true;
        },
        err);
}

int CommandRunner::stat(const QString &path, Error &err) {
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            DirectoryEntry info;
            if (!engine.getFileInfo(path.toStdString(), info, e))
                return false;
            write(formatEntry(info));
            return true;
        },
        err);
}

int CommandRunner::transfer(TransferDirection dir, const QStringList &args,
                            Error &err) {
    const QStringList sources = args.mid(0, args.size() - 1);
    const std::string target = args.last().toStdString();
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            TransferQueue queue(engine);
            for (const QString &src : sources) {
                TransferItem item;
                item.direction = dir;
                item.source = src.toStdString();
                item.destination = target;
                if (sources.size() > 1) {
                    // Several sources go into the target directory.
                    if (dir == TransferDirection::Upload)
                        item.destination = joinRemotePath(
                            target, QFileInfo(src).fileName().toStdString());
                    else
                        item.destination = joinLocalPath(
                            target,
                            remoteBaseName(normalizeRemotePath(item.source)));
                }
                queue.select(item);
            }

            ProgressChannel progress(settings_.progress_queue);
            ProgressPrinter printer(progress, progressOut_);
            printer.start();
            std::size_t failedIndex = 0;
            const bool ok = queue.runBatch(&progress, failedIndex, e);
            printer.stop();
            return ok;
        },
        err);
}

int CommandRunner::mkdir(const QString &path, Error &err) {
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            return engine.createRemoteDirectory(path.toStdString(), e);
        },
        err);
}

int CommandRunner::remove(const QString &path, Error &err) {
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            return engine.removeRemoteFile(path.toStdString(), e);
        },
        err);
}

int CommandRunner::rename(const QString &from, const QString &to, Error &err) {
    return withEngine(
        [&](TransferEngine &engine, Error &e) {
            return engine.renameRemoteFile(from.toStdString(), to.toStdString(),
                                           e);
        },
        err);
}

} // namespace sshm
