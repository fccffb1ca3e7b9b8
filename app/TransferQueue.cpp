#include "TransferQueue.hpp"
#include "Logging.hpp"

namespace sshm {

TransferQueue::TransferQueue(TransferEngine &engine, QObject *parent)
    : QObject(parent), engine_(engine) {}

bool TransferQueue::select(const TransferItem &item) {
    int count = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_)
            return false;
        selection_.push_back(item);
        count = (int)selection_.size();
    }
    emit selectionChanged(count);
    return true;
}

bool TransferQueue::clearSelection() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_)
            return false;
        selection_.clear();
    }
    emit selectionChanged(0);
    return true;
}

std::vector<TransferItem> TransferQueue::selection() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return selection_;
}

bool TransferQueue::runBatch(ProgressChannel *sink, std::size_t &failedIndex,
                             Error &err) {
    std::vector<TransferItem> items;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_) {
            err = Error::make(ErrorKind::InvalidArgument,
                              "a batch is already running");
            return false;
        }
        running_ = true;
        items = selection_;
    }

    qCInfo(sshmTransfer) << "batch start" << "items=" << (int)items.size();
    const bool ok = engine_.transferBatch(items, sink, failedIndex, err);
    if (ok)
        qCInfo(sshmTransfer) << "batch finished";
    else
        qCWarning(sshmTransfer) << "batch stopped" << "index=" << (int)failedIndex
                                << "kind=" << toString(err.kind)
                                << "path=" << logPath(err.path);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        selection_.clear();
        running_ = false;
    }
    emit selectionChanged(0);
    emit batchFinished(ok, ok ? -1 : (int)failedIndex,
                       QString::fromStdString(err.describe()));
    return ok;
}

} // namespace sshm
