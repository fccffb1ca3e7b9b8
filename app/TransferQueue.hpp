// Selection set for bulk copies. The marked items run as one ordered
// fail-fast batch; the selection is cleared only once the batch has
// concluded.
#pragma once
#include "sshm/TransferEngine.hpp"
#include <QObject>
#include <QString>
#include <atomic>
#include <mutex>
#include <vector>

namespace sshm {

class TransferQueue : public QObject {
    Q_OBJECT
public:
    explicit TransferQueue(TransferEngine &engine, QObject *parent = nullptr);

    // Refused while a batch is running.
    bool select(const TransferItem &item);
    bool clearSelection();
    std::vector<TransferItem> selection() const;
    bool isRunning() const { return running_; }

    // Blocks for the whole batch. failedIndex is set on failure.
    bool runBatch(ProgressChannel *sink, std::size_t &failedIndex, Error &err);

signals:
    void selectionChanged(int count);
    void batchFinished(bool ok, int failedIndex, const QString &message);

private:
    TransferEngine &engine_;
    mutable std::mutex mutex_;
    std::vector<TransferItem> selection_;
    std::atomic<bool> running_{false};
};

} // namespace sshm
