// Transfer queue for the CLI: runs copy/move tasks through the orchestrator
// on worker threads, at most maxConcurrent at a time.
#pragma once
#include <QObject>
#include <QString>
#include <QVector>
#include "openxfer/TransferOrchestrator.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct TransferTask {
    enum class Type { Copy, Move } type;
    quint64 id = 0;
    QString src;
    QString dst;
    int progress = 0; // 0..100
    int attempts = 0;
    enum class Status { Queued, Running, Done, Error, Canceled } status = Status::Queued;
    QString error;
};

class TransferManager : public QObject {
    Q_OBJECT
public:
    explicit TransferManager(std::shared_ptr<openxfer::TransferOrchestrator> orchestrator,
                             QObject* parent = nullptr);
    ~TransferManager();

    void setMaxConcurrent(int n) { maxConcurrent_ = n > 0 ? n : 1; }
    int maxConcurrent() const { return maxConcurrent_; }
    void setOverwrite(bool v) { overwrite_ = v; }
    void setHighPriority(bool v) { highPriority_ = v; }

    quint64 enqueueCopy(const QString& src, const QString& dst);
    quint64 enqueueMove(const QString& src, const QString& dst);

    void cancelTask(quint64 id);
    void cancelAll();

    QVector<TransferTask> tasks() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return tasks_;
    }
    int countWithStatus(TransferTask::Status s) const;
    // Worker threads not yet joined.
    std::size_t workerCount() const { return workers_.size(); }

signals:
    void tasksChanged();
    // Nothing queued and nothing running.
    void finished();

public slots:
    void processNext();
    void schedule();

private:
    quint64 enqueue(TransferTask::Type type, const QString& src, const QString& dst);
    void runTask(TransferTask t);
    int indexForId(quint64 id) const;
    void reapWorkers();

    std::shared_ptr<openxfer::TransferOrchestrator> orchestrator_;
    QVector<TransferTask> tasks_;
    quint64 nextId_ = 1;
    int maxConcurrent_ = 2;
    bool overwrite_ = false;
    bool highPriority_ = false;
    std::atomic<int> running_{0};
    bool finishedEmitted_ = false;

    // Worker threads by task id (touched only from the owning thread)
    std::unordered_map<quint64, std::thread> workers_;
    // Workers whose task completed, waiting to be joined (guarded by mtx_)
    std::vector<quint64> finishedWorkers_;
    // Tasks for which cancellation was requested
    std::unordered_set<quint64> canceledTasks_;
    mutable std::mutex mtx_;
};
