// Queue implementation: launches up to maxConcurrent workers and tracks progress.
#include "TransferManager.hpp"
#include "openxfer/Log.hpp"
#include <QMetaObject>

using openxfer::OperationControl;
using openxfer::TransferProgress;
using openxfer::TransferResult;

TransferManager::TransferManager(std::shared_ptr<openxfer::TransferOrchestrator> orchestrator, QObject* parent)
    : QObject(parent), orchestrator_(std::move(orchestrator)) {}

TransferManager::~TransferManager() {
    cancelAll();
    for (auto& kv : workers_) {
        if (kv.second.joinable()) kv.second.join();
    }
    workers_.clear();
}

quint64 TransferManager::enqueue(TransferTask::Type type, const QString& src, const QString& dst) {
    TransferTask t{ type };
    t.src = src;
    t.dst = dst;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        t.id = nextId_++;
        tasks_.push_back(t);
        finishedEmitted_ = false;
    }
    emit tasksChanged();
    return t.id;
}

quint64 TransferManager::enqueueCopy(const QString& src, const QString& dst) {
    return enqueue(TransferTask::Type::Copy, src, dst);
}

quint64 TransferManager::enqueueMove(const QString& src, const QString& dst) {
    return enqueue(TransferTask::Type::Move, src, dst);
}

void TransferManager::cancelTask(quint64 id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        canceledTasks_.insert(id);
        int i = indexForId(id);
        // Running tasks keep their status until the worker observes the flag
        if (i >= 0 && tasks_[i].status == TransferTask::Status::Queued)
            tasks_[i].status = TransferTask::Status::Canceled;
    }
    emit tasksChanged();
}

void TransferManager::cancelAll() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& t : tasks_) {
            canceledTasks_.insert(t.id);
            if (t.status == TransferTask::Status::Queued) t.status = TransferTask::Status::Canceled;
        }
    }
    emit tasksChanged();
}

int TransferManager::countWithStatus(TransferTask::Status s) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto& t : tasks_)
        if (t.status == s) ++n;
    return n;
}

void TransferManager::processNext() {
    schedule();
}

void TransferManager::reapWorkers() {
    std::vector<quint64> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        done.swap(finishedWorkers_);
    }
    for (quint64 id : done) {
        auto it = workers_.find(id);
        if (it == workers_.end()) continue;
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
}

void TransferManager::schedule() {
    reapWorkers();
    while (running_.load() < maxConcurrent_) {
        TransferTask t;
        int idx = -1;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            for (int i = 0; i < tasks_.size(); ++i) {
                if (tasks_[i].status == TransferTask::Status::Queued) {
                    idx = i;
                    break;
                }
            }
            if (idx >= 0) {
                tasks_[idx].status = TransferTask::Status::Running;
                tasks_[idx].progress = 0;
                tasks_[idx].attempts += 1;
                tasks_[idx].error.clear();
                t = tasks_[idx];
            }
        }
        if (idx < 0) break;
        emit tasksChanged();

        running_.fetch_add(1);
        const quint64 taskId = t.id;
        // A retried task may still have its previous worker here
        auto it = workers_.find(taskId);
        if (it != workers_.end() && it->second.joinable()) it->second.join();
        workers_[taskId] = std::thread([this, t]() { runTask(t); });
    }

    bool idle = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_.load() == 0 && !finishedEmitted_) {
            idle = true;
            for (const auto& task : tasks_)
                if (task.status == TransferTask::Status::Queued) idle = false;
            if (idle) finishedEmitted_ = true;
        }
    }
    if (idle) emit finished();
}

void TransferManager::runTask(TransferTask t) {
    const quint64 taskId = t.id;
    OperationControl ctl;
    ctl.highPriority = highPriority_;
    ctl.shouldCancel = [this, taskId]() -> bool {
        std::lock_guard<std::mutex> lk(mtx_);
        return canceledTasks_.count(taskId) > 0;
    };

    auto progress = [this, taskId](const TransferProgress& p) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            int i = indexForId(taskId);
            if (i >= 0) tasks_[i].progress = int(p.fraction * 100.0);
        }
        emit tasksChanged();
    };

    const std::string src = t.src.toStdString();
    const std::string dst = t.dst.toStdString();
    TransferResult r = t.type == TransferTask::Type::Move
                           ? orchestrator_->move(src, dst, overwrite_, progress, ctl)
                           : orchestrator_->copy(src, dst, overwrite_, progress, ctl);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        int i = indexForId(taskId);
        if (i >= 0) {
            if (r.ok()) {
                tasks_[i].progress = 100;
                tasks_[i].status = TransferTask::Status::Done;
            } else if (r.is(openxfer::ErrorKind::Cancelled) || canceledTasks_.count(taskId)) {
                tasks_[i].status = TransferTask::Status::Canceled;
                tasks_[i].error = QString::fromStdString(r.error().message);
            } else {
                tasks_[i].status = TransferTask::Status::Error;
                tasks_[i].error = QString::fromStdString(
                    openxfer::describeTransferError(t.src.section('/', -1).toStdString(), src, dst, r));
            }
        }
        finishedWorkers_.push_back(taskId);
    }
    if (!r.ok()) LOGW("task %llu %s -> %s failed: %s", (unsigned long long)taskId, src.c_str(), dst.c_str(),
                      r.error().message.c_str());

    emit tasksChanged();
    running_.fetch_sub(1);
    // Reschedule on the owning thread
    QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
}

int TransferManager::indexForId(quint64 id) const {
    for (int i = 0; i < tasks_.size(); ++i)
        if (tasks_[i].id == id) return i;
    return -1;
}
