// Queue implementation: dispatches job actions to worker threads and brings
// their results back to the control thread through queued invocations.
#include "TransferQueue.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>
#include <algorithm>
Q_LOGGING_CATEGORY(ssQueue, "sftpsync.queue")

namespace {

bool runsBefore(const TransferJobPtr &a, const TransferJobPtr &b) {
    if (a->priority != b->priority)
        return static_cast<int>(a->priority) < static_cast<int>(b->priority);
    return a->seq < b->seq;
}

} // namespace

TransferQueue::TransferQueue(int concurrency, QObject *parent)
    : QObject(parent), concurrency_(std::max(1, concurrency)) {}

TransferQueue::~TransferQueue() { shutdown(); }

quint64 TransferQueue::enqueue(TransferJobPtr job) {
    if (!job)
        return 0;
    if (shutdown_) {
        qCWarning(ssQueue) << "enqueue rejected after shutdown" << job->dedupKey;
        return 0;
    }
    job->id = nextId_++;
    job->seq = nextSeq_++;

    auto prev = dedup_.value(job->dedupKey);
    if (prev && removeWaiting(prev)) {
        // Latest wins among work that has not started yet.
        prev->cancel.cancel();
        qCInfo(ssQueue) << "superseded job" << prev->id << "by" << job->id
                        << "key=" << job->dedupKey;
        emit jobCancelled(prev);
    }
    dedup_.insert(job->dedupKey, job);
    insertPending(job);
    emitQueueChanged();
    schedule();
    return job->id;
}

void TransferQueue::setOnline(bool online) {
    if (online_ == online)
        return;
    online_ = online;
    qCInfo(ssQueue) << "queue" << (online ? "online" : "offline");
    if (online_)
        schedule();
}

void TransferQueue::updateConcurrency(int n) {
    concurrency_ = std::max(1, n);
    schedule();
}

bool TransferQueue::cancelByKey(const QString &key) {
    bool found = false;
    auto job = dedup_.value(key);
    if (job && removeWaiting(job)) {
        job->cancel.cancel();
        dedup_.remove(key);
        emit jobCancelled(job);
        found = true;
    }
    for (auto &kv : inflight_) {
        if (kv.second->dedupKey == key) {
            kv.second->cancel.cancel();
            found = true;
        }
    }
    if (found) {
        emitQueueChanged();
        if (snapshot().total == 0)
            emit drained();
    }
    return found;
}

void TransferQueue::cancelAll() {
    std::vector<TransferJobPtr> dropped;
    dropped.swap(pending_);
    for (auto &kv : backoff_)
        dropped.push_back(kv.second);
    backoff_.clear();
    for (auto &kv : inflight_)
        kv.second->cancel.cancel();
    for (const auto &job : dropped) {
        job->cancel.cancel();
        releaseKey(job);
    }
    if (!dropped.empty() || !inflight_.empty())
        qCInfo(ssQueue) << "cancelAll dropped" << dropped.size() << "inflight"
                        << inflight_.size();
    for (const auto &job : dropped)
        emit jobCancelled(job);
    emitQueueChanged();
    if (!dropped.empty() && snapshot().total == 0)
        emit drained();
}

void TransferQueue::shutdown() {
    if (shutdown_)
        return;
    cancelAll();
    shutdown_ = true;
    workers_.joinAll();
    inflight_.clear();
    runningKeys_.clear();
    dedup_.clear();
}

QueueSnapshot TransferQueue::snapshot() const {
    QueueSnapshot s;
    s.pending = static_cast<int>(pending_.size() + backoff_.size());
    s.inflight = static_cast<int>(inflight_.size());
    s.total = s.pending + s.inflight;
    return s;
}

void TransferQueue::setRetryBackoff(int baseMs, int capMs) {
    retryBaseMs_ = std::max(1, baseMs);
    retryCapMs_ = std::max(retryBaseMs_, capMs);
}

int TransferQueue::retryDelayMs(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    qint64 delay = retryBaseMs_;
    for (int i = 1; i < attempt && delay < retryCapMs_; ++i)
        delay *= 2;
    return static_cast<int>(std::min<qint64>(delay, retryCapMs_));
}

void TransferQueue::schedule() {
    if (scheduling_) {
        // A signal handler enqueued or cancelled while we were dispatching.
        rescheduleRequested_ = true;
        return;
    }
    scheduling_ = true;
    do {
        rescheduleRequested_ = false;
        while (!shutdown_ && online_ &&
               static_cast<int>(inflight_.size()) < concurrency_) {
            auto it = std::find_if(pending_.begin(), pending_.end(),
                                   [this](const TransferJobPtr &j) {
                                       return !runningKeys_.contains(j->dedupKey);
                                   });
            if (it == pending_.end())
                break;
            TransferJobPtr job = *it;
            pending_.erase(it);
            startJob(job);
        }
    } while (rescheduleRequested_);
    scheduling_ = false;
}

void TransferQueue::startJob(const TransferJobPtr &job) {
    inflight_[job->id] = job;
    runningKeys_.insert(job->dedupKey);
    qCInfo(ssQueue) << "start job" << job->id << job->dedupKey
                    << "attempt" << (job->retries + 1);
    emit jobStarted(job);
    emitQueueChanged();

    const quint64 id = job->id;
    workers_.launch(id, [this, job, id]() {
        QString err;
        bool ok = false;
        if (job->cancel.isCancelled()) {
            err = QStringLiteral("Cancelled");
        } else if (!job->action) {
            err = QStringLiteral("Job has no action");
        } else {
            ok = job->action(job->cancel, err);
        }
        QMetaObject::invokeMethod(
            this, [this, id, ok, err]() { onJobFinished(id, ok, err); },
            Qt::QueuedConnection);
    });
}

void TransferQueue::onJobFinished(quint64 id, bool ok, const QString &err) {
    workers_.join(id);
    auto it = inflight_.find(id);
    if (it == inflight_.end())
        return;
    TransferJobPtr job = it->second;
    inflight_.erase(it);
    runningKeys_.remove(job->dedupKey);

    if (ok) {
        releaseKey(job);
        qCInfo(ssQueue) << "job completed" << id << job->dedupKey;
        emit jobCompleted(job);
    } else if (job->cancel.isCancelled()) {
        releaseKey(job);
        qCInfo(ssQueue) << "job cancelled" << id << job->dedupKey;
        emit jobCancelled(job);
    } else if (job->retries < job->maxRetries && !shutdown_) {
        ++job->retries;
        const int delay = retryDelayMs(job->retries);
        backoff_[id] = job;
        qCWarning(ssQueue) << "job failed, retrying" << id << job->dedupKey << "in"
                           << delay << "ms:" << err;
        emit jobRetry(job, err, delay);
        QTimer::singleShot(delay, this, [this, id]() { reenterAfterBackoff(id); });
    } else {
        releaseKey(job);
        qCWarning(ssQueue) << "job failed permanently" << id << job->dedupKey
                           << "after" << (job->retries + 1) << "attempts:" << err;
        emit jobFailed(job, err);
    }
    emitQueueChanged();
    schedule();
    if (snapshot().total == 0)
        emit drained();
}

void TransferQueue::reenterAfterBackoff(quint64 id) {
    auto it = backoff_.find(id);
    if (it == backoff_.end())
        return; // cancelled or superseded meanwhile
    TransferJobPtr job = it->second;
    backoff_.erase(it);
    // Same priority, new position.
    job->seq = nextSeq_++;
    insertPending(job);
    schedule();
}

void TransferQueue::insertPending(const TransferJobPtr &job) {
    auto pos = std::upper_bound(pending_.begin(), pending_.end(), job, runsBefore);
    pending_.insert(pos, job);
}

bool TransferQueue::removeWaiting(const TransferJobPtr &job) {
    auto it = std::find(pending_.begin(), pending_.end(), job);
    if (it != pending_.end()) {
        pending_.erase(it);
        return true;
    }
    return backoff_.erase(job->id) > 0;
}

void TransferQueue::releaseKey(const TransferJobPtr &job) {
    auto it = dedup_.find(job->dedupKey);
    if (it != dedup_.end() && it.value() == job)
        dedup_.erase(it);
}

void TransferQueue::emitQueueChanged() {
    const QueueSnapshot s = snapshot();
    emit queueChanged(s.pending, s.inflight, s.total);
}
