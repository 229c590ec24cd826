// Priority-ordered job scheduler with bounded concurrency, per-resource
// deduplication and retry with exponential backoff. Lives on the control
// thread; only job actions run on worker threads.
#pragma once
#include "TransferJob.hpp"
#include "WorkerThreads.hpp"
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <map>
#include <vector>

class TransferQueue : public QObject {
    Q_OBJECT
public:
    explicit TransferQueue(int concurrency = 3, QObject *parent = nullptr);
    ~TransferQueue() override;

    // Takes the job, assigns id/seq and returns the id (0 after shutdown).
    // A not-yet-started job with the same dedupKey is cancelled and replaced.
    quint64 enqueue(TransferJobPtr job);

    // Offline stops new dispatch; running jobs finish normally.
    void setOnline(bool online);
    bool isOnline() const { return online_; }

    void updateConcurrency(int n);
    int concurrency() const { return concurrency_; }

    // Pending jobs are dropped at once; a running job only sees its token.
    bool cancelByKey(const QString &key);
    void cancelAll();
    // cancelAll() plus joining every worker. The queue accepts nothing after.
    void shutdown();

    QueueSnapshot snapshot() const;
    bool isIdle() const { return snapshot().total == 0; }
    bool hasKey(const QString &key) const { return dedup_.contains(key); }

    // delay(attempt) = min(cap, base * 2^(attempt - 1))
    void setRetryBackoff(int baseMs, int capMs);
    int retryDelayMs(int attempt) const;

signals:
    void queueChanged(int pending, int inflight, int total);
    void jobStarted(TransferJobPtr job);
    void jobCompleted(TransferJobPtr job);
    void jobRetry(TransferJobPtr job, QString error, int delayMs);
    void jobFailed(TransferJobPtr job, QString error);
    void jobCancelled(TransferJobPtr job);
    // Nothing pending, backing off or running anymore.
    void drained();

private:
    void schedule();
    void startJob(const TransferJobPtr &job);
    void onJobFinished(quint64 id, bool ok, const QString &err);
    void reenterAfterBackoff(quint64 id);
    void insertPending(const TransferJobPtr &job);
    bool removeWaiting(const TransferJobPtr &job);
    void releaseKey(const TransferJobPtr &job);
    void emitQueueChanged();

    int concurrency_ = 3;
    bool online_ = true;
    bool shutdown_ = false;
    bool scheduling_ = false;
    bool rescheduleRequested_ = false;
    quint64 nextId_ = 1;
    quint64 nextSeq_ = 1;
    int retryBaseMs_ = 500;
    int retryCapMs_ = 30000;

    std::vector<TransferJobPtr> pending_;       // sorted by (priority, seq)
    std::map<quint64, TransferJobPtr> backoff_; // waiting out a retry delay
    std::map<quint64, TransferJobPtr> inflight_;
    QHash<QString, TransferJobPtr> dedup_; // newest job per key
    QSet<QString> runningKeys_;
    WorkerThreads workers_;
};

Q_DECLARE_METATYPE(TransferJobPtr)
