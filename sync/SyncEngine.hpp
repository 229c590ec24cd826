// Orchestrator: turns local change notifications into deduplicated transfer
// jobs, keeps the signature/pending ledgers, detects conflicts and drives full
// push/pull runs. Lives on the control thread; job actions run on queue
// workers and only touch the mutex-guarded ledgers.
#pragma once
#include "ConnectionRegistry.hpp"
#include "PathFilter.hpp"
#include "SyncSettings.hpp"
#include "SyncTypes.hpp"
#include "TransferQueue.hpp"
#include "WorkerThreads.hpp"
#include <QHash>
#include <QList>
#include <QMetaObject>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace sftpsync { class SftpClient; }

enum class LocalChangeKind { Changed, Created, Deleted };

// Registers the sync value types for queued signal connections.
void registerSyncMetaTypes();

class SyncEngine : public QObject {
    Q_OBJECT
public:
    // Returns the current configuration, or nothing when none is available.
    using SettingsProvider = std::function<std::optional<SyncSettings>()>;

    SyncEngine(ConnectionRegistry &registry, SettingsProvider settings,
               const QString &workspaceDir, QObject *parent = nullptr);
    ~SyncEngine() override;

    // Connection control
    void connectToTarget();
    void disconnectFromTarget();
    ConnectionState connectionState() const { return state_; }
    std::shared_ptr<ConnectionManager> connection() const { return connection_; }

    // Watcher-facing entry point. With autoSync off only the pending ledger
    // is updated.
    void onLocalChange(const QString &path, LocalChangeKind kind);
    void onLocalRename(const QString &oldPath, const QString &newPath);

    // Debounced per path.
    void scheduleSyncFile(const QString &localPath, SyncDirection direction = SyncDirection::Push);
    void scheduleDelete(const QString &localPath);
    void scheduleCreateDir(const QString &localPath);
    void scheduleRename(const QString &oldPath, const QString &newPath);

    // Pushes the pending-change ledger; syncFinished(Push, ...) when drained.
    bool syncAll();
    // Mirrors the remote tree locally; syncFinished(Pull, ...) when drained.
    bool syncPull();
    void forcePush(const QString &path);
    void forcePull(const QString &path);
    bool isSyncing() const { return syncing_; }

    bool isManagedPath(const QString &path) const;
    bool shouldIgnore(const QString &path);
    QString localRoot() const { return target_.localRoot; }
    QString remoteRoot() const { return target_.remoteRoot; }

    FileSyncStatus fileStatus(const QString &path) const;
    FileSyncStatus directoryStatus(const QString &dir) const;
    QList<ConflictArtifact> conflicts() const;
    void resolveConflict(const QString &sourcePath);
    QHash<QString, PendingChangeType> pendingChanges() const;
    std::optional<SyncSignature> baseline(const QString &path) const;
    void setBaseline(const QString &path, const SyncSignature &sig);

    TransferQueue &queue() { return queue_; }
    QueueSnapshot queueSnapshot() const { return queue_.snapshot(); }
    int offlineJobCount() const { return static_cast<int>(offline_.size()); }
    int suppressedPathCount() const;

    void setDebounceMs(int ms) { debounceMs_ = ms; }
    void setSuppressionMs(int ms) { suppressionMs_ = ms; }

    // Stops timers and workers and releases the connection.
    void dispose();

signals:
    void stateChanged(ConnectionState state);
    void queueChanged(int pending, int inflight, int total);
    void fileStatusChanged(QString path, FileSyncStatus status);
    void conflictDetected(ConflictArtifact artifact);
    void jobFailed(QString path, QString type, QString error);
    void syncFinished(SyncDirection direction, bool ok, int failedJobs);
    void notice(QString message);

private:
    enum class DebouncedOp { Push, Pull, Delete };

    // Resolves settings/target and (re)binds the connection manager.
    bool bindTarget();
    void onConnectionState(ConnectionState state);
    void debounce(const QString &path, DebouncedOp op);
    void syncFile(const QString &localPath, SyncDirection direction);
    void syncDelete(const QString &localPath);
    void submit(const TransferJobPtr &job);
    void flushOffline();
    void dropQueuedWork();
    void finishRun(bool ok);
    void onPullListed(const QStringList &remoteFiles, const QString &error);

    QString normalizeLocal(const QString &path) const;
    QString relativeOf(const QString &localPath) const;
    QString remoteFor(const QString &relativePath) const;
    bool isSyncable(const QString &localPath) const;
    static bool isInternalPath(const QString &path);

    TransferJobPtr makeUploadJob(const QString &localPath, const QString &remotePath);
    TransferJobPtr makeDownloadJob(const QString &localPath, const QString &remotePath);
    TransferJobPtr makeDeleteJob(const QString &localPath, const QString &remotePath);
    TransferJobPtr makeCreateDirJob(const QString &localPath, const QString &remotePath);
    TransferJobPtr makeRenameJob(const QString &fromLocal, const QString &fromRemote,
                                 const QString &toLocal, const QString &toRemote);

    // Worker-thread halves of the job actions.
    bool uploadFile(sftpsync::SftpClient &c, const QString &localPath,
                    const QString &remotePath, const QString &tempRemote,
                    const CancelToken &cancel, QString &err);
    bool downloadFile(sftpsync::SftpClient &c, const QString &localPath,
                      const QString &remotePath, const QString &tempLocal,
                      const CancelToken &cancel, QString &err);
    bool deleteRemote(sftpsync::SftpClient &c, const QString &localPath,
                      const QString &remotePath, QString &err);
    bool renameRemote(sftpsync::SftpClient &c, const QString &fromLocal,
                      const QString &fromRemote, const QString &toLocal,
                      const QString &toRemote, const CancelToken &cancel, QString &err);
    bool ensureRemoteDirs(sftpsync::SftpClient &c, const QString &remoteDir, QString &err);
    void createConflictArtifacts(sftpsync::SftpClient &c, const QString &localPath,
                                 const QString &remotePath);
    void collectLocalFiles(const QString &dir, QStringList &out) const;

    // Ledger access, safe from any thread.
    void markIgnored(const QString &path);
    void recordBaseline(const QString &path, const SyncSignature &sig);
    void dropBaseline(const QString &path);
    void clearPendingIf(const QString &path, PendingChangeType type);
    void setPending(const QString &path, PendingChangeType type);
    // Control thread only.
    void setStatus(const QString &path, FileSyncStatus status);

    ConnectionRegistry &registry_;
    SettingsProvider settingsProvider_;
    QString workspaceDir_;
    SyncSettings settings_;
    SyncTarget target_;
    PathFilter filter_;
    std::shared_ptr<ConnectionManager> connection_;
    QMetaObject::Connection stateConn_;
    ConnectionState state_ = ConnectionState::Disconnected;

    TransferQueue queue_;
    std::deque<TransferJobPtr> offline_;
    WorkerThreads walkers_;
    quint64 nextWalkId_ = 0;

    QHash<QString, QTimer *> debounceTimers_;
    QHash<QString, DebouncedOp> debounceOps_;
    int debounceMs_ = 500;
    int suppressionMs_ = 30000;

    bool syncing_ = false;
    bool pullInProgress_ = false;
    bool waitingDrain_ = false;
    SyncDirection runDirection_ = SyncDirection::Push;
    int runFailed_ = 0;
    bool disposed_ = false;

    mutable std::mutex ledgerMtx_;
    QHash<QString, SyncSignature> baselines_;
    QHash<QString, PendingChangeType> pending_;
    QHash<QString, qint64> ignoreUntil_;
    static constexpr int kIgnorePruneMin = 64;
    int ignorePruneAt_ = kIgnorePruneMin;
    QList<ConflictArtifact> conflicts_;
    QHash<QString, FileSyncStatus> statuses_; // written on the control thread
    QSet<QString> conflictedPaths_;           // control thread
};
