// Sync orchestration. Builds job actions that run on queue workers against a
// leased connection, and keeps every event on the control thread.
#include "SyncEngine.hpp"
#include "sftpsync/SftpClient.hpp"
#include "sftpsync/RuntimeLogging.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <algorithm>
#include <filesystem>
#include <system_error>
Q_LOGGING_CATEGORY(ssEngine, "sftpsync.engine")

namespace {

const char *kUploadingSuffix = ".__uploading__";
const char *kDownloadingSuffix = ".__downloading__";
const char *kConflictLocal = ".conflict.LOCAL.";
const char *kConflictRemote = ".conflict.REMOTE.";

QString parentRemote(const QString &remotePath) {
    const int slash = remotePath.lastIndexOf(QLatin1Char('/'));
    if (slash <= 0)
        return QStringLiteral("/");
    return remotePath.left(slash);
}

QString joinRemote(const QString &dir, const QString &name) {
    if (dir.endsWith(QLatin1Char('/')))
        return dir + name;
    return dir + QLatin1Char('/') + name;
}

SyncSignature localSignature(const QFileInfo &fi) {
    SyncSignature s;
    s.size = static_cast<std::uint64_t>(fi.size());
    s.mtime = static_cast<std::uint64_t>(fi.lastModified().toSecsSinceEpoch());
    return s;
}

SyncSignature remoteSignature(const sftpsync::FileInfo &fi) {
    SyncSignature s;
    s.size = fi.size;
    s.mtime = fi.mtime;
    return s;
}

int statusRank(FileSyncStatus s) {
    switch (s) {
    case FileSyncStatus::Error:
        return 4;
    case FileSyncStatus::Pending:
        return 3;
    case FileSyncStatus::Modified:
        return 2;
    case FileSyncStatus::Synced:
        return 1;
    case FileSyncStatus::None:
        break;
    }
    return 0;
}

// Depth-first listing of regular files under remoteDir, pruning excluded
// entries (relative to remoteRoot) as it goes.
bool walkRemote(sftpsync::SftpClient &c, const QString &remoteRoot, const QString &remoteDir,
                const PathFilter &filter, const CancelToken &cancel, QStringList &out,
                QString &err) {
    std::vector<sftpsync::FileInfo> entries;
    std::string e;
    if (!c.list(remoteDir.toStdString(), entries, e)) {
        err = QStringLiteral("list %1: %2").arg(remoteDir, QString::fromStdString(e));
        return false;
    }
    for (const auto &entry : entries) {
        if (cancel.isCancelled()) {
            err = QStringLiteral("Cancelled");
            return false;
        }
        const QString path = joinRemote(remoteDir, QString::fromStdString(entry.name));
        const QString rel = remoteRoot == QLatin1String("/")
                                ? path.mid(1)
                                : path.mid(remoteRoot.size() + 1);
        if (filter.isExcluded(rel))
            continue;
        if (entry.is_dir) {
            if (!walkRemote(c, remoteRoot, path, filter, cancel, out, err))
                return false;
        } else {
            out << path;
        }
    }
    return true;
}

} // namespace

void registerSyncMetaTypes() {
    qRegisterMetaType<ConnectionState>("ConnectionState");
    qRegisterMetaType<FileSyncStatus>("FileSyncStatus");
    qRegisterMetaType<ConflictArtifact>("ConflictArtifact");
    qRegisterMetaType<SyncDirection>("SyncDirection");
    qRegisterMetaType<TransferJobPtr>("TransferJobPtr");
}

SyncEngine::SyncEngine(ConnectionRegistry &registry, SettingsProvider settings,
                       const QString &workspaceDir, QObject *parent)
    : QObject(parent), registry_(registry), settingsProvider_(std::move(settings)),
      workspaceDir_(QDir(workspaceDir).absolutePath()) {
    queue_.setOnline(false);

    connect(&queue_, &TransferQueue::queueChanged, this,
            [this](int pending, int inflight, int total) {
                emit queueChanged(pending, inflight, total);
                if (total == 0 && connection_)
                    connection_->setSyncing(false);
            });
    connect(&queue_, &TransferQueue::jobStarted, this, [this](TransferJobPtr job) {
        if (connection_)
            connection_->setSyncing(true);
        setStatus(job->localPath, FileSyncStatus::Pending);
    });
    connect(&queue_, &TransferQueue::jobCompleted, this, [this](TransferJobPtr job) {
        if (conflictedPaths_.remove(job->localPath))
            return; // stays Modified until resolved
        if (job->type == TransferJobType::Delete) {
            setStatus(job->localPath, FileSyncStatus::None);
        } else {
            if (job->type == TransferJobType::Rename)
                setStatus(job->fromLocalPath, FileSyncStatus::None);
            setStatus(job->localPath, FileSyncStatus::Synced);
        }
    });
    connect(&queue_, &TransferQueue::jobRetry, this,
            [this](TransferJobPtr job, QString error, int delayMs) {
                qCWarning(ssEngine) << "retry" << job->retries << "/" << job->maxRetries
                                    << job->dedupKey << "in" << delayMs << "ms:" << error;
                setStatus(job->localPath, FileSyncStatus::Pending);
            });
    connect(&queue_, &TransferQueue::jobFailed, this, [this](TransferJobPtr job, QString error) {
        qCWarning(ssEngine) << "job failed" << transferJobTypeName(job->type)
                            << QString::fromStdString(
                                   sftpsync::redactedPath(job->remotePath.toStdString()))
                            << ":" << error;
        setStatus(job->localPath, FileSyncStatus::Error);
        if (syncing_)
            ++runFailed_;
        emit jobFailed(job->localPath, QString::fromLatin1(transferJobTypeName(job->type)),
                       error);
    });
    connect(&queue_, &TransferQueue::jobCancelled, this, [this](TransferJobPtr job) {
        // The change itself is still unsent.
        if (!disposed_ && statuses_.value(job->localPath) == FileSyncStatus::Pending)
            setStatus(job->localPath, FileSyncStatus::Modified);
    });
    connect(&queue_, &TransferQueue::drained, this, [this]() {
        if (waitingDrain_ && offline_.empty())
            finishRun(true);
    });
}

SyncEngine::~SyncEngine() { dispose(); }

bool SyncEngine::bindTarget() {
    if (disposed_)
        return false;
    const std::optional<SyncSettings> cfg = settingsProvider_ ? settingsProvider_() : std::nullopt;
    if (!cfg || !cfg->enabled || cfg->host.isEmpty() || cfg->username.isEmpty())
        return false;
    settings_ = *cfg;
    target_ = targetFor(settings_, workspaceDir_);
    filter_ = PathFilter(settings_.exclusions, settings_.includes, settings_.syncMode);
    queue_.updateConcurrency(settings_.maxConcurrency);

    auto manager = registry_.getOrCreate(target_, settings_);
    if (manager == connection_)
        return true;

    if (connection_) {
        // The target identity changed: the old session is of no further use.
        QObject::disconnect(stateConn_);
        const QString oldKey = connection_->target().key();
        dropQueuedWork();
        connection_.reset();
        registry_.remove(oldKey);
    }
    connection_ = manager;
    qCInfo(ssEngine) << "bound to target" << target_.host << target_.port
                     << "remote root" << target_.remoteRoot << "local root"
                     << target_.localRoot;
    stateConn_ = connect(manager.get(), &ConnectionManager::stateChanged, this,
                         &SyncEngine::onConnectionState);
    onConnectionState(manager->state());
    return true;
}

void SyncEngine::onConnectionState(ConnectionState state) {
    const bool changed = state_ != state;
    state_ = state;
    const bool online =
        state == ConnectionState::Connected || state == ConnectionState::Syncing;
    if (!online)
        queue_.setOnline(false);
    if (changed)
        emit stateChanged(state);
    if (!online)
        return;
    // Dispatch only after every listener has seen this state: starting a job
    // moves the manager on to Syncing.
    QMetaObject::invokeMethod(
        this,
        [this]() {
            if (disposed_ ||
                (state_ != ConnectionState::Connected && state_ != ConnectionState::Syncing))
                return;
            queue_.setOnline(true);
            flushOffline();
        },
        Qt::QueuedConnection);
}

void SyncEngine::dropQueuedWork() {
    // Queued jobs hold the old session pool and remote paths under the old
    // root. Their changes stay in the pending ledger for the next push.
    if (syncing_) {
        emit notice(QStringLiteral("Target changed, sync run aborted"));
        finishRun(false);
    }
    const int parked = static_cast<int>(offline_.size());
    for (const auto &job : offline_)
        setStatus(job->localPath, FileSyncStatus::Modified);
    offline_.clear();
    const int queued = queue_.snapshot().total;
    queue_.cancelAll();
    if (parked + queued > 0) {
        qCInfo(ssEngine) << "target changed, dropped" << parked << "parked and" << queued
                         << "queued jobs";
        emit notice(QStringLiteral("Target changed, %1 queued jobs dropped; run a push to resend")
                        .arg(parked + queued));
    }
}

void SyncEngine::flushOffline() {
    if (offline_.empty())
        return;
    std::deque<TransferJobPtr> parked;
    parked.swap(offline_);
    qCInfo(ssEngine) << "flushing" << parked.size() << "parked jobs";
    for (const auto &job : parked)
        queue_.enqueue(job);
}

void SyncEngine::connectToTarget() {
    if (!bindTarget()) {
        emit notice(QStringLiteral("Sync is disabled or not configured"));
        return;
    }
    connection_->ensureConnected([this](bool ok, const QString &error) {
        if (!ok)
            emit notice(QStringLiteral("Connect failed: %1").arg(error));
    });
}

void SyncEngine::disconnectFromTarget() {
    if (connection_)
        connection_->disconnect();
    queue_.setOnline(false);
}

void SyncEngine::submit(const TransferJobPtr &job) {
    if (connection_ && connection_->isOnline()) {
        queue_.enqueue(job);
        return;
    }
    // Latest wins here too: a parked job for the same resource is replaced.
    offline_.erase(std::remove_if(offline_.begin(), offline_.end(),
                                  [&job](const TransferJobPtr &j) {
                                      return j->dedupKey == job->dedupKey;
                                  }),
                   offline_.end());
    offline_.push_back(job);
    qCInfo(ssEngine) << "offline, parked" << job->dedupKey << "(" << offline_.size()
                     << "parked )";
    if (connection_)
        connection_->ensureConnected({});
}

QString SyncEngine::normalizeLocal(const QString &path) const {
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool SyncEngine::isManagedPath(const QString &path) const {
    const QString root = target_.localRoot;
    if (root.isEmpty())
        return false;
    const QString p = normalizeLocal(path);
    return p == root || p.startsWith(root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/'));
}

QString SyncEngine::relativeOf(const QString &localPath) const {
    return QDir(target_.localRoot).relativeFilePath(localPath);
}

QString SyncEngine::remoteFor(const QString &relativePath) const {
    return joinRemote(target_.remoteRoot, relativePath);
}

bool SyncEngine::isInternalPath(const QString &path) {
    const QString lower = path.toLower();
    return lower.endsWith(QLatin1String(kUploadingSuffix)) ||
           lower.endsWith(QLatin1String(kDownloadingSuffix)) ||
           lower.contains(QString::fromLatin1(kConflictLocal).toLower()) ||
           lower.contains(QString::fromLatin1(kConflictRemote).toLower());
}

bool SyncEngine::isSyncable(const QString &localPath) const {
    if (!isManagedPath(localPath) || isInternalPath(localPath))
        return false;
    const QString rel = relativeOf(localPath);
    if (rel.isEmpty() || rel == QLatin1String(".") || rel.startsWith(QLatin1String("..")))
        return false;
    return !filter_.isExcluded(rel);
}

bool SyncEngine::shouldIgnore(const QString &path) {
    if (!isManagedPath(path))
        return true;
    const QString p = normalizeLocal(path);
    {
        std::lock_guard<std::mutex> lk(ledgerMtx_);
        auto it = ignoreUntil_.find(p);
        if (it != ignoreUntil_.end()) {
            if (it.value() > QDateTime::currentMSecsSinceEpoch())
                return true;
            ignoreUntil_.erase(it);
        }
    }
    if (pullInProgress_)
        return true;
    return isInternalPath(p);
}

void SyncEngine::onLocalChange(const QString &path, LocalChangeKind kind) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(path);
    if (shouldIgnore(p) || !isSyncable(p))
        return;
    if (settings_.autoSync) {
        if (kind == LocalChangeKind::Deleted)
            scheduleDelete(p);
        else if (kind == LocalChangeKind::Created && QFileInfo(p).isDir())
            scheduleCreateDir(p);
        else
            scheduleSyncFile(p, SyncDirection::Push);
        return;
    }
    setPending(p, kind == LocalChangeKind::Deleted ? PendingChangeType::Delete
                                                    : PendingChangeType::Upsert);
    setStatus(p, FileSyncStatus::Modified);
}

void SyncEngine::onLocalRename(const QString &oldPath, const QString &newPath) {
    if (!bindTarget())
        return;
    const QString from = normalizeLocal(oldPath);
    const QString to = normalizeLocal(newPath);
    if (shouldIgnore(to))
        return;
    if (settings_.autoSync) {
        scheduleRename(from, to);
        return;
    }
    if (isSyncable(from)) {
        setPending(from, PendingChangeType::Delete);
        setStatus(from, FileSyncStatus::Modified);
    }
    if (isSyncable(to)) {
        setPending(to, PendingChangeType::Upsert);
        setStatus(to, FileSyncStatus::Modified);
    }
}

void SyncEngine::scheduleSyncFile(const QString &localPath, SyncDirection direction) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(localPath);
    if (shouldIgnore(p) || !isSyncable(p))
        return;
    if (direction == SyncDirection::Push) {
        setPending(p, PendingChangeType::Upsert);
        setStatus(p, FileSyncStatus::Modified);
    }
    debounce(p, direction == SyncDirection::Push ? DebouncedOp::Push : DebouncedOp::Pull);
}

void SyncEngine::scheduleDelete(const QString &localPath) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(localPath);
    if (shouldIgnore(p) || !isSyncable(p))
        return;
    setPending(p, PendingChangeType::Delete);
    setStatus(p, FileSyncStatus::Modified);
    debounce(p, DebouncedOp::Delete);
}

void SyncEngine::scheduleCreateDir(const QString &localPath) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(localPath);
    if (shouldIgnore(p) || !isSyncable(p))
        return;
    submit(makeCreateDirJob(p, remoteFor(relativeOf(p))));
}

void SyncEngine::scheduleRename(const QString &oldPath, const QString &newPath) {
    if (!bindTarget())
        return;
    const QString from = normalizeLocal(oldPath);
    const QString to = normalizeLocal(newPath);
    if (shouldIgnore(to))
        return;
    const bool fromOk = isSyncable(from);
    const bool toOk = isSyncable(to);
    if (!toOk) {
        // Moved out of the synced set: same as deleting the old path.
        if (fromOk)
            scheduleDelete(from);
        return;
    }
    if (!fromOk) {
        scheduleSyncFile(to, SyncDirection::Push);
        return;
    }
    // A notification still waiting for the old path is obsolete.
    if (QTimer *t = debounceTimers_.take(from)) {
        t->stop();
        t->deleteLater();
        debounceOps_.remove(from);
    }
    setStatus(to, FileSyncStatus::Modified);
    submit(makeRenameJob(from, remoteFor(relativeOf(from)), to, remoteFor(relativeOf(to))));
}

void SyncEngine::debounce(const QString &path, DebouncedOp op) {
    debounceOps_.insert(path, op);
    QTimer *timer = debounceTimers_.value(path);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        connect(timer, &QTimer::timeout, this, [this, path]() {
            if (QTimer *t = debounceTimers_.take(path))
                t->deleteLater();
            const DebouncedOp what = debounceOps_.take(path);
            switch (what) {
            case DebouncedOp::Push:
                syncFile(path, SyncDirection::Push);
                break;
            case DebouncedOp::Pull:
                syncFile(path, SyncDirection::Pull);
                break;
            case DebouncedOp::Delete:
                syncDelete(path);
                break;
            }
        });
        debounceTimers_.insert(path, timer);
    }
    timer->start(debounceMs_);
}

void SyncEngine::syncFile(const QString &localPath, SyncDirection direction) {
    if (!bindTarget() || !isSyncable(localPath))
        return;
    const QString remote = remoteFor(relativeOf(localPath));
    if (direction == SyncDirection::Pull) {
        submit(makeDownloadJob(localPath, remote));
        return;
    }
    const QFileInfo fi(localPath);
    if (fi.isDir()) {
        submit(makeCreateDirJob(localPath, remote));
        clearPendingIf(localPath, PendingChangeType::Upsert);
        return;
    }
    submit(makeUploadJob(localPath, remote));
}

void SyncEngine::syncDelete(const QString &localPath) {
    if (!bindTarget() || !isSyncable(localPath))
        return;
    submit(makeDeleteJob(localPath, remoteFor(relativeOf(localPath))));
}

bool SyncEngine::syncAll() {
    if (syncing_) {
        emit notice(QStringLiteral("A sync run is already in progress"));
        return false;
    }
    if (!bindTarget()) {
        emit notice(QStringLiteral("Sync is disabled or not configured"));
        return false;
    }
    syncing_ = true;
    runDirection_ = SyncDirection::Push;
    runFailed_ = 0;
    connection_->ensureConnected([this](bool ok, const QString &error) {
        if (!syncing_ || runDirection_ != SyncDirection::Push)
            return;
        if (!ok) {
            emit notice(QStringLiteral("Push aborted: %1").arg(error));
            finishRun(false);
            return;
        }
        const QHash<QString, PendingChangeType> changes = pendingChanges();
        if (changes.isEmpty()) {
            emit notice(QStringLiteral("Nothing to push"));
            finishRun(true);
            return;
        }
        int queued = 0;
        for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
            const QString &path = it.key();
            if (!isSyncable(path))
                continue;
            const QString remote = remoteFor(relativeOf(path));
            if (it.value() == PendingChangeType::Delete) {
                submit(makeDeleteJob(path, remote));
            } else if (QFileInfo(path).isDir()) {
                submit(makeCreateDirJob(path, remote));
                clearPendingIf(path, PendingChangeType::Upsert);
            } else {
                submit(makeUploadJob(path, remote));
            }
            ++queued;
        }
        qCInfo(ssEngine) << "push queued" << queued << "of" << changes.size()
                         << "pending changes";
        if (queue_.isIdle() && offline_.empty())
            finishRun(true);
        else
            waitingDrain_ = true;
    });
    return true;
}

bool SyncEngine::syncPull() {
    if (syncing_) {
        emit notice(QStringLiteral("A sync run is already in progress"));
        return false;
    }
    if (!bindTarget()) {
        emit notice(QStringLiteral("Sync is disabled or not configured"));
        return false;
    }
    syncing_ = true;
    pullInProgress_ = true;
    runDirection_ = SyncDirection::Pull;
    runFailed_ = 0;
    connection_->ensureConnected([this](bool ok, const QString &error) {
        if (!syncing_ || runDirection_ != SyncDirection::Pull)
            return;
        if (!ok) {
            emit notice(QStringLiteral("Pull aborted: %1").arg(error));
            finishRun(false);
            return;
        }
        auto pool = connection_->pool();
        const int timeoutMs = settings_.operationTimeoutMs;
        const QString remoteRoot = target_.remoteRoot;
        const PathFilter filter = filter_;
        const quint64 walkId = ++nextWalkId_;
        walkers_.launch(walkId, [this, walkId, pool, timeoutMs, remoteRoot, filter]() {
            QStringList files;
            QString err;
            {
                std::string e;
                SessionLease lease = pool->acquire(e, timeoutMs);
                if (!lease)
                    err = QString::fromStdString(e);
                else
                    walkRemote(*lease, remoteRoot, remoteRoot, filter, CancelToken(), files, err);
            }
            QMetaObject::invokeMethod(
                this, [this, walkId, files, err]() {
                    walkers_.join(walkId);
                    onPullListed(files, err);
                },
                Qt::QueuedConnection);
        });
    });
    return true;
}

void SyncEngine::onPullListed(const QStringList &remoteFiles, const QString &error) {
    if (!syncing_ || runDirection_ != SyncDirection::Pull)
        return;
    if (!error.isEmpty()) {
        qCWarning(ssEngine) << "remote listing failed:" << error;
        emit notice(QStringLiteral("Pull aborted: %1").arg(error));
        finishRun(false);
        return;
    }
    const QString root = target_.remoteRoot;
    for (const QString &remote : remoteFiles) {
        const QString rel = root == QLatin1String("/") ? remote.mid(1) : remote.mid(root.size() + 1);
        submit(makeDownloadJob(QDir(target_.localRoot).filePath(rel), remote));
    }
    qCInfo(ssEngine) << "pull queued" << remoteFiles.size() << "files";
    if (queue_.isIdle() && offline_.empty())
        finishRun(true);
    else
        waitingDrain_ = true;
}

void SyncEngine::finishRun(bool ok) {
    const SyncDirection dir = runDirection_;
    const int failed = runFailed_;
    syncing_ = false;
    pullInProgress_ = false;
    waitingDrain_ = false;
    runFailed_ = 0;
    qCInfo(ssEngine) << (dir == SyncDirection::Push ? "push" : "pull") << "finished"
                     << "ok=" << (ok && failed == 0) << "failed=" << failed;
    emit syncFinished(dir, ok && failed == 0, failed);
}

void SyncEngine::forcePush(const QString &path) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(path);
    if (!isManagedPath(p)) {
        emit notice(QStringLiteral("Path is outside the sync root, ignored: %1").arg(p));
        return;
    }
    const QFileInfo fi(p);
    if (!fi.isDir()) {
        syncFile(p, SyncDirection::Push);
        return;
    }
    QStringList files;
    collectLocalFiles(p, files);
    qCInfo(ssEngine) << "force push" << p << ":" << files.size() << "files";
    for (const QString &f : files)
        syncFile(f, SyncDirection::Push);
}

void SyncEngine::forcePull(const QString &path) {
    if (!bindTarget())
        return;
    const QString p = normalizeLocal(path);
    if (!isManagedPath(p)) {
        emit notice(QStringLiteral("Path is outside the sync root, ignored: %1").arg(p));
        return;
    }
    syncFile(p, SyncDirection::Pull);
    qCInfo(ssEngine) << "queued pull for" << remoteFor(relativeOf(p));
}

void SyncEngine::collectLocalFiles(const QString &dir, QStringList &out) const {
    const QFileInfoList entries =
        QDir(dir).entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot,
                                QDir::Name);
    for (const QFileInfo &fi : entries) {
        const QString full = QDir::cleanPath(fi.absoluteFilePath());
        const QString rel = relativeOf(full);
        if (fi.isDir() && !fi.isSymLink()) {
            if (!filter_.isExcluded(rel))
                collectLocalFiles(full, out);
        } else if (fi.isFile() && !isInternalPath(full) && filter_.isIncludedForPush(rel)) {
            out << full;
        }
    }
}

TransferJobPtr SyncEngine::makeUploadJob(const QString &localPath, const QString &remotePath) {
    auto job = std::make_shared<TransferJob>();
    job->type = TransferJobType::Upload;
    job->dedupKey = makeDedupKey(job->type, remotePath);
    job->localPath = localPath;
    job->remotePath = remotePath;
    job->tempRemotePath = remotePath + QLatin1String(kUploadingSuffix);
    job->priority = TransferPriority::High;
    job->maxRetries = settings_.maxRetries;
    auto pool = connection_->pool();
    const int timeoutMs = settings_.operationTimeoutMs;
    const QString temp = job->tempRemotePath;
    job->action = [this, pool, timeoutMs, localPath, remotePath,
                   temp](const CancelToken &cancel, QString &err) {
        std::string e;
        SessionLease lease = pool->acquire(e, timeoutMs);
        if (!lease) {
            err = QString::fromStdString(e);
            return false;
        }
        return uploadFile(*lease, localPath, remotePath, temp, cancel, err);
    };
    return job;
}

TransferJobPtr SyncEngine::makeDownloadJob(const QString &localPath, const QString &remotePath) {
    auto job = std::make_shared<TransferJob>();
    job->type = TransferJobType::Download;
    job->dedupKey = makeDedupKey(job->type, remotePath);
    job->localPath = localPath;
    job->remotePath = remotePath;
    job->tempLocalPath = localPath + QLatin1String(kDownloadingSuffix);
    job->priority = TransferPriority::Normal;
    job->maxRetries = settings_.maxRetries;
    auto pool = connection_->pool();
    const int timeoutMs = settings_.operationTimeoutMs;
    const QString temp = job->tempLocalPath;
    job->action = [this, pool, timeoutMs, localPath, remotePath,
                   temp](const CancelToken &cancel, QString &err) {
        std::string e;
        SessionLease lease = pool->acquire(e, timeoutMs);
        if (!lease) {
            err = QString::fromStdString(e);
            return false;
        }
        return downloadFile(*lease, localPath, remotePath, temp, cancel, err);
    };
    return job;
}

TransferJobPtr SyncEngine::makeDeleteJob(const QString &localPath, const QString &remotePath) {
    auto job = std::make_shared<TransferJob>();
    job->type = TransferJobType::Delete;
    job->dedupKey = makeDedupKey(job->type, remotePath);
    job->localPath = localPath;
    job->remotePath = remotePath;
    job->priority = TransferPriority::High;
    job->maxRetries = settings_.maxRetries;
    auto pool = connection_->pool();
    const int timeoutMs = settings_.operationTimeoutMs;
    job->action = [this, pool, timeoutMs, localPath, remotePath](const CancelToken &cancel,
                                                                 QString &err) {
        std::string e;
        SessionLease lease = pool->acquire(e, timeoutMs);
        if (!lease) {
            err = QString::fromStdString(e);
            return false;
        }
        if (cancel.isCancelled()) {
            err = QStringLiteral("Cancelled");
            return false;
        }
        return deleteRemote(*lease, localPath, remotePath, err);
    };
    return job;
}

TransferJobPtr SyncEngine::makeCreateDirJob(const QString &localPath, const QString &remotePath) {
    auto job = std::make_shared<TransferJob>();
    job->type = TransferJobType::CreateDir;
    job->dedupKey = makeDedupKey(job->type, remotePath);
    job->localPath = localPath;
    job->remotePath = remotePath;
    job->priority = TransferPriority::Normal;
    job->maxRetries = settings_.maxRetries;
    auto pool = connection_->pool();
    const int timeoutMs = settings_.operationTimeoutMs;
    job->action = [this, pool, timeoutMs, remotePath](const CancelToken &cancel, QString &err) {
        std::string e;
        SessionLease lease = pool->acquire(e, timeoutMs);
        if (!lease) {
            err = QString::fromStdString(e);
            return false;
        }
        if (cancel.isCancelled()) {
            err = QStringLiteral("Cancelled");
            return false;
        }
        return ensureRemoteDirs(*lease, remotePath, err);
    };
    return job;
}

TransferJobPtr SyncEngine::makeRenameJob(const QString &fromLocal, const QString &fromRemote,
                                         const QString &toLocal, const QString &toRemote) {
    auto job = std::make_shared<TransferJob>();
    job->type = TransferJobType::Rename;
    job->dedupKey = makeDedupKey(job->type, toRemote);
    job->localPath = toLocal;
    job->remotePath = toRemote;
    job->fromLocalPath = fromLocal;
    job->fromRemotePath = fromRemote;
    job->tempRemotePath = toRemote + QLatin1String(kUploadingSuffix);
    job->priority = TransferPriority::High;
    job->maxRetries = settings_.maxRetries;
    auto pool = connection_->pool();
    const int timeoutMs = settings_.operationTimeoutMs;
    job->action = [this, pool, timeoutMs, fromLocal, fromRemote, toLocal,
                   toRemote](const CancelToken &cancel, QString &err) {
        std::string e;
        SessionLease lease = pool->acquire(e, timeoutMs);
        if (!lease) {
            err = QString::fromStdString(e);
            return false;
        }
        return renameRemote(*lease, fromLocal, fromRemote, toLocal, toRemote, cancel, err);
    };
    return job;
}

bool SyncEngine::ensureRemoteDirs(sftpsync::SftpClient &c, const QString &remoteDir,
                                  QString &err) {
    sftpsync::FileInfo info;
    std::string e;
    if (c.stat(remoteDir.toStdString(), info, e) && info.is_dir)
        return true;

    const QStringList parts = remoteDir.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    QString current = remoteDir.startsWith(QLatin1Char('/')) ? QString() : QStringLiteral(".");
    for (const QString &part : parts) {
        current += QLatin1Char('/') + part;
        const std::string cur = current.toStdString();
        e.clear();
        if (c.mkdir(cur, e))
            continue;
        // Already there (or created concurrently by another job) is fine.
        std::string statErr;
        if (c.stat(cur, info, statErr) && info.is_dir)
            continue;
        err = QStringLiteral("mkdir %1: %2").arg(current, QString::fromStdString(e));
        return false;
    }
    return true;
}

bool SyncEngine::uploadFile(sftpsync::SftpClient &c, const QString &localPath,
                            const QString &remotePath, const QString &tempRemote,
                            const CancelToken &cancel, QString &err) {
    if (cancel.isCancelled()) {
        err = QStringLiteral("Cancelled");
        return false;
    }
    if (!ensureRemoteDirs(c, parentRemote(remotePath), err))
        return false;

    const QFileInfo lfi(localPath);
    if (!lfi.exists() || !lfi.isFile()) {
        err = QStringLiteral("Local file missing: %1").arg(localPath);
        return false;
    }
    const SyncSignature local = localSignature(lfi);

    sftpsync::FileInfo rinfo;
    std::string e;
    const bool remoteExists = c.stat(remotePath.toStdString(), rinfo, e);
    if (!remoteExists && !e.empty()) {
        err = QStringLiteral("stat %1: %2").arg(remotePath, QString::fromStdString(e));
        return false;
    }
    if (remoteExists && sameSignature(local, remoteSignature(rinfo))) {
        recordBaseline(localPath, local);
        clearPendingIf(localPath, PendingChangeType::Upsert);
        return true;
    }

    const std::optional<SyncSignature> known = baseline(localPath);
    if (known && remoteExists && !sameSignature(*known, local) &&
        !sameSignature(*known, remoteSignature(rinfo))) {
        createConflictArtifacts(c, localPath, remotePath);
        return true;
    }

    e.clear();
    if (!c.put(localPath.toStdString(), tempRemote.toStdString(), e, {}, cancel.callback())) {
        err = QStringLiteral("upload %1: %2").arg(lfi.fileName(), QString::fromStdString(e));
        std::string cleanupErr;
        if (!cancel.isCancelled() && c.isConnected() &&
            !c.removeFile(tempRemote.toStdString(), cleanupErr)) {
            qCDebug(ssEngine) << "temp cleanup failed" << tempRemote
                              << QString::fromStdString(cleanupErr);
        }
        return false;
    }
    e.clear();
    if (!c.rename(tempRemote.toStdString(), remotePath.toStdString(), e, true)) {
        // SFTP v3 servers refuse to overwrite; replace in two steps.
        std::string removeErr;
        std::string retryErr;
        if (!c.removeFile(remotePath.toStdString(), removeErr) ||
            !c.rename(tempRemote.toStdString(), remotePath.toStdString(), retryErr, false)) {
            err = QStringLiteral("rename %1: %2")
                      .arg(remotePath, QString::fromStdString(retryErr.empty() ? e : retryErr));
            return false;
        }
    }
    e.clear();
    if (!c.setTimes(remotePath.toStdString(), local.mtime, local.mtime, e)) {
        qCDebug(ssEngine) << "could not stamp remote mtime" << remotePath
                          << QString::fromStdString(e);
    }
    recordBaseline(localPath, local);
    clearPendingIf(localPath, PendingChangeType::Upsert);
    return true;
}

bool SyncEngine::downloadFile(sftpsync::SftpClient &c, const QString &localPath,
                              const QString &remotePath, const QString &tempLocal,
                              const CancelToken &cancel, QString &err) {
    if (cancel.isCancelled()) {
        err = QStringLiteral("Cancelled");
        return false;
    }
    sftpsync::FileInfo rinfo;
    std::string e;
    if (!c.stat(remotePath.toStdString(), rinfo, e)) {
        err = e.empty() ? QStringLiteral("Remote file not found: %1").arg(remotePath)
                        : QStringLiteral("stat %1: %2").arg(remotePath, QString::fromStdString(e));
        return false;
    }
    const SyncSignature remote = remoteSignature(rinfo);

    const QFileInfo lfi(localPath);
    if (lfi.exists() && lfi.isFile() && sameSignature(localSignature(lfi), remote)) {
        recordBaseline(localPath, localSignature(lfi));
        return true;
    }

    if (!QDir().mkpath(lfi.absolutePath())) {
        err = QStringLiteral("Could not create local directory %1").arg(lfi.absolutePath());
        return false;
    }
    markIgnored(tempLocal);
    markIgnored(localPath);

    e.clear();
    if (!c.get(remotePath.toStdString(), tempLocal.toStdString(), e, {}, cancel.callback())) {
        err = QStringLiteral("download %1: %2").arg(remotePath, QString::fromStdString(e));
        QFile::remove(tempLocal);
        return false;
    }
    {
        QFile f(tempLocal);
        if (!f.open(QIODevice::ReadWrite) ||
            !f.setFileTime(QDateTime::fromSecsSinceEpoch(static_cast<qint64>(remote.mtime)),
                           QFileDevice::FileModificationTime)) {
            qCDebug(ssEngine) << "could not stamp local mtime" << tempLocal << f.errorString();
        }
    }
    std::error_code ec;
    std::filesystem::rename(std::filesystem::path(tempLocal.toStdString()),
                            std::filesystem::path(localPath.toStdString()), ec);
    if (ec) {
        err = QStringLiteral("rename %1: %2").arg(localPath, QString::fromStdString(ec.message()));
        QFile::remove(tempLocal);
        return false;
    }
    recordBaseline(localPath, remote);
    return true;
}

bool SyncEngine::deleteRemote(sftpsync::SftpClient &c, const QString &localPath,
                              const QString &remotePath, QString &err) {
    std::string e;
    if (!c.removeFile(remotePath.toStdString(), e)) {
        sftpsync::FileInfo info;
        std::string statErr;
        const bool exists = c.stat(remotePath.toStdString(), info, statErr);
        if (exists || !statErr.empty()) {
            err = QStringLiteral("delete %1: %2").arg(remotePath, QString::fromStdString(e));
            return false;
        }
        // Already gone.
    }
    clearPendingIf(localPath, PendingChangeType::Delete);
    dropBaseline(localPath);
    return true;
}

bool SyncEngine::renameRemote(sftpsync::SftpClient &c, const QString &fromLocal,
                              const QString &fromRemote, const QString &toLocal,
                              const QString &toRemote, const CancelToken &cancel, QString &err) {
    if (cancel.isCancelled()) {
        err = QStringLiteral("Cancelled");
        return false;
    }
    sftpsync::FileInfo info;
    std::string e;
    if (!c.stat(fromRemote.toStdString(), info, e)) {
        if (!e.empty()) {
            err = QStringLiteral("stat %1: %2").arg(fromRemote, QString::fromStdString(e));
            return false;
        }
        // Nothing to move remotely; treat the new path as a plain upload.
        {
            std::lock_guard<std::mutex> lk(ledgerMtx_);
            pending_.remove(fromLocal);
        }
        dropBaseline(fromLocal);
        if (QFileInfo(toLocal).isDir())
            return ensureRemoteDirs(c, toRemote, err);
        return uploadFile(c, toLocal, toRemote, toRemote + QLatin1String(kUploadingSuffix),
                          cancel, err);
    }
    if (!ensureRemoteDirs(c, parentRemote(toRemote), err))
        return false;
    e.clear();
    if (!c.rename(fromRemote.toStdString(), toRemote.toStdString(), e, true)) {
        std::string removeErr;
        std::string retryErr;
        if (info.is_dir || !c.removeFile(toRemote.toStdString(), removeErr) ||
            !c.rename(fromRemote.toStdString(), toRemote.toStdString(), retryErr, false)) {
            err = QStringLiteral("rename %1 -> %2: %3")
                      .arg(fromRemote, toRemote,
                           QString::fromStdString(retryErr.empty() ? e : retryErr));
            return false;
        }
    }

    // Move the ledgers along, including everything below a renamed directory.
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    const QString prefix = fromLocal + QLatin1Char('/');
    QHash<QString, SyncSignature> moved;
    for (auto it = baselines_.begin(); it != baselines_.end();) {
        if (it.key() == fromLocal) {
            moved.insert(toLocal, it.value());
            it = baselines_.erase(it);
        } else if (it.key().startsWith(prefix)) {
            moved.insert(toLocal + it.key().mid(fromLocal.size()), it.value());
            it = baselines_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = moved.constBegin(); it != moved.constEnd(); ++it)
        baselines_.insert(it.key(), it.value());
    pending_.remove(fromLocal);
    pending_.remove(toLocal);
    return true;
}

void SyncEngine::createConflictArtifacts(sftpsync::SftpClient &c, const QString &localPath,
                                         const QString &remotePath) {
    const QString ts = QString::number(QDateTime::currentMSecsSinceEpoch());
    ConflictArtifact a;
    a.sourcePath = localPath;
    a.localArtifactPath = localPath + QLatin1String(kConflictLocal) + ts;
    a.remoteArtifactPath = localPath + QLatin1String(kConflictRemote) + ts;
    a.detectedAt = QDateTime::currentDateTime();
    markIgnored(a.localArtifactPath);
    markIgnored(a.remoteArtifactPath);

    if (!QFile::copy(localPath, a.localArtifactPath))
        qCWarning(ssEngine) << "could not copy local conflict artifact" << a.localArtifactPath;
    std::string e;
    if (!c.get(remotePath.toStdString(), a.remoteArtifactPath.toStdString(), e))
        qCWarning(ssEngine) << "could not fetch remote conflict artifact" << remotePath
                            << QString::fromStdString(e);
    {
        std::lock_guard<std::mutex> lk(ledgerMtx_);
        conflicts_.append(a);
    }
    qCWarning(ssEngine) << "conflict detected for" << localPath;
    QMetaObject::invokeMethod(
        this, [this, a]() {
            conflictedPaths_.insert(a.sourcePath);
            setStatus(a.sourcePath, FileSyncStatus::Modified);
            emit conflictDetected(a);
            emit notice(QStringLiteral("Conflict detected for %1")
                            .arg(QFileInfo(a.sourcePath).fileName()));
        },
        Qt::QueuedConnection);
}

void SyncEngine::markIgnored(const QString &path) {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    ignoreUntil_.insert(QDir::cleanPath(path), now + suppressionMs_);
    if (ignoreUntil_.size() < ignorePruneAt_)
        return;
    for (auto it = ignoreUntil_.begin(); it != ignoreUntil_.end();) {
        if (it.value() <= now)
            it = ignoreUntil_.erase(it);
        else
            ++it;
    }
    ignorePruneAt_ = std::max(kIgnorePruneMin, 2 * static_cast<int>(ignoreUntil_.size()));
}

int SyncEngine::suppressedPathCount() const {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    return static_cast<int>(ignoreUntil_.size());
}

void SyncEngine::recordBaseline(const QString &path, const SyncSignature &sig) {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    baselines_.insert(path, sig);
}

void SyncEngine::dropBaseline(const QString &path) {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    baselines_.remove(path);
}

void SyncEngine::clearPendingIf(const QString &path, PendingChangeType type) {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    auto it = pending_.find(path);
    if (it != pending_.end() && it.value() == type)
        pending_.erase(it);
}

void SyncEngine::setPending(const QString &path, PendingChangeType type) {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    pending_.insert(path, type);
}

void SyncEngine::setBaseline(const QString &path, const SyncSignature &sig) {
    recordBaseline(normalizeLocal(path), sig);
}

std::optional<SyncSignature> SyncEngine::baseline(const QString &path) const {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    auto it = baselines_.constFind(path);
    if (it == baselines_.constEnd())
        return std::nullopt;
    return it.value();
}

QHash<QString, PendingChangeType> SyncEngine::pendingChanges() const {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    return pending_;
}

QList<ConflictArtifact> SyncEngine::conflicts() const {
    std::lock_guard<std::mutex> lk(ledgerMtx_);
    return conflicts_;
}

void SyncEngine::resolveConflict(const QString &sourcePath) {
    const QString p = normalizeLocal(sourcePath);
    {
        std::lock_guard<std::mutex> lk(ledgerMtx_);
        conflicts_.erase(std::remove_if(conflicts_.begin(), conflicts_.end(),
                                        [&p](const ConflictArtifact &a) {
                                            return a.sourcePath == p;
                                        }),
                         conflicts_.end());
        // The user's resolution becomes the new local truth on the next push.
        baselines_.remove(p);
    }
    conflictedPaths_.remove(p);
}

void SyncEngine::setStatus(const QString &path, FileSyncStatus status) {
    if (path.isEmpty())
        return;
    const FileSyncStatus prev = statuses_.value(path, FileSyncStatus::None);
    if (status == FileSyncStatus::None)
        statuses_.remove(path);
    else
        statuses_.insert(path, status);
    if (prev != status)
        emit fileStatusChanged(path, status);
}

FileSyncStatus SyncEngine::fileStatus(const QString &path) const {
    return statuses_.value(normalizeLocal(path), FileSyncStatus::None);
}

FileSyncStatus SyncEngine::directoryStatus(const QString &dir) const {
    const QString d = normalizeLocal(dir);
    const QString prefix = d.endsWith(QLatin1Char('/')) ? d : d + QLatin1Char('/');
    FileSyncStatus best = statuses_.value(d, FileSyncStatus::None);
    for (auto it = statuses_.constBegin(); it != statuses_.constEnd(); ++it) {
        if (it.key().startsWith(prefix) && statusRank(it.value()) > statusRank(best))
            best = it.value();
    }
    return best;
}

void SyncEngine::dispose() {
    if (disposed_)
        return;
    disposed_ = true;
    for (QTimer *t : debounceTimers_) {
        t->stop();
        t->deleteLater();
    }
    debounceTimers_.clear();
    debounceOps_.clear();
    offline_.clear();
    if (connection_) {
        QObject::disconnect(stateConn_);
        const QString key = connection_->target().key();
        connection_.reset();
        // Interrupts leased connections so running jobs return promptly.
        registry_.remove(key);
    }
    queue_.shutdown();
    walkers_.joinAll();
    syncing_ = false;
    pullInProgress_ = false;
    waitingDrain_ = false;
}
