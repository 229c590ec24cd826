// Connection lifecycle: one connect attempt at a time, exponential reconnect
// backoff, keepalive probing and unexpected-close detection through the pool.
#include "ConnectionManager.hpp"
#include "sftpsync/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <algorithm>
#include <atomic>
#include <chrono>
Q_LOGGING_CATEGORY(ssConn, "sftpsync.connection")

namespace {

const quint64 kKeepaliveWorker = quint64(1) << 62;
const quint64 kExecWorkerBase = quint64(1) << 61;
const char *kKeepaliveCommand = "echo sftpsync-keepalive";

QString describe(const SyncTarget &t) {
    return QString::fromStdString(sftpsync::redactedTarget(
        t.username.toStdString(), t.host.toStdString(), t.port));
}

} // namespace

ConnectionManager::ConnectionManager(const SyncTarget &target, const SyncSettings &settings,
                                     sftpsync::ClientFactory factory, QObject *parent)
    : QObject(parent), target_(target), settings_(settings), factory_(std::move(factory)),
      pool_(std::make_shared<SessionPool>(factory_, settings.maxConcurrency + 1)),
      lostRelay_(std::make_shared<LostRelay>()) {
    lostRelay_->manager = this;
    std::weak_ptr<LostRelay> relay = lostRelay_;
    pool_->setConnectionLostHandler([relay]() {
        auto r = relay.lock();
        if (!r)
            return;
        std::lock_guard<std::mutex> lk(r->mtx);
        if (!r->manager)
            return;
        ConnectionManager *m = r->manager;
        QMetaObject::invokeMethod(
            m, [m]() { m->onConnectionLost(QStringLiteral("transport closed")); },
            Qt::QueuedConnection);
    });

    connectTimeoutTimer_.setSingleShot(true);
    connect(&connectTimeoutTimer_, &QTimer::timeout, this,
            [this]() { onConnectTimeout(attemptId_); });
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &ConnectionManager::onReconnectTimer);
    keepaliveTimer_.setInterval(30000);
    connect(&keepaliveTimer_, &QTimer::timeout, this, &ConnectionManager::runKeepalive);
}

ConnectionManager::~ConnectionManager() { dispose(); }

void ConnectionManager::updateSettings(const SyncSettings &settings) {
    settings_ = settings;
    target_.password = settings.password;
    target_.privateKeyPath = settings.privateKeyPath;
    pool_->setCapacity(settings_.maxConcurrency + 1);
}

void ConnectionManager::setState(ConnectionState s) {
    if (state_ == s)
        return;
    qCInfo(ssConn) << describe(target_) << connectionStateName(state_) << "->"
                   << connectionStateName(s);
    state_ = s;
    emit stateChanged(s);
}

void ConnectionManager::ensureConnected(ReadyCallback callback) {
    if (disposed_) {
        if (callback)
            callback(false, QStringLiteral("Connection manager disposed"));
        return;
    }
    manualDisconnect_ = false;
    if (isOnline() && pool_->installed()) {
        if (callback)
            callback(true, QString());
        return;
    }
    if (callback)
        waiters_.push_back(std::move(callback));
    if (!connecting_)
        startAttempt();
}

void ConnectionManager::startAttempt() {
    reconnectTimer_.stop();
    connecting_ = true;
    const quint64 id = ++attemptId_;
    setState(ConnectionState::Connecting);

    const sftpsync::SessionOptions opt = sessionOptionsFor(target_, settings_);
    std::shared_ptr<sftpsync::SftpClient> client(factory_ ? factory_() : nullptr);
    if (!client) {
        connecting_ = false;
        failAttempt(QStringLiteral("No transport available"));
        return;
    }
    {
        std::lock_guard<std::mutex> lk(attemptMtx_);
        attemptClient_ = client;
    }
    qCInfo(ssConn) << "connecting" << describe(target_) << "attempt" << id;
    // Slightly above the transport budget so the transport reports first.
    connectTimeoutTimer_.start(settings_.connectTimeoutMs + 500);

    workers_.launch(id, [this, id, client, opt]() {
        std::string err;
        const bool ok = client->connect(opt, err);
        const QString qerr = QString::fromStdString(err);
        QMetaObject::invokeMethod(
            this, [this, id, ok, qerr, client, opt]() {
                onAttemptFinished(id, ok, qerr, client, opt);
            },
            Qt::QueuedConnection);
    });
}

void ConnectionManager::onAttemptFinished(quint64 attemptId, bool ok, const QString &err,
                                          std::shared_ptr<sftpsync::SftpClient> client,
                                          const sftpsync::SessionOptions &opt) {
    workers_.join(attemptId);
    if (attemptId != attemptId_ || !connecting_ || disposed_) {
        // Timed out, aborted or superseded meanwhile.
        if (ok)
            client->disconnect();
        return;
    }
    connectTimeoutTimer_.stop();
    connecting_ = false;
    {
        std::lock_guard<std::mutex> lk(attemptMtx_);
        attemptClient_.reset();
    }
    if (!ok) {
        failAttempt(err.isEmpty() ? QStringLiteral("Connection failed") : err);
        return;
    }
    pool_->setCapacity(settings_.maxConcurrency + 1);
    pool_->install(client, opt);
    retryCount_ = 0;
    lastError_.clear();
    setState(ConnectionState::Connected);
    keepaliveTimer_.start();
    resolveWaiters(true, QString());
}

void ConnectionManager::onConnectTimeout(quint64 attemptId) {
    if (!connecting_ || attemptId != attemptId_)
        return;
    abortAttempt();
    failAttempt(QStringLiteral("Connect timed out after %1 ms").arg(settings_.connectTimeoutMs));
}

void ConnectionManager::abortAttempt() {
    if (!connecting_)
        return;
    ++attemptId_; // the worker's result is ignored from now on
    connecting_ = false;
    connectTimeoutTimer_.stop();
    std::lock_guard<std::mutex> lk(attemptMtx_);
    if (attemptClient_) {
        attemptClient_->interrupt();
        attemptClient_.reset();
    }
}

void ConnectionManager::failAttempt(const QString &err) {
    lastError_ = err;
    qCWarning(ssConn) << "connect failed" << describe(target_) << ":" << err;
    setState(ConnectionState::Error);
    resolveWaiters(false, err);
    emit connectionFailed(err);
    scheduleReconnect();
}

void ConnectionManager::resolveWaiters(bool ok, const QString &err) {
    std::vector<ReadyCallback> waiters;
    waiters.swap(waiters_);
    for (auto &cb : waiters)
        cb(ok, err);
}

void ConnectionManager::scheduleReconnect() {
    if (manualDisconnect_ || disposed_ || reconnectTimer_.isActive())
        return;
    ++retryCount_;
    const int delay = reconnectDelayMs(retryCount_);
    qCWarning(ssConn) << "scheduling reconnect in" << delay << "ms" << "(failure"
                      << retryCount_ << ")";
    reconnectTimer_.start(delay);
}

void ConnectionManager::onReconnectTimer() {
    if (disposed_ || manualDisconnect_ || connecting_ || isOnline())
        return;
    startAttempt();
}

void ConnectionManager::setReconnectBackoff(int baseMs, int capMs) {
    reconnectBaseMs_ = std::max(1, baseMs);
    reconnectCapMs_ = std::max(reconnectBaseMs_, capMs);
}

int ConnectionManager::reconnectDelayMs(int failures) const {
    if (failures < 1)
        failures = 1;
    qint64 delay = reconnectBaseMs_;
    for (int i = 1; i < failures && delay < reconnectCapMs_; ++i)
        delay *= 2;
    return static_cast<int>(std::min<qint64>(delay, reconnectCapMs_));
}

void ConnectionManager::setKeepaliveInterval(int ms) {
    keepaliveTimer_.setInterval(std::max(1, ms));
}

void ConnectionManager::runKeepalive() {
    if (keepaliveRunning_ || !isOnline())
        return;
    keepaliveRunning_ = true;
    auto pool = pool_;
    const int timeoutMs = settings_.operationTimeoutMs;
    workers_.launch(kKeepaliveWorker, [this, pool, timeoutMs]() {
        QString failure;
        bool lost = false;
        {
            SessionLease lease = pool->tryAcquireIdle();
            if (!lease) {
                // Every connection busy means the link is alive.
                lost = !pool->hasLiveConnection() && pool->installed();
            } else {
                const auto deadline = std::chrono::steady_clock::now() +
                                      std::chrono::milliseconds(timeoutMs);
                int code = -1;
                std::string err;
                const bool ok = lease->exec(
                    kKeepaliveCommand, {}, {}, code, err,
                    [deadline]() { return std::chrono::steady_clock::now() > deadline; });
                if (!ok)
                    failure = QString::fromStdString(err);
            }
        }
        QMetaObject::invokeMethod(
            this, [this, failure, lost]() {
                keepaliveRunning_ = false;
                if (!failure.isEmpty())
                    qCWarning(ssConn) << "keepalive failed:" << failure;
                if (lost)
                    onConnectionLost(QStringLiteral("no live connection"));
            },
            Qt::QueuedConnection);
    });
}

void ConnectionManager::onConnectionLost(const QString &reason) {
    if (disposed_ || !isOnline())
        return;
    qCWarning(ssConn) << "connection lost" << describe(target_) << ":" << reason;
    keepaliveTimer_.stop();
    pool_->reset();
    lastError_ = reason;
    setState(ConnectionState::Disconnected);
    if (!manualDisconnect_)
        scheduleReconnect();
}

void ConnectionManager::setSyncing(bool syncing) {
    if (syncing && state_ == ConnectionState::Connected)
        setState(ConnectionState::Syncing);
    else if (!syncing && state_ == ConnectionState::Syncing)
        setState(ConnectionState::Connected);
}

void ConnectionManager::execStreaming(const QString &command, int timeoutMs,
                                      OutputCallback onStdout, OutputCallback onStderr,
                                      ExecCallback onFinished) {
    ensureConnected([this, command, timeoutMs, onStdout, onStderr,
                     onFinished](bool ok, const QString &error) {
        if (!ok) {
            ExecResult r;
            r.error = error;
            if (onFinished)
                onFinished(r);
            return;
        }
        const quint64 workerId = kExecWorkerBase + (++nextExecId_);
        auto pool = pool_;
        workers_.launch(workerId, [this, workerId, pool, command, timeoutMs, onStdout,
                                   onStderr, onFinished]() {
            ExecResult r;
            const auto deadline =
                std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
            std::atomic<bool> timedOut{false};
            {
                std::string err;
                SessionLease lease = pool->acquire(err, timeoutMs);
                if (!lease) {
                    r.error = QString::fromStdString(err);
                } else {
                    auto post = [this](const OutputCallback &cb, const std::string &chunk) {
                        if (!cb)
                            return;
                        const QString text = QString::fromUtf8(chunk.data(),
                                                               static_cast<int>(chunk.size()));
                        QMetaObject::invokeMethod(
                            this, [cb, text]() { cb(text); }, Qt::QueuedConnection);
                    };
                    int code = -1;
                    r.ok = lease->exec(
                        command.toStdString(),
                        [&](const std::string &c) { post(onStdout, c); },
                        [&](const std::string &c) { post(onStderr, c); }, code, err,
                        [&]() {
                            if (std::chrono::steady_clock::now() <= deadline)
                                return false;
                            timedOut.store(true);
                            return true;
                        });
                    r.exitCode = code;
                    if (timedOut.load()) {
                        r.ok = false;
                        r.error = QStringLiteral("Remote command timed out after %1 ms")
                                      .arg(timeoutMs);
                    } else if (!r.ok) {
                        r.error = QString::fromStdString(err);
                    }
                }
            }
            // Queued after the output chunks, so it is delivered last.
            QMetaObject::invokeMethod(
                this, [this, workerId, r, onFinished]() {
                    workers_.join(workerId);
                    if (!r.ok)
                        qCWarning(ssConn) << "remote command failed:" << r.error;
                    if (onFinished)
                        onFinished(r);
                },
                Qt::QueuedConnection);
        });
    });
}

void ConnectionManager::exec(const QString &command, int timeoutMs, ExecCallback onFinished) {
    auto out = std::make_shared<QString>();
    auto err = std::make_shared<QString>();
    execStreaming(
        command, timeoutMs, [out](const QString &c) { out->append(c); },
        [err](const QString &c) { err->append(c); },
        [out, err, onFinished](const ExecResult &res) {
            ExecResult r = res;
            r.stdoutText = *out;
            r.stderrText = *err;
            if (onFinished)
                onFinished(r);
        });
}

void ConnectionManager::disconnect() {
    manualDisconnect_ = true;
    reconnectTimer_.stop();
    keepaliveTimer_.stop();
    abortAttempt();
    pool_->reset();
    resolveWaiters(false, QStringLiteral("Disconnected"));
    setState(ConnectionState::Disconnected);
}

void ConnectionManager::dispose() {
    if (disposed_)
        return;
    {
        std::lock_guard<std::mutex> lk(lostRelay_->mtx);
        lostRelay_->manager = nullptr;
    }
    pool_->setConnectionLostHandler({});
    disconnect();
    disposed_ = true;
    workers_.joinAll();
    qCInfo(ssConn) << "disposed" << describe(target_);
}
