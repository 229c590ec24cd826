// Persistent logical session for one sync target: single-flight connect,
// reconnect with exponential backoff, keepalive probing and remote exec.
// Lives on the control thread; connects and probes run on worker threads.
#pragma once
#include "SessionPool.hpp"
#include "SyncSettings.hpp"
#include "SyncTypes.hpp"
#include "WorkerThreads.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

struct ExecResult {
    bool ok = false; // command ran and reported an exit code in time
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    QString error;
};

class ConnectionManager : public QObject {
    Q_OBJECT
public:
    using ReadyCallback = std::function<void(bool ok, const QString &error)>;
    using OutputCallback = std::function<void(const QString &chunk)>;
    using ExecCallback = std::function<void(const ExecResult &result)>;

    ConnectionManager(const SyncTarget &target, const SyncSettings &settings,
                      sftpsync::ClientFactory factory, QObject *parent = nullptr);
    ~ConnectionManager() override;

    const SyncTarget &target() const { return target_; }
    const SyncSettings &settings() const { return settings_; }
    // New credentials and timeouts apply to the next connection made.
    void updateSettings(const SyncSettings &settings);

    ConnectionState state() const { return state_; }
    bool isOnline() const {
        return state_ == ConnectionState::Connected || state_ == ConnectionState::Syncing;
    }
    QString lastError() const { return lastError_; }
    int retryCount() const { return retryCount_; }

    // Calls back once a session is ready or the attempt failed. Concurrent
    // callers share the attempt in flight. Clears a previous manual disconnect.
    void ensureConnected(ReadyCallback callback);
    // Workers lease their connections from here.
    std::shared_ptr<SessionPool> pool() const { return pool_; }

    // Streams remote command output; onFinished always runs exactly once.
    // All callbacks run on the control thread.
    void execStreaming(const QString &command, int timeoutMs, OutputCallback onStdout,
                       OutputCallback onStderr, ExecCallback onFinished);
    void exec(const QString &command, int timeoutMs, ExecCallback onFinished);

    // Driven by queue activity: Connected <-> Syncing.
    void setSyncing(bool syncing);

    // User-initiated: no reconnect until the next ensureConnected().
    void disconnect();
    // Final teardown; the manager is inert afterwards.
    void dispose();
    bool isDisposed() const { return disposed_; }

    // delay(n) = min(cap, base * 2^(n - 1)) for the n-th consecutive failure
    void setReconnectBackoff(int baseMs, int capMs);
    int reconnectDelayMs(int failures) const;
    void setKeepaliveInterval(int ms);

signals:
    void stateChanged(ConnectionState state);
    void connectionFailed(QString error);

private:
    void setState(ConnectionState s);
    void startAttempt();
    void onAttemptFinished(quint64 attemptId, bool ok, const QString &err,
                           std::shared_ptr<sftpsync::SftpClient> client,
                           const sftpsync::SessionOptions &opt);
    void onConnectTimeout(quint64 attemptId);
    void failAttempt(const QString &err);
    void abortAttempt();
    void resolveWaiters(bool ok, const QString &err);
    void scheduleReconnect();
    void onReconnectTimer();
    void runKeepalive();
    void onConnectionLost(const QString &reason);

    // Lets pool callbacks on worker threads reach the manager only while it is
    // alive.
    struct LostRelay {
        std::mutex mtx;
        ConnectionManager *manager = nullptr;
    };

    SyncTarget target_;
    SyncSettings settings_;
    sftpsync::ClientFactory factory_;
    std::shared_ptr<SessionPool> pool_;
    std::shared_ptr<LostRelay> lostRelay_;
    ConnectionState state_ = ConnectionState::Disconnected;
    QString lastError_;

    quint64 attemptId_ = 0;
    bool connecting_ = false;
    std::vector<ReadyCallback> waiters_;
    std::mutex attemptMtx_;
    std::shared_ptr<sftpsync::SftpClient> attemptClient_; // guarded by attemptMtx_

    int retryCount_ = 0;
    int reconnectBaseMs_ = 1000;
    int reconnectCapMs_ = 30000;
    bool manualDisconnect_ = false;
    bool disposed_ = false;
    bool keepaliveRunning_ = false;
    quint64 nextExecId_ = 0;

    QTimer connectTimeoutTimer_;
    QTimer reconnectTimer_;
    QTimer keepaliveTimer_;
    WorkerThreads workers_;
};
