// Connection lifecycle against the mock transport: single-flight connect,
// reconnect backoff, manual disconnect, loss detection, exec and the registry.
#include "ConnectionRegistry.hpp"
#include "SyncEngine.hpp"
#include "SyncTestSupport.hpp"
#include <QTemporaryDir>
#include <vector>

namespace {

SyncTarget targetAt(const QString &localRoot, const QString &remoteRoot) {
    return targetFor(mockSettings(localRoot, remoteRoot), localRoot);
}

void test_backoff_schedule(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));
    t.check(m.reconnectDelayMs(1) == 1000, "first reconnect waits 1s");
    t.check(m.reconnectDelayMs(2) == 2000, "second reconnect waits 2s");
    t.check(m.reconnectDelayMs(3) == 4000, "third reconnect waits 4s");
    t.check(m.reconnectDelayMs(6) == 30000, "reconnect delay is capped at 30s");
    t.check(m.state() == ConnectionState::Disconnected, "manager starts disconnected");
}

void test_single_flight_connect(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    remote->latencyMs = 50;
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));
    std::vector<ConnectionState> states;
    QObject::connect(&m, &ConnectionManager::stateChanged,
                     [&](ConnectionState s) { states.push_back(s); });

    int okCount = 0;
    for (int i = 0; i < 5; ++i)
        m.ensureConnected([&](bool ok, const QString &) { okCount += ok ? 1 : 0; });
    t.check(m.state() == ConnectionState::Connecting, "state should be Connecting at once");
    t.check(waitUntil([&]() { return okCount == 5; }), "every caller should be resolved");
    t.check(remote->connectCalls.load() == 1, "concurrent callers should share one connect");
    t.check(m.state() == ConnectionState::Connected, "state should be Connected");
    t.check(states.size() == 2 && states[0] == ConnectionState::Connecting &&
                states[1] == ConnectionState::Connected,
            "stateChanged should report Connecting then Connected");

    bool immediate = false;
    m.ensureConnected([&](bool ok, const QString &) { immediate = ok; });
    t.check(immediate, "an online manager should answer synchronously");
    t.check(remote->connectCalls.load() == 1, "no new connect when already online");
    m.dispose();
}

void test_failure_then_reconnect(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    remote->failConnects = 2;
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));
    m.setReconnectBackoff(20, 100);
    QStringList errors;
    QObject::connect(&m, &ConnectionManager::connectionFailed,
                     [&](const QString &e) { errors << e; });

    bool answered = false;
    bool result = true;
    m.ensureConnected([&](bool ok, const QString &) {
        answered = true;
        result = ok;
    });
    t.check(waitUntil([&]() { return answered; }), "first attempt should be answered");
    t.check(!result, "first attempt should fail");
    t.check(m.state() == ConnectionState::Error, "a failed attempt should put the manager in Error");
    t.check(waitUntil([&]() { return m.state() == ConnectionState::Connected; }),
            "automatic reconnect should eventually succeed");
    t.check(errors.size() == 2, "each failed attempt should be reported");
    t.check(remote->connectCalls.load() == 3, "two failures then one success");
    t.check(m.retryCount() == 0, "a successful connect should reset the failure count");
    m.dispose();
}

void test_manual_disconnect_stops_reconnect(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    remote->failConnects = 100;
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));
    m.setReconnectBackoff(20, 40);
    m.ensureConnected({});
    t.check(waitUntil([&]() { return remote->connectCalls.load() >= 2; }),
            "reconnects should be attempted after failures");
    m.disconnect();
    const int calls = remote->connectCalls.load();
    spin(200);
    t.check(m.state() == ConnectionState::Disconnected, "manual disconnect should be Disconnected");
    t.check(remote->connectCalls.load() <= calls + 1,
            "no reconnect should be scheduled after a manual disconnect");

    remote->failConnects = 0;
    bool ok = false;
    m.ensureConnected([&](bool r, const QString &) { ok = r; });
    t.check(waitUntil([&]() { return ok; }), "ensureConnected should clear the manual flag");

    m.disconnect();
    const int afterConnected = remote->connectCalls.load();
    spin(150);
    t.check(remote->connectCalls.load() == afterConnected,
            "disconnecting a live session should not reconnect");
    m.dispose();
}

void test_connect_timeout(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    remote->latencyMs = 1000;
    QTemporaryDir dir;
    SyncSettings s = mockSettings(dir.path(), QStringLiteral("/srv"));
    s.connectTimeoutMs = 100;
    ConnectionManager m(targetFor(s, dir.path()), s, mockFactory(remote));
    m.setReconnectBackoff(5000, 5000);
    QString error;
    bool answered = false;
    m.ensureConnected([&](bool, const QString &e) {
        answered = true;
        error = e;
    });
    t.check(waitUntil([&]() { return answered; }, 3000), "a slow connect should be bounded");
    t.check(error.contains(QLatin1String("timed out")), "the error should say timed out");
    t.check(m.state() == ConnectionState::Error, "timeout should leave the manager in Error");
    m.dispose();
}

void test_connection_loss_detected(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));
    m.setReconnectBackoff(20, 40);
    m.setKeepaliveInterval(20);
    bool sawDisconnected = false;
    QObject::connect(&m, &ConnectionManager::stateChanged, [&](ConnectionState s) {
        if (s == ConnectionState::Disconnected)
            sawDisconnected = true;
    });
    m.ensureConnected({});
    t.check(waitUntil([&]() { return m.isOnline(); }), "manager should connect");

    remote->dropConnections();
    t.check(waitUntil([&]() { return sawDisconnected; }), "keepalive should notice the loss");
    t.check(waitUntil([&]() { return m.isOnline(); }), "manager should reconnect on its own");
    t.check(remote->connectCalls.load() >= 2, "reconnect should open a new session");
    m.dispose();
}

void test_exec(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    QTemporaryDir dir;
    ConnectionManager m(targetAt(dir.path(), QStringLiteral("/srv")),
                        mockSettings(dir.path(), QStringLiteral("/srv")), mockFactory(remote));

    bool done = false;
    ExecResult result;
    m.exec(QStringLiteral("echo hello world"), 1000, [&](const ExecResult &r) {
        result = r;
        done = true;
    });
    t.check(waitUntil([&]() { return done; }), "exec should finish");
    t.check(result.ok && result.exitCode == 0, "echo should succeed");
    t.check(result.stdoutText == QLatin1String("hello world\n"), "stdout should be collected");

    done = false;
    QString streamed;
    m.execStreaming(
        QStringLiteral("fail bad input"), 1000, {},
        [&](const QString &chunk) { streamed += chunk; },
        [&](const ExecResult &r) {
            result = r;
            done = true;
        });
    t.check(waitUntil([&]() { return done; }), "streaming exec should finish");
    t.check(streamed.contains(QLatin1String("bad input")),
            "stderr should be streamed before completion");
    t.check(result.ok && result.exitCode == 1, "a failing command still reports its status");

    done = false;
    m.exec(QStringLiteral("sleep 3000"), 100, [&](const ExecResult &r) {
        result = r;
        done = true;
    });
    t.check(waitUntil([&]() { return done; }, 2000), "a slow command should be cut off");
    t.check(!result.ok && result.error.contains(QLatin1String("timed out")),
            "the timeout should be reported");
    m.dispose();

    done = false;
    m.exec(QStringLiteral("echo late"), 1000, [&](const ExecResult &r) {
        result = r;
        done = true;
    });
    t.check(done && !result.ok, "exec on a disposed manager should fail at once");
}

void test_registry(TestContext &t) {
    auto remote = std::make_shared<sftpsync::MockRemoteFs>();
    QTemporaryDir dir;
    ConnectionRegistry registry(mockFactory(remote));
    const SyncSettings s = mockSettings(dir.path(), QStringLiteral("/srv"));
    auto a = registry.getOrCreate(targetFor(s, dir.path()), s);
    auto b = registry.getOrCreate(targetFor(s, dir.path()), s);
    t.check(a && a == b, "the same target should map to one manager");

    SyncSettings other = s;
    other.remotePath = QStringLiteral("/other");
    auto c = registry.getOrCreate(targetFor(other, dir.path()), other);
    t.check(c && c != a, "a different remote root should get its own manager");
    t.check(registry.size() == 2, "registry should hold two managers");
    t.check(registry.find(a->target().key()) == a, "find should return the manager by key");

    SyncSettings updated = s;
    updated.maxConcurrency = 5;
    registry.getOrCreate(targetFor(updated, dir.path()), updated);
    t.check(a->settings().maxConcurrency == 5, "getOrCreate should refresh settings");

    registry.remove(a->target().key());
    t.check(a->isDisposed(), "remove should dispose the manager");
    t.check(registry.size() == 1 && !registry.find(a->target().key()),
            "removed manager should be forgotten");
    registry.clear();
    t.check(c->isDisposed() && registry.size() == 0, "clear should dispose everything");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    registerSyncMetaTypes();
    TestContext t;
    test_backoff_schedule(t);
    test_single_flight_connect(t);
    test_failure_then_reconnect(t);
    test_manual_disconnect_stops_reconnect(t);
    test_connect_timeout(t);
    test_connection_loss_detected(t);
    test_exec(t);
    test_registry(t);
    return finish(t, "sftpsync_connection_manager_tests");
}
