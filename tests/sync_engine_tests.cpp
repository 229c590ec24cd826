// End-to-end engine behaviour over the mock transport.
#include "ConnectionRegistry.hpp"
#include "SyncEngine.hpp"
#include "SyncTestSupport.hpp"
#include <QDateTime>
#include <QTemporaryDir>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace {

struct Fixture {
    std::shared_ptr<sftpsync::MockRemoteFs> remote = std::make_shared<sftpsync::MockRemoteFs>();
    QTemporaryDir ws;
    QString root;
    SyncSettings settings;
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<SyncEngine> engine;
    int completed = 0;
    QStringList started;
    QList<ConflictArtifact> conflicts;
    QStringList failures;
    QStringList notices;

    explicit Fixture(const std::function<void(SyncSettings &)> &tweak = {}) {
        root = QDir(ws.path()).filePath(QStringLiteral("root"));
        QDir().mkpath(root);
        settings = mockSettings(root, QStringLiteral("/srv"));
        if (tweak)
            tweak(settings);
        remote->makeDirs("/srv");
        registry = std::make_unique<ConnectionRegistry>(mockFactory(remote));
        engine = std::make_unique<SyncEngine>(
            *registry, [this]() { return std::optional<SyncSettings>(settings); }, ws.path());
        engine->setDebounceMs(20);
        engine->queue().setRetryBackoff(5, 20);
        QObject::connect(&engine->queue(), &TransferQueue::jobCompleted,
                         [this](TransferJobPtr) { ++completed; });
        QObject::connect(&engine->queue(), &TransferQueue::jobStarted,
                         [this](TransferJobPtr j) { started << j->localPath; });
        QObject::connect(engine.get(), &SyncEngine::conflictDetected,
                         [this](const ConflictArtifact &a) { conflicts << a; });
        QObject::connect(engine.get(), &SyncEngine::jobFailed,
                         [this](const QString &path, const QString &type, const QString &) {
                             failures << type + QLatin1Char(' ') + path;
                         });
        QObject::connect(engine.get(), &SyncEngine::notice,
                         [this](const QString &m) { notices << m; });
    }

    ~Fixture() {
        engine.reset();
        registry.reset();
    }

    QString local(const QString &rel) const { return QDir(root).filePath(rel); }

    bool settle(int expectedCompletions, int timeoutMs = 5000) {
        return waitUntil(
            [&]() { return completed >= expectedCompletions && engine->queue().isIdle(); },
            timeoutMs);
    }
};

void test_push_is_idempotent(TestContext &t) {
    Fixture f;
    const QString path = f.local(QStringLiteral("notes/a.txt"));
    t.check(writeLocal(path, "hello"), "local file should be written");

    f.engine->scheduleSyncFile(path);
    t.check(f.engine->fileStatus(path) == FileSyncStatus::Modified,
            "a scheduled push marks the file Modified");
    t.check(f.settle(1), "first push should complete");
    t.check(remoteContent(*f.remote, "/srv/notes/a.txt") == "hello",
            "remote should hold the pushed content");
    t.check(!f.remote->exists("/srv/notes/a.txt.__uploading__"),
            "the temp upload name should not remain");
    t.check(f.remote->putCalls.load() == 1, "one transfer for the first push");
    t.check(f.engine->fileStatus(path) == FileSyncStatus::Synced, "file should be Synced");
    t.check(f.engine->baseline(path).has_value(), "a baseline should be recorded");
    t.check(f.engine->pendingChanges().isEmpty(), "the pending change should be cleared");

    f.engine->scheduleSyncFile(path);
    t.check(f.settle(2), "second push should complete");
    t.check(f.remote->putCalls.load() == 1, "an unchanged file should not be transferred again");
}

void test_debounce_coalesces(TestContext &t) {
    Fixture f;
    const QString path = f.local(QStringLiteral("b.txt"));
    writeLocal(path, "v1");
    for (int i = 0; i < 5; ++i)
        f.engine->scheduleSyncFile(path);
    t.check(f.settle(1), "coalesced push should complete");
    spin(60);
    t.check(f.completed == 1, "bursts within the window should produce one job");
    t.check(f.remote->putCalls.load() == 1, "bursts should produce one transfer");
}

void test_conflict_preserves_both_sides(TestContext &t) {
    Fixture f;
    const QString path = f.local(QStringLiteral("c.txt"));
    writeLocal(path, "local edit");
    f.remote->writeFile("/srv/c.txt", "remote edit from elsewhere", 2000);
    SyncSignature known;
    known.size = 1;
    known.mtime = 1000;
    f.engine->setBaseline(path, known);

    f.engine->scheduleSyncFile(path);
    t.check(waitUntil([&]() { return !f.conflicts.isEmpty() && f.engine->queue().isIdle(); }),
            "a conflict should be reported");
    t.check(f.remote->putCalls.load() == 0, "a conflicting file must not be uploaded");
    t.check(remoteContent(*f.remote, "/srv/c.txt") == "remote edit from elsewhere",
            "remote content should be untouched");
    if (!f.conflicts.isEmpty()) {
        const ConflictArtifact a = f.conflicts.front();
        t.check(a.sourcePath == path, "artifact should name the source file");
        t.check(a.localArtifactPath.contains(QLatin1String(".conflict.LOCAL.")),
                "local artifact should carry the LOCAL marker");
        t.check(readLocal(a.localArtifactPath) == "local edit",
                "local artifact should hold the local version");
        t.check(readLocal(a.remoteArtifactPath) == "remote edit from elsewhere",
                "remote artifact should hold the remote version");
        t.check(f.engine->shouldIgnore(a.remoteArtifactPath),
                "artifacts should not trigger new pushes");
    }
    t.check(readLocal(path) == "local edit", "the source file should be untouched");
    t.check(f.engine->fileStatus(path) == FileSyncStatus::Modified,
            "a conflicted file stays Modified");
    t.check(f.engine->conflicts().size() == 1, "the conflict should be listed");

    f.engine->resolveConflict(path);
    t.check(f.engine->conflicts().isEmpty(), "resolving should clear the conflict");
    f.engine->scheduleSyncFile(path);
    t.check(waitUntil([&]() { return f.remote->putCalls.load() == 1 && f.engine->queue().isIdle(); }),
            "after resolving, the local version should be pushed");
    t.check(remoteContent(*f.remote, "/srv/c.txt") == "local edit",
            "the resolved version should reach the remote");
}

void test_offline_changes_flush_in_order(TestContext &t) {
    Fixture f([](SyncSettings &s) { s.maxConcurrency = 1; });
    f.remote->failConnects = 1000000;
    const QString a = f.local(QStringLiteral("a.txt"));
    const QString b = f.local(QStringLiteral("b.txt"));
    const QString c = f.local(QStringLiteral("c.txt"));
    writeLocal(a, "A");
    writeLocal(b, "B");
    writeLocal(c, "C");

    f.engine->connectToTarget();
    t.check(f.engine->connection() != nullptr, "engine should bind a connection");
    if (!f.engine->connection())
        return;
    f.engine->connection()->setReconnectBackoff(20, 40);

    f.engine->scheduleSyncFile(a);
    spin(40);
    f.engine->scheduleSyncFile(b);
    spin(40);
    f.engine->scheduleSyncFile(c);
    t.check(waitUntil([&]() { return f.engine->offlineJobCount() == 3; }),
            "changes made while offline should be parked");
    t.check(f.remote->putCalls.load() == 0, "nothing should be sent while offline");

    f.remote->failConnects = 0;
    t.check(f.settle(3), "parked jobs should run once connected");
    t.check(f.started.size() == 3 && f.started.at(0) == a && f.started.at(1) == b &&
                f.started.at(2) == c,
            "parked jobs should run in the order they were made");
    t.check(f.engine->offlineJobCount() == 0, "the offline buffer should be empty");
    t.check(remoteContent(*f.remote, "/srv/c.txt") == "C", "every parked change should land");
}

void test_exclusions_filter_changes(TestContext &t) {
    Fixture f([](SyncSettings &s) {
        s.exclusions = {QStringLiteral("node_modules"), QStringLiteral("*.log")};
    });
    const QString dep = f.local(QStringLiteral("project/node_modules/x.js"));
    const QString log = f.local(QStringLiteral("project/debug.log"));
    const QString src = f.local(QStringLiteral("project/src/app.ts"));
    writeLocal(dep, "dep");
    writeLocal(log, "log");
    writeLocal(src, "src");

    f.engine->onLocalChange(dep, LocalChangeKind::Changed);
    f.engine->onLocalChange(log, LocalChangeKind::Created);
    f.engine->onLocalChange(src, LocalChangeKind::Changed);
    t.check(f.settle(1), "the included change should be pushed");
    spin(60);
    t.check(f.completed == 1, "excluded changes should produce no jobs");
    t.check(f.remote->exists("/srv/project/src/app.ts"), "included file should reach the remote");
    t.check(!f.remote->exists("/srv/project/debug.log"), "*.log should stay local");
    t.check(!f.remote->exists("/srv/project/node_modules/x.js"), "node_modules should stay local");
}

void test_internal_and_outside_paths(TestContext &t) {
    Fixture f;
    const QString temp = f.local(QStringLiteral("x.txt.__UPLOADING__"));
    writeLocal(temp, "t");
    t.check(f.engine->shouldIgnore(f.local(QStringLiteral("y.txt.__downloading__"))),
            "temp download names should be ignored");
    f.engine->onLocalChange(temp, LocalChangeKind::Created);
    spin(60);
    t.check(f.engine->queue().isIdle() && f.completed == 0, "temp names should never be pushed");

    const QString outside = QDir(f.ws.path()).filePath(QStringLiteral("elsewhere.txt"));
    writeLocal(outside, "o");
    t.check(!f.engine->isManagedPath(outside), "files outside the root are not managed");
    f.engine->forcePush(outside);
    t.check(!f.notices.isEmpty() && f.notices.last().contains(QLatin1String("outside")),
            "pushing outside the root should produce a notice");
}

void test_pull_file_and_skip(TestContext &t) {
    Fixture f;
    f.remote->writeFile("/srv/docs/r.txt", "remote body", 1600000000);
    const QString path = f.local(QStringLiteral("docs/r.txt"));

    f.engine->forcePull(path);
    t.check(f.settle(1), "pull should complete");
    t.check(readLocal(path) == "remote body", "remote content should be downloaded");
    t.check(QFileInfo(path).lastModified().toSecsSinceEpoch() == 1600000000,
            "local mtime should follow the remote");
    t.check(!QFile::exists(path + QStringLiteral(".__downloading__")),
            "the temp download should be renamed away");
    t.check(f.engine->shouldIgnore(path), "a freshly downloaded file is suppressed");
    t.check(f.remote->getCalls.load() == 1, "one get for the first pull");

    f.engine->onLocalChange(path, LocalChangeKind::Changed);
    spin(60);
    t.check(f.remote->putCalls.load() == 0, "the download must not echo back as an upload");

    f.engine->forcePull(path);
    t.check(f.settle(2), "second pull should complete");
    t.check(f.remote->getCalls.load() == 1, "a matching local copy should not be downloaded");
}

void test_sync_all_pushes_pending_only(TestContext &t) {
    Fixture f([](SyncSettings &s) { s.autoSync = false; });
    const QString a = f.local(QStringLiteral("a.txt"));
    const QString b = f.local(QStringLiteral("b.txt"));
    const QString c = f.local(QStringLiteral("c.txt"));
    writeLocal(a, "a");
    writeLocal(b, "b");
    writeLocal(c, "c");
    f.engine->onLocalChange(a, LocalChangeKind::Changed);
    f.engine->onLocalChange(b, LocalChangeKind::Created);
    spin(60);
    t.check(f.remote->putCalls.load() == 0, "with autoSync off nothing is pushed automatically");
    t.check(f.engine->pendingChanges().size() == 2, "changes should be recorded as pending");
    t.check(f.engine->fileStatus(a) == FileSyncStatus::Modified, "pending files are Modified");

    bool finished = false;
    bool ok = false;
    int failed = -1;
    QObject::connect(f.engine.get(), &SyncEngine::syncFinished,
                     [&](SyncDirection d, bool success, int failedJobs) {
                         if (d != SyncDirection::Push)
                             return;
                         finished = true;
                         ok = success;
                         failed = failedJobs;
                     });
    t.check(f.engine->syncAll(), "syncAll should start");
    t.check(!f.engine->syncAll(), "a second run should be refused while one is active");
    t.check(waitUntil([&]() { return finished; }), "syncAll should finish");
    t.check(ok && failed == 0, "syncAll should succeed");
    t.check(f.remote->exists("/srv/a.txt") && f.remote->exists("/srv/b.txt"),
            "pending files should be pushed");
    t.check(!f.remote->exists("/srv/c.txt"), "untouched files should not be pushed");
    t.check(f.engine->pendingChanges().isEmpty(), "the pending ledger should be drained");

    finished = false;
    t.check(f.engine->syncAll(), "an empty syncAll should still run");
    t.check(waitUntil([&]() { return finished; }), "an empty syncAll should finish");
    t.check(ok, "an empty syncAll succeeds");
}

void test_sync_pull_mirrors_tree(TestContext &t) {
    Fixture f([](SyncSettings &s) { s.exclusions = {QStringLiteral("*.log")}; });
    f.remote->writeFile("/srv/x/1.txt", "one", 1600000000);
    f.remote->writeFile("/srv/x/deep/2.txt", "two", 1600000000);
    f.remote->writeFile("/srv/y.txt", "why", 1600000000);
    f.remote->writeFile("/srv/skip.log", "noise", 1600000000);

    bool finished = false;
    bool ok = false;
    QObject::connect(f.engine.get(), &SyncEngine::syncFinished,
                     [&](SyncDirection d, bool success, int) {
                         if (d == SyncDirection::Pull) {
                             finished = true;
                             ok = success;
                         }
                     });
    t.check(f.engine->syncPull(), "syncPull should start");
    t.check(f.engine->shouldIgnore(f.local(QStringLiteral("y.txt"))),
            "local events are ignored while a pull runs");
    t.check(waitUntil([&]() { return finished; }), "syncPull should finish");
    t.check(ok, "syncPull should succeed");
    t.check(readLocal(f.local(QStringLiteral("x/1.txt"))) == "one", "x/1.txt should be mirrored");
    t.check(readLocal(f.local(QStringLiteral("x/deep/2.txt"))) == "two",
            "nested files should be mirrored");
    t.check(readLocal(f.local(QStringLiteral("y.txt"))) == "why", "y.txt should be mirrored");
    t.check(!QFile::exists(f.local(QStringLiteral("skip.log"))),
            "excluded remote files should not be pulled");
}

void test_delete_and_rename(TestContext &t) {
    Fixture f;
    const QString a = f.local(QStringLiteral("dir/a.txt"));
    const QString gone = f.local(QStringLiteral("gone.txt"));
    writeLocal(a, "alpha");
    writeLocal(gone, "bye");
    f.engine->scheduleSyncFile(a);
    f.engine->scheduleSyncFile(gone);
    t.check(f.settle(2), "initial pushes should complete");

    QFile::remove(gone);
    f.engine->onLocalChange(gone, LocalChangeKind::Deleted);
    t.check(f.settle(3), "delete should complete");
    t.check(!f.remote->exists("/srv/gone.txt"), "deleted file should be removed remotely");
    t.check(!f.engine->baseline(gone).has_value(), "the baseline should be dropped");
    t.check(f.engine->fileStatus(gone) == FileSyncStatus::None, "a deleted file has no status");

    const QString moved = f.local(QStringLiteral("dir/renamed.txt"));
    QFile::rename(a, moved);
    const int putsBefore = f.remote->putCalls.load();
    f.engine->onLocalRename(a, moved);
    t.check(f.settle(4), "rename should complete");
    t.check(!f.remote->exists("/srv/dir/a.txt"), "old remote path should be gone");
    t.check(remoteContent(*f.remote, "/srv/dir/renamed.txt") == "alpha",
            "content should move with the rename");
    t.check(f.remote->putCalls.load() == putsBefore, "a rename should not re-upload");
    t.check(f.engine->baseline(moved).has_value() && !f.engine->baseline(a).has_value(),
            "the baseline should follow the rename");
    t.check(f.engine->fileStatus(moved) == FileSyncStatus::Synced, "renamed file is Synced");

    // Deleting something the remote never had is not an error.
    const QString never = f.local(QStringLiteral("never.txt"));
    f.engine->scheduleDelete(never);
    t.check(f.settle(5), "deleting a missing remote file should succeed");
    t.check(f.failures.isEmpty(), "no job should have failed");
}

void test_failed_job_reports_without_erroring_connection(TestContext &t) {
    Fixture f;
    {
        std::lock_guard<std::mutex> lk(f.remote->mtx);
        f.remote->failPaths.insert("/srv/bad.txt.__uploading__");
    }
    const QString bad = f.local(QStringLiteral("bad.txt"));
    const QString good = f.local(QStringLiteral("good.txt"));
    writeLocal(bad, "bad");
    writeLocal(good, "good");
    f.engine->scheduleSyncFile(bad);
    f.engine->scheduleSyncFile(good);
    t.check(waitUntil([&]() { return !f.failures.isEmpty() && f.engine->queue().isIdle(); }),
            "the failing upload should be reported");
    t.check(f.failures.size() == 1 && f.failures.front() == QStringLiteral("UPLOAD ") + bad,
            "jobFailed should carry the type and path");
    t.check(f.engine->fileStatus(bad) == FileSyncStatus::Error, "failed file should be Error");
    t.check(f.engine->fileStatus(good) == FileSyncStatus::Synced, "other files are unaffected");
    t.check(f.engine->directoryStatus(f.root) == FileSyncStatus::Error,
            "a directory reports the worst status below it");
    t.check(f.engine->connectionState() != ConnectionState::Error,
            "a job failure must not put the connection in Error");
    t.check(f.remote->putCalls.load() >= 3, "the failing upload should be retried once");
}

void test_force_push_directory(TestContext &t) {
    Fixture f([](SyncSettings &s) {
        s.syncMode = SyncMode::Selective;
        s.includes = {QStringLiteral("src/**")};
        s.exclusions = {QStringLiteral("*.tmp")};
    });
    writeLocal(f.local(QStringLiteral("src/a.cpp")), "a");
    writeLocal(f.local(QStringLiteral("src/sub/b.cpp")), "b");
    writeLocal(f.local(QStringLiteral("src/c.tmp")), "c");
    writeLocal(f.local(QStringLiteral("other/d.txt")), "d");
    f.engine->forcePush(f.root);
    t.check(f.settle(2), "directory push should complete");
    spin(60);
    t.check(f.remote->exists("/srv/src/a.cpp") && f.remote->exists("/srv/src/sub/b.cpp"),
            "included files should be pushed");
    t.check(!f.remote->exists("/srv/src/c.tmp"), "excluded files should not be pushed");
    t.check(!f.remote->exists("/srv/other/d.txt"), "files outside the includes are skipped");
}

void test_syncing_follows_queue(TestContext &t) {
    Fixture f;
    QList<ConnectionState> states;
    bool syncingWhileRunning = false;
    QObject::connect(f.engine.get(), &SyncEngine::stateChanged,
                     [&](ConnectionState s) { states << s; });
    QObject::connect(&f.engine->queue(), &TransferQueue::jobStarted, [&](TransferJobPtr) {
        syncingWhileRunning = f.engine->connectionState() == ConnectionState::Syncing &&
                              f.engine->connection() &&
                              f.engine->connection()->state() == ConnectionState::Syncing;
    });
    const QString path = f.local(QStringLiteral("s.txt"));
    writeLocal(path, "s");
    f.engine->scheduleSyncFile(path);
    t.check(f.settle(1), "push should complete");
    t.check(waitUntil([&]() { return f.engine->connectionState() == ConnectionState::Connected; }),
            "an empty queue should return the connection to Connected");
    t.check(syncingWhileRunning, "a running job should put the connection in Syncing");
    const QList<ConnectionState> expected{ConnectionState::Connecting, ConnectionState::Connected,
                                          ConnectionState::Syncing, ConnectionState::Connected};
    t.check(states == expected, "states should be Connecting, Connected, Syncing, Connected");
}

void test_reconnect_reports_states_in_order(TestContext &t) {
    Fixture f;
    f.engine->connectToTarget();
    auto conn = f.engine->connection();
    t.check(conn != nullptr, "engine should bind a connection");
    if (!conn)
        return;
    conn->setKeepaliveInterval(20);
    conn->setReconnectBackoff(30, 60);
    t.check(waitUntil([&]() { return f.engine->connectionState() == ConnectionState::Connected; }),
            "engine should connect");

    std::atomic<bool> ran{false};
    auto held = std::make_shared<TransferJob>();
    held->type = TransferJobType::Upload;
    held->localPath = f.local(QStringLiteral("held.txt"));
    held->remotePath = QStringLiteral("/srv/held.txt");
    held->dedupKey = makeDedupKey(held->type, held->remotePath);
    held->action = [&ran](const CancelToken &, QString &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ran = true;
        return true;
    };

    QList<ConnectionState> engineStates;
    QList<ConnectionState> managerStates;
    bool enqueued = false;
    bool connectedWhileRunning = false;
    QObject::connect(f.engine.get(), &SyncEngine::stateChanged, [&](ConnectionState s) {
        engineStates << s;
        if (s == ConnectionState::Connected && f.engine->queue().snapshot().inflight > 0)
            connectedWhileRunning = true;
        if (s == ConnectionState::Disconnected && !enqueued) {
            enqueued = true;
            f.engine->queue().enqueue(held);
        }
    });
    // Connected after the engine, so it sees what any later listener sees.
    QObject::connect(conn.get(), &ConnectionManager::stateChanged, [&](ConnectionState s) {
        managerStates << s;
        if (s == ConnectionState::Connected && f.engine->queue().snapshot().inflight > 0)
            connectedWhileRunning = true;
    });

    f.remote->dropConnections();
    t.check(waitUntil([&]() {
                return ran.load() && f.engine->queue().isIdle() &&
                       f.engine->connectionState() == ConnectionState::Connected;
            }),
            "the held job should run after reconnecting");
    t.check(enqueued, "a job should have been left in the queue while disconnected");
    t.check(!connectedWhileRunning, "Connected must not be reported while a job is running");
    const QList<ConnectionState> tail{ConnectionState::Connected, ConnectionState::Syncing,
                                      ConnectionState::Connected};
    t.check(engineStates.size() >= 3 && engineStates.mid(engineStates.size() - 3) == tail,
            "engine should report Connected, Syncing, Connected after reconnecting");
    t.check(managerStates.size() >= 3 && managerStates.mid(managerStates.size() - 3) == tail,
            "every manager listener should see the same order");
}

void test_target_change_drops_stale_jobs(TestContext &t) {
    Fixture f;
    f.remote->failConnects = 1000000;
    const QString a = f.local(QStringLiteral("a.txt"));
    const QString b = f.local(QStringLiteral("b.txt"));
    writeLocal(a, "A");
    writeLocal(b, "B");
    f.engine->scheduleSyncFile(a);
    f.engine->scheduleSyncFile(b);
    t.check(waitUntil([&]() { return f.engine->offlineJobCount() == 2; }),
            "changes should be parked while offline");

    f.settings.remotePath = QStringLiteral("/other");
    f.remote->makeDirs("/other");
    f.remote->failConnects = 0;
    f.engine->connectToTarget();
    t.check(f.engine->remoteRoot() == QLatin1String("/other"), "engine should rebind");
    t.check(f.engine->offlineJobCount() == 0, "jobs built for the old target should be dropped");
    bool told = false;
    for (const QString &n : f.notices)
        told = told || n.contains(QLatin1String("Target changed"));
    t.check(told, "dropping queued work should produce a notice");
    t.check(f.engine->pendingChanges().size() == 2, "dropped changes stay pending");
    t.check(f.engine->fileStatus(a) == FileSyncStatus::Modified, "dropped files stay Modified");

    spin(100);
    t.check(f.remote->putCalls.load() == 0, "no stale job should run");
    t.check(f.failures.isEmpty(), "no stale job should fail");

    bool finished = false;
    bool ok = false;
    QObject::connect(f.engine.get(), &SyncEngine::syncFinished,
                     [&](SyncDirection, bool success, int) {
                         finished = true;
                         ok = success;
                     });
    t.check(f.engine->syncAll(), "a push should start against the new target");
    t.check(waitUntil([&]() { return finished; }), "the push should finish");
    t.check(ok && f.failures.isEmpty(), "the push should succeed");
    t.check(f.remote->exists("/other/a.txt") && f.remote->exists("/other/b.txt"),
            "pending changes should reach the new remote root");
    t.check(!f.remote->exists("/srv/a.txt"), "nothing should land under the old root");
}

void test_suppression_entries_expire(TestContext &t) {
    Fixture f([](SyncSettings &s) { s.maxConcurrency = 4; });
    f.engine->setSuppressionMs(1);
    const int files = 40;
    for (int i = 0; i < files; ++i)
        f.remote->writeFile("/srv/bulk/f" + std::to_string(i) + ".txt", "x", 1600000000);
    bool finished = false;
    QObject::connect(f.engine.get(), &SyncEngine::syncFinished,
                     [&](SyncDirection, bool, int) { finished = true; });
    t.check(f.engine->syncPull(), "pull should start");
    t.check(waitUntil([&]() { return finished; }, 10000), "pull should finish");
    t.check(QFile::exists(f.local(QStringLiteral("bulk/f39.txt"))), "files should be pulled");
    t.check(f.engine->suppressedPathCount() < 2 * files,
            "expired suppression entries should be pruned");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    registerSyncMetaTypes();
    TestContext t;
    test_push_is_idempotent(t);
    test_debounce_coalesces(t);
    test_conflict_preserves_both_sides(t);
    test_offline_changes_flush_in_order(t);
    test_exclusions_filter_changes(t);
    test_internal_and_outside_paths(t);
    test_pull_file_and_skip(t);
    test_sync_all_pushes_pending_only(t);
    test_sync_pull_mirrors_tree(t);
    test_delete_and_rename(t);
    test_failed_job_reports_without_erroring_connection(t);
    test_force_push_directory(t);
    test_syncing_follows_queue(t);
    test_reconnect_reports_states_in_order(t);
    test_target_change_drops_stale_jobs(t);
    test_suppression_entries_expire(t);
    return finish(t, "sftpsync_sync_engine_tests");
}
