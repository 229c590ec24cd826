// Settings loading, clamping and local root resolution.
#include "SyncSettings.hpp"
#include "SyncTestSupport.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QStringList>
#include <QTemporaryDir>

namespace {

QStringList g_categories;

void captureCategory(QtMsgType, const QMessageLogContext &ctx, const QString &) {
    g_categories << QString::fromLatin1(ctx.category ? ctx.category : "");
}

void test_defaults_and_clamping(TestContext &t) {
    SyncSettings s;
    t.check(s.enabled && s.autoSync, "sync and autoSync should default on");
    t.check(s.maxConcurrency == 3 && s.maxRetries == 3, "default concurrency/retries are 3");
    t.check(s.includes == QStringList{QStringLiteral("**/*")}, "default include is **/*");

    s.maxConcurrency = 50;
    s.maxRetries = -2;
    s.connectTimeoutMs = 10;
    s.operationTimeoutMs = 0;
    s.port = 0;
    s.includes.clear();
    clampSyncSettings(s);
    t.check(s.maxConcurrency == 10, "concurrency should clamp to 10");
    t.check(s.maxRetries == 0, "retries should clamp to 0");
    t.check(s.connectTimeoutMs == 1000 && s.operationTimeoutMs == 1000,
            "timeouts should clamp to 1s");
    t.check(s.port == 22, "port 0 should fall back to 22");
    t.check(s.includes == QStringList{QStringLiteral("**/*")}, "empty includes reset to **/*");

    s.maxConcurrency = 0;
    clampSyncSettings(s);
    t.check(s.maxConcurrency == 1, "concurrency should clamp to at least 1");
}

void test_headless_host_key_default(TestContext &t) {
    QTemporaryDir ws;
    SyncSettings s;
    s.host = QStringLiteral("h");
    s.username = QStringLiteral("u");
    t.check(s.knownHostsPolicy == sftpsync::KnownHostsPolicy::AcceptNew,
            "sync settings should default to acceptNew");
    const sftpsync::SessionOptions opt = sessionOptionsFor(targetFor(s, ws.path()), s);
    t.check(opt.known_hosts_policy == sftpsync::KnownHostsPolicy::AcceptNew,
            "the sync default should override the transport's strict default");
    t.check(sftpsync::SessionOptions().known_hosts_policy == sftpsync::KnownHostsPolicy::Strict,
            "the transport itself stays strict");
}

void test_load_from_ini(TestContext &t) {
    QTemporaryDir dir;
    const QString ini = dir.filePath(QStringLiteral("sync.ini"));
    {
        QFile f(ini);
        t.check(f.open(QIODevice::WriteOnly), "ini should be writable");
        f.write("[Sync]\n"
                "host=example.test\n"
                "port=2222\n"
                "username=bob\n"
                "remotePath=/srv/www/\n"
                "exclusions=\"node_modules, *.log ,.git\"\n"
                "syncMode=Selective\n"
                "maxConcurrency=99\n"
                "knownHostsPolicy=strict\n"
                "privateKeyPath=~/.ssh/id_ed25519\n");
    }
    QSettings qs(ini, QSettings::IniFormat);
    const SyncSettings s = loadSyncSettings(qs);
    t.check(s.host == QLatin1String("example.test") && s.port == 2222, "host/port should load");
    t.check(s.username == QLatin1String("bob"), "username should load");
    t.check(s.exclusions.size() == 3 && s.exclusions.at(1) == QLatin1String("*.log"),
            "comma separated exclusions should be split and trimmed");
    t.check(s.syncMode == SyncMode::Selective, "sync mode should parse case-insensitively");
    t.check(s.maxConcurrency == 10, "loaded values should be clamped");
    t.check(s.knownHostsPolicy == sftpsync::KnownHostsPolicy::Strict, "policy should parse");
    t.check(s.privateKeyPath.startsWith(QDir::homePath()), "~ should expand to home");
    t.check(s.autoSync, "missing keys keep defaults");

    const SyncTarget target = targetFor(s, dir.path());
    t.check(target.remoteRoot == QLatin1String("/srv/www"), "trailing slash should be stripped");
    t.check(target.key() == QLatin1String("bob@example.test:2222:/srv/www"),
            "target key should be user@host:port:remoteRoot");

    const sftpsync::SessionOptions opt = sessionOptionsFor(target, s);
    t.check(opt.port == 2222 && opt.username == "bob", "session options should carry identity");
    t.check(opt.private_key_path.has_value(), "key path should be passed through");
    t.check(!opt.password.has_value(), "no password configured means none passed");
    t.check(opt.known_hosts_policy == sftpsync::KnownHostsPolicy::Strict,
            "policy should reach the session options");
}

void test_save_round_trip(TestContext &t) {
    QTemporaryDir dir;
    const QString ini = dir.filePath(QStringLiteral("saved.ini"));
    SyncSettings s;
    s.host = QStringLiteral("h");
    s.username = QStringLiteral("u");
    s.exclusions = {QStringLiteral("a"), QStringLiteral("b")};
    s.syncMode = SyncMode::Selective;
    s.knownHostsPolicy = sftpsync::KnownHostsPolicy::Off;
    {
        QSettings qs(ini, QSettings::IniFormat);
        saveSyncSettings(qs, s);
    }
    QSettings qs(ini, QSettings::IniFormat);
    const SyncSettings back = loadSyncSettings(qs);
    t.check(back.exclusions == s.exclusions, "exclusions should survive save/load");
    t.check(back.syncMode == SyncMode::Selective, "mode should survive save/load");
    t.check(back.knownHostsPolicy == sftpsync::KnownHostsPolicy::Off,
            "policy should survive save/load");
}

void test_managed_root(TestContext &t) {
    QTemporaryDir ws;
    const QString first = resolveManagedRoot(ws.path());
    t.check(QFileInfo(first).isDir(), "managed root should be created");
    t.check(QFileInfo(first).fileName().startsWith(QLatin1String("Sync_")),
            "managed root should be named Sync_<timestamp>");
    t.check(QFileInfo(first).isAbsolute(), "managed root should be absolute");

    const QString again = resolveManagedRoot(ws.path());
    t.check(again == first, "managed root should be reused from the record");

    // A tampered record is not trusted.
    {
        QFile rec(QDir(ws.path()).filePath(QStringLiteral(".sftpsync/.managed-root.json")));
        t.check(rec.open(QIODevice::WriteOnly | QIODevice::Truncate), "record writable");
        QJsonObject obj;
        obj.insert(QStringLiteral("folder"), QStringLiteral("../escape"));
        rec.write(QJsonDocument(obj).toJson());
    }
    const QString fresh = resolveManagedRoot(ws.path());
    t.check(!fresh.contains(QLatin1String("escape")), "path-like folder names are rejected");
    t.check(fresh.startsWith(QDir(ws.path()).absolutePath()), "root stays inside the workspace");

    SyncSettings s;
    s.host = QStringLiteral("h");
    s.username = QStringLiteral("u");
    const SyncTarget target = targetFor(s, ws.path());
    t.check(target.localRoot == fresh, "empty localPath should use the managed root");
    t.check(target.remoteRoot == QLatin1String("/"), "empty remotePath should be /");
}

void test_config_warnings_use_own_category(TestContext &t) {
    QTemporaryDir dir;
    // A regular file where the workspace should be: nothing can be created below it.
    const QString blocker = dir.filePath(QStringLiteral("not-a-dir"));
    t.check(writeLocal(blocker, "x"), "blocker file should be written");
    g_categories.clear();
    const QtMessageHandler previous = qInstallMessageHandler(captureCategory);
    const QString root = resolveManagedRoot(blocker);
    qInstallMessageHandler(previous);
    t.check(QFileInfo(root).absoluteFilePath() == QFileInfo(blocker).absoluteFilePath(),
            "an uncreatable managed root falls back to the workspace");
    t.check(g_categories.contains(QStringLiteral("sftpsync.config")),
            "configuration warnings should log under sftpsync.config");
    t.check(!g_categories.contains(QStringLiteral("sftpsync.engine")),
            "configuration warnings should not use the engine category");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_defaults_and_clamping(t);
    test_headless_host_key_default(t);
    test_load_from_ini(t);
    test_save_round_trip(t);
    test_managed_root(t);
    test_config_warnings_use_own_category(t);
    return finish(t, "sftpsync_settings_tests");
}
