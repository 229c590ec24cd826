#include "SyncSettings.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSettings>
#include <algorithm>
Q_LOGGING_CATEGORY(ssConfig, "sftpsync.config")

namespace {

const char *kStateDir = ".sftpsync";
const char *kManagedRootFile = ".managed-root.json";

QStringList readList(QSettings &s, const QString &key, const QStringList &def) {
    if (!s.contains(key))
        return def;
    const QVariant v = s.value(key);
    QStringList raw = v.toStringList();
    // INI values written by hand come back as one comma separated string.
    if (raw.size() == 1 && raw.front().contains(QLatin1Char(',')))
        raw = raw.front().split(QLatin1Char(','));
    QStringList out;
    for (const QString &item : raw) {
        const QString t = item.trimmed();
        if (!t.isEmpty())
            out << t;
    }
    return out;
}

sftpsync::KnownHostsPolicy parsePolicy(const QString &v) {
    const QString p = v.trimmed().toLower();
    if (p == QLatin1String("strict"))
        return sftpsync::KnownHostsPolicy::Strict;
    if (p == QLatin1String("off") || p == QLatin1String("none"))
        return sftpsync::KnownHostsPolicy::Off;
    return sftpsync::KnownHostsPolicy::AcceptNew;
}

QString policyName(sftpsync::KnownHostsPolicy p) {
    switch (p) {
    case sftpsync::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case sftpsync::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    case sftpsync::KnownHostsPolicy::AcceptNew:
        break;
    }
    return QStringLiteral("acceptNew");
}

} // namespace

SyncSettings loadSyncSettings(QSettings &s) {
    SyncSettings cfg;
    cfg.enabled = s.value("Sync/enabled", cfg.enabled).toBool();
    cfg.autoSync = s.value("Sync/autoSync", cfg.autoSync).toBool();
    cfg.host = s.value("Sync/host").toString().trimmed();
    cfg.port = static_cast<quint16>(s.value("Sync/port", 22).toUInt());
    cfg.username = s.value("Sync/username").toString().trimmed();
    cfg.password = s.value("Sync/password").toString();
    cfg.privateKeyPath = expandHome(s.value("Sync/privateKeyPath").toString().trimmed());
    cfg.remotePath = s.value("Sync/remotePath").toString().trimmed();
    cfg.localPath = expandHome(s.value("Sync/localPath").toString().trimmed());
    cfg.exclusions = readList(s, "Sync/exclusions", cfg.exclusions);
    cfg.includes = readList(s, "Sync/includes", cfg.includes);
    cfg.syncMode = s.value("Sync/syncMode", "mirror").toString().trimmed().toLower() ==
                           QLatin1String("selective")
                       ? SyncMode::Selective
                       : SyncMode::Mirror;
    cfg.maxConcurrency = s.value("Sync/maxConcurrency", cfg.maxConcurrency).toInt();
    cfg.maxRetries = s.value("Sync/maxRetries", cfg.maxRetries).toInt();
    cfg.connectTimeoutMs = s.value("Sync/connectTimeoutMs", cfg.connectTimeoutMs).toInt();
    cfg.operationTimeoutMs =
        s.value("Sync/operationTimeoutMs", cfg.operationTimeoutMs).toInt();
    cfg.knownHostsPolicy = parsePolicy(s.value("Sync/knownHostsPolicy").toString());
    cfg.knownHostsPath = expandHome(s.value("Sync/knownHostsPath").toString().trimmed());
    clampSyncSettings(cfg);
    return cfg;
}

void saveSyncSettings(QSettings &s, const SyncSettings &cfg) {
    s.setValue("Sync/enabled", cfg.enabled);
    s.setValue("Sync/autoSync", cfg.autoSync);
    s.setValue("Sync/host", cfg.host);
    s.setValue("Sync/port", cfg.port);
    s.setValue("Sync/username", cfg.username);
    if (!cfg.password.isEmpty())
        s.setValue("Sync/password", cfg.password);
    s.setValue("Sync/privateKeyPath", cfg.privateKeyPath);
    s.setValue("Sync/remotePath", cfg.remotePath);
    s.setValue("Sync/localPath", cfg.localPath);
    s.setValue("Sync/exclusions", cfg.exclusions);
    s.setValue("Sync/includes", cfg.includes);
    s.setValue("Sync/syncMode",
               cfg.syncMode == SyncMode::Selective ? "selective" : "mirror");
    s.setValue("Sync/maxConcurrency", cfg.maxConcurrency);
    s.setValue("Sync/maxRetries", cfg.maxRetries);
    s.setValue("Sync/connectTimeoutMs", cfg.connectTimeoutMs);
    s.setValue("Sync/operationTimeoutMs", cfg.operationTimeoutMs);
    s.setValue("Sync/knownHostsPolicy", policyName(cfg.knownHostsPolicy));
    s.setValue("Sync/knownHostsPath", cfg.knownHostsPath);
}

void clampSyncSettings(SyncSettings &cfg) {
    cfg.maxConcurrency = std::clamp(cfg.maxConcurrency, 1, 10);
    cfg.maxRetries = std::clamp(cfg.maxRetries, 0, 10);
    cfg.connectTimeoutMs = std::max(1000, cfg.connectTimeoutMs);
    cfg.operationTimeoutMs = std::max(1000, cfg.operationTimeoutMs);
    if (cfg.port == 0)
        cfg.port = 22;
    if (cfg.includes.isEmpty())
        cfg.includes << QStringLiteral("**/*");
}

QString expandHome(const QString &path) {
    if (path == QLatin1String("~"))
        return QDir::homePath();
    if (path.startsWith(QLatin1String("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

QString resolveManagedRoot(const QString &workspaceDir) {
    QDir ws(workspaceDir);
    const QString stateDir = ws.filePath(QLatin1String(kStateDir));
    const QString recordPath = QDir(stateDir).filePath(QLatin1String(kManagedRootFile));

    QFile record(recordPath);
    if (record.open(QIODevice::ReadOnly)) {
        const QJsonDocument doc = QJsonDocument::fromJson(record.readAll());
        const QString name = doc.object().value(QStringLiteral("folder")).toString();
        record.close();
        // Only a plain folder name is trusted; anything else is rewritten.
        if (!name.isEmpty() && !name.contains(QLatin1Char('/')) &&
            !name.contains(QLatin1String(".."))) {
            const QString root = QDir(QDir(stateDir).filePath(name)).absolutePath();
            if (QDir().mkpath(root))
                return root;
        }
    }

    const QString name = QStringLiteral("Sync_%1").arg(
        QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss")));
    const QString root = QDir(QDir(stateDir).filePath(name)).absolutePath();
    if (!QDir().mkpath(root)) {
        qCWarning(ssConfig) << "could not create managed root" << root
                            << "- using the workspace directory";
        return ws.absolutePath();
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("folder"), name);
    QFile out(recordPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
        out.write(QJsonDocument(obj).toJson(QJsonDocument::Compact)) < 0) {
        qCWarning(ssConfig) << "could not persist managed root record" << recordPath;
    }
    return root;
}

SyncTarget targetFor(const SyncSettings &cfg, const QString &workspaceDir) {
    SyncTarget t;
    t.host = cfg.host;
    t.port = cfg.port;
    t.username = cfg.username;
    t.password = cfg.password;
    t.privateKeyPath = cfg.privateKeyPath;
    QString remote = cfg.remotePath.isEmpty() ? QStringLiteral("/") : cfg.remotePath;
    while (remote.size() > 1 && remote.endsWith(QLatin1Char('/')))
        remote.chop(1);
    t.remoteRoot = remote;
    t.localRoot = cfg.localPath.isEmpty() ? resolveManagedRoot(workspaceDir)
                                          : QDir(cfg.localPath).absolutePath();
    return t;
}

sftpsync::SessionOptions sessionOptionsFor(const SyncTarget &target, const SyncSettings &cfg) {
    sftpsync::SessionOptions opt;
    opt.host = target.host.toStdString();
    opt.port = target.port;
    opt.username = target.username.toStdString();
    if (!target.privateKeyPath.isEmpty())
        opt.private_key_path = target.privateKeyPath.toStdString();
    // Key first; the password is the fallback when the key is refused.
    if (!target.password.isEmpty())
        opt.password = target.password.toStdString();
    if (!cfg.knownHostsPath.isEmpty())
        opt.known_hosts_path = cfg.knownHostsPath.toStdString();
    opt.known_hosts_policy = cfg.knownHostsPolicy;
    opt.connect_timeout_ms = cfg.connectTimeoutMs;
    opt.operation_timeout_ms = cfg.operationTimeoutMs;
    return opt;
}
