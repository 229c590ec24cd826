// Sync configuration: model, QSettings loader, clamping and target resolution.
#pragma once
#include "SyncTypes.hpp"
#include "sftpsync/SftpTypes.hpp"
#include <QString>
#include <QStringList>

class QSettings;

struct SyncSettings {
    bool enabled = true;
    bool autoSync = true;

    QString host;
    quint16 port = 22;
    QString username;
    QString password;
    QString privateKeyPath; // "~" is expanded on load

    QString remotePath;
    QString localPath; // empty: managed root under the workspace

    QStringList exclusions;
    QStringList includes{QStringLiteral("**/*")};
    SyncMode syncMode = SyncMode::Mirror;

    int maxConcurrency = 3;      // 1..10
    int maxRetries = 3;          // 0..10
    int connectTimeoutMs = 20000;   // >= 1000
    int operationTimeoutMs = 30000; // >= 1000

    sftpsync::KnownHostsPolicy knownHostsPolicy = sftpsync::KnownHostsPolicy::AcceptNew;
    QString knownHostsPath;
};

// Reads the "Sync/..." keys. Missing keys keep their defaults; the result is
// already clamped.
SyncSettings loadSyncSettings(QSettings &s);
void saveSyncSettings(QSettings &s, const SyncSettings &cfg);
void clampSyncSettings(SyncSettings &cfg);

QString expandHome(const QString &path);

// Local root used when no localPath is configured:
// <workspace>/.sftpsync/Sync_<yyyyMMdd_HHmmss>, remembered in
// <workspace>/.sftpsync/.managed-root.json. Falls back to the workspace itself.
QString resolveManagedRoot(const QString &workspaceDir);

SyncTarget targetFor(const SyncSettings &cfg, const QString &workspaceDir);
sftpsync::SessionOptions sessionOptionsFor(const SyncTarget &target, const SyncSettings &cfg);
