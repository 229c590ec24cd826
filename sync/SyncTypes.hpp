// Value types shared by the connection manager, the queue and the engine.
#pragma once
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <cstdint>

// Everything needed to reach one remote tree. Its key() identifies the
// ConnectionManager that serves it.
struct SyncTarget {
    QString host;
    quint16 port = 22;
    QString username;
    QString password;       // empty when a key is used
    QString privateKeyPath; // empty when a password is used
    QString remoteRoot;
    QString localRoot;

    QString key() const {
        return QStringLiteral("%1@%2:%3:%4").arg(username, host).arg(port).arg(remoteRoot);
    }
};

enum class ConnectionState { Disconnected, Connecting, Connected, Syncing, Error };

inline const char *connectionStateName(ConnectionState s) {
    switch (s) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Syncing:
        return "Syncing";
    case ConnectionState::Error:
        return "Error";
    }
    return "Unknown";
}

// Last known-good size/mtime of a path.
struct SyncSignature {
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // epoch seconds
};

// Filesystems and servers round mtimes differently; two seconds of slack.
inline bool sameSignature(const SyncSignature &a, const SyncSignature &b) {
    if (a.size != b.size)
        return false;
    const std::uint64_t d = a.mtime > b.mtime ? a.mtime - b.mtime : b.mtime - a.mtime;
    return d <= 2;
}

enum class PendingChangeType { Upsert, Delete };

struct ConflictArtifact {
    QString sourcePath;
    QString localArtifactPath;
    QString remoteArtifactPath;
    QDateTime detectedAt;
};

enum class FileSyncStatus { None, Synced, Modified, Pending, Error };

inline const char *fileSyncStatusName(FileSyncStatus s) {
    switch (s) {
    case FileSyncStatus::None:
        return "None";
    case FileSyncStatus::Synced:
        return "Synced";
    case FileSyncStatus::Modified:
        return "Modified";
    case FileSyncStatus::Pending:
        return "Pending";
    case FileSyncStatus::Error:
        return "Error";
    }
    return "Unknown";
}

enum class SyncDirection { Push, Pull };

// mirror: everything not excluded. selective: pushes must also match an include.
enum class SyncMode { Mirror, Selective };

Q_DECLARE_METATYPE(ConnectionState)
Q_DECLARE_METATYPE(FileSyncStatus)
Q_DECLARE_METATYPE(ConflictArtifact)
Q_DECLARE_METATYPE(SyncDirection)
