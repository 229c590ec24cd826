// Keyed set of ConnectionManagers, one per SyncTarget::key(). Owned by the
// application and handed to the engines that need it.
#pragma once
#include "ConnectionManager.hpp"
#include <QHash>
#include <QString>
#include <memory>

class ConnectionRegistry {
public:
    explicit ConnectionRegistry(sftpsync::ClientFactory factory);
    ~ConnectionRegistry();
    ConnectionRegistry(const ConnectionRegistry &) = delete;
    ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

    // Existing manager for the target key (with refreshed settings) or a new one.
    std::shared_ptr<ConnectionManager> getOrCreate(const SyncTarget &target,
                                                   const SyncSettings &settings);
    std::shared_ptr<ConnectionManager> find(const QString &key) const;
    // Disposes and forgets the manager.
    void remove(const QString &key);
    void clear();
    int size() const { return managers_.size(); }

private:
    sftpsync::ClientFactory factory_;
    QHash<QString, std::shared_ptr<ConnectionManager>> managers_;
};
