#include "ConnectionRegistry.hpp"

ConnectionRegistry::ConnectionRegistry(sftpsync::ClientFactory factory)
    : factory_(std::move(factory)) {}

ConnectionRegistry::~ConnectionRegistry() { clear(); }

std::shared_ptr<ConnectionManager> ConnectionRegistry::getOrCreate(const SyncTarget &target,
                                                                   const SyncSettings &settings) {
    const QString key = target.key();
    auto existing = managers_.value(key);
    if (existing) {
        existing->updateSettings(settings);
        return existing;
    }
    auto manager = std::make_shared<ConnectionManager>(target, settings, factory_);
    managers_.insert(key, manager);
    return manager;
}

std::shared_ptr<ConnectionManager> ConnectionRegistry::find(const QString &key) const {
    return managers_.value(key);
}

void ConnectionRegistry::remove(const QString &key) {
    auto manager = managers_.take(key);
    if (manager)
        manager->dispose();
}

void ConnectionRegistry::clear() {
    const auto all = managers_;
    managers_.clear();
    for (const auto &m : all)
        m->dispose();
}
