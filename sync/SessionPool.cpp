#include "SessionPool.hpp"
#include <chrono>

SessionLease::SessionLease(std::shared_ptr<SessionPool> pool,
                           std::shared_ptr<sftpsync::SftpClient> client,
                           quint64 generation)
    : pool_(std::move(pool)), client_(std::move(client)), generation_(generation) {}

SessionLease::SessionLease(SessionLease &&other) noexcept
    : pool_(std::move(other.pool_)), client_(std::move(other.client_)),
      generation_(other.generation_) {}

SessionLease &SessionLease::operator=(SessionLease &&other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::move(other.pool_);
        client_ = std::move(other.client_);
        generation_ = other.generation_;
    }
    return *this;
}

SessionLease::~SessionLease() { release(); }

void SessionLease::release() {
    if (pool_ && client_)
        pool_->giveBack(std::move(client_), generation_);
    pool_.reset();
    client_.reset();
}

SessionPool::SessionPool(sftpsync::ClientFactory factory, int capacity)
    : factory_(std::move(factory)), capacity_(capacity < 1 ? 1 : capacity) {}

void SessionPool::install(std::shared_ptr<sftpsync::SftpClient> client,
                          const sftpsync::SessionOptions &opt) {
    std::lock_guard<std::mutex> lk(mtx_);
    opt_ = opt;
    installed_ = true;
    if (client)
        idle_.push_back(std::move(client));
    cv_.notify_all();
}

void SessionPool::reset() {
    std::vector<std::shared_ptr<sftpsync::SftpClient>> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++generation_;
        installed_ = false;
        // Leased connections are owned by workers; interrupt() is the only call
        // that is safe from here and it makes their current operation fail fast.
        for (const auto &c : leased_)
            c->interrupt();
        idle.swap(idle_);
    }
    cv_.notify_all();
    for (auto &c : idle)
        c->disconnect();
}

void SessionPool::setCapacity(int capacity) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        capacity_ = capacity < 1 ? 1 : capacity;
    }
    cv_.notify_all();
}

int SessionPool::capacity() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return capacity_;
}

SessionLease SessionPool::acquire(std::string &err, int timeoutMs) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        if (!installed_) {
            err = "Not connected";
            return {};
        }
        while (!idle_.empty()) {
            auto c = idle_.back();
            idle_.pop_back();
            if (c->isConnected()) {
                leased_.insert(c);
                return SessionLease(shared_from_this(), c, generation_);
            }
            c->disconnect();
        }
        const int open = static_cast<int>(leased_.size()) + opening_;
        if (open < capacity_) {
            ++opening_;
            const quint64 gen = generation_;
            const sftpsync::SessionOptions opt = opt_;
            lk.unlock();
            std::shared_ptr<sftpsync::SftpClient> c(factory_ ? factory_() : nullptr);
            bool ok = false;
            if (!c)
                err = "No transport available";
            else
                ok = c->connect(opt, err);
            lk.lock();
            --opening_;
            if (!ok) {
                cv_.notify_all();
                return {};
            }
            if (gen != generation_ || !installed_) {
                lk.unlock();
                c->disconnect();
                err = "Session was reset";
                cv_.notify_all();
                return {};
            }
            leased_.insert(c);
            return SessionLease(shared_from_this(), c, gen);
        }
        if (cv_.wait_until(lk, deadline) == std::cv_status::timeout) {
            err = "Timed out waiting for a free connection";
            return {};
        }
    }
}

SessionLease SessionPool::tryAcquireIdle() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!installed_)
        return {};
    while (!idle_.empty()) {
        auto c = idle_.back();
        idle_.pop_back();
        if (c->isConnected()) {
            leased_.insert(c);
            return SessionLease(shared_from_this(), c, generation_);
        }
        c->disconnect();
    }
    return {};
}

bool SessionPool::hasLiveConnection() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!installed_)
        return false;
    for (const auto &c : idle_) {
        if (c->isConnected())
            return true;
    }
    for (const auto &c : leased_) {
        if (c->isConnected())
            return true;
    }
    return false;
}

bool SessionPool::installed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return installed_;
}

int SessionPool::openConnections() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(idle_.size() + leased_.size()) + opening_;
}

void SessionPool::setConnectionLostHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(mtx_);
    onLost_ = std::move(handler);
}

void SessionPool::giveBack(std::shared_ptr<sftpsync::SftpClient> client,
                           quint64 generation) {
    bool lost = false;
    std::function<void()> onLost;
    bool dead = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        leased_.erase(client);
        if (generation == generation_ && installed_ && client->isConnected()) {
            idle_.push_back(client);
        } else {
            dead = true;
            if (generation == generation_ && installed_) {
                lost = true;
                for (const auto &c : idle_)
                    lost = lost && !c->isConnected();
                for (const auto &c : leased_)
                    lost = lost && !c->isConnected();
                onLost = onLost_;
            }
        }
    }
    cv_.notify_one();
    if (dead)
        client->disconnect();
    if (lost && onLost)
        onLost();
}
