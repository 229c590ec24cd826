// Bounded set of live transport connections for one target. libssh2 sessions
// are not thread-safe, so every worker leases a connection for the duration of
// one remote operation and hands it back afterwards.
#pragma once
#include "sftpsync/SftpClient.hpp"
#include <QtGlobal>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class SessionPool;

// Leased connection. Returns to the pool on destruction, or is dropped if it
// went dead or the pool was reset while it was out.
class SessionLease {
public:
    SessionLease() = default;
    SessionLease(SessionLease &&other) noexcept;
    SessionLease &operator=(SessionLease &&other) noexcept;
    SessionLease(const SessionLease &) = delete;
    SessionLease &operator=(const SessionLease &) = delete;
    ~SessionLease();

    explicit operator bool() const { return static_cast<bool>(client_); }
    sftpsync::SftpClient *operator->() const { return client_.get(); }
    sftpsync::SftpClient &operator*() const { return *client_; }
    void release();

private:
    friend class SessionPool;
    SessionLease(std::shared_ptr<SessionPool> pool,
                 std::shared_ptr<sftpsync::SftpClient> client, quint64 generation);

    std::shared_ptr<SessionPool> pool_;
    std::shared_ptr<sftpsync::SftpClient> client_;
    quint64 generation_ = 0;
};

class SessionPool : public std::enable_shared_from_this<SessionPool> {
public:
    SessionPool(sftpsync::ClientFactory factory, int capacity);

    // Seeds the pool with the connection made by the connect attempt and the
    // options used to open further ones.
    void install(std::shared_ptr<sftpsync::SftpClient> client,
                 const sftpsync::SessionOptions &opt);
    // Interrupts and drops every connection; outstanding leases die on return.
    void reset();
    void setCapacity(int capacity);
    int capacity() const;

    // Blocks until a connection is free or a new one may be opened. Fails when
    // the pool is not installed, the wait exceeds timeoutMs or the connect fails.
    SessionLease acquire(std::string &err, int timeoutMs);
    // Non-blocking: an idle connection or nothing.
    SessionLease tryAcquireIdle();

    bool hasLiveConnection() const;
    bool installed() const;
    int openConnections() const;

    // Called (on the releasing thread) when a leased connection came back dead
    // and no live connection remains.
    void setConnectionLostHandler(std::function<void()> handler);

private:
    friend class SessionLease;
    void giveBack(std::shared_ptr<sftpsync::SftpClient> client, quint64 generation);

    sftpsync::ClientFactory factory_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    int capacity_ = 4;
    bool installed_ = false;
    quint64 generation_ = 0;
    sftpsync::SessionOptions opt_;
    std::vector<std::shared_ptr<sftpsync::SftpClient>> idle_;
    std::set<std::shared_ptr<sftpsync::SftpClient>> leased_;
    int opening_ = 0; // connects in progress outside the lock
    std::function<void()> onLost_;
};
