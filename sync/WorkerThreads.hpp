// Named std::thread set. Each owner keeps one and joins its workers before it
// goes away; a finished worker is reaped the next time its id is reused or on
// joinAll().
#pragma once
#include <QtGlobal>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

class WorkerThreads {
public:
    WorkerThreads() = default;
    ~WorkerThreads() { joinAll(); }
    WorkerThreads(const WorkerThreads &) = delete;
    WorkerThreads &operator=(const WorkerThreads &) = delete;

    void launch(quint64 id, std::function<void()> fn);
    // Joins one worker if it exists. Must not be called from that worker.
    void join(quint64 id);
    void joinAll();
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<quint64, std::thread> workers_;
};
