#include "WorkerThreads.hpp"

void WorkerThreads::launch(quint64 id, std::function<void()> fn) {
    join(id);
    std::lock_guard<std::mutex> lk(mtx_);
    workers_[id] = std::thread(std::move(fn));
}

void WorkerThreads::join(quint64 id) {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = workers_.find(id);
        if (it == workers_.end())
            return;
        t = std::move(it->second);
        workers_.erase(it);
    }
    if (t.joinable() && t.get_id() != std::this_thread::get_id())
        t.join();
    else if (t.joinable())
        t.detach();
}

void WorkerThreads::joinAll() {
    std::unordered_map<quint64, std::thread> toJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        toJoin.swap(workers_);
    }
    for (auto &kv : toJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
}

std::size_t WorkerThreads::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return workers_.size();
}
