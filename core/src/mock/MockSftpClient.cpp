#include "sftpsync/MockSftpClient.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <thread>

namespace sftpsync {

namespace {

std::string normalize(const std::string &p) {
    std::string out = p.empty() ? "/" : p;
    if (out.front() != '/')
        out.insert(out.begin(), '/');
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

std::string parentOf(const std::string &p) {
    const auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string &p) {
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

bool isUnder(const std::string &path, const std::string &dir) {
    if (dir == "/")
        return path != "/";
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

std::uint64_t nowSecs() { return static_cast<std::uint64_t>(std::time(nullptr)); }

// Tracks concurrent remote calls for the peak-concurrency counter.
struct OpScope {
    explicit OpScope(MockRemoteFs &fs) : fs_(fs) {
        const int cur = fs_.activeOps.fetch_add(1) + 1;
        int peak = fs_.peakOps.load();
        while (cur > peak && !fs_.peakOps.compare_exchange_weak(peak, cur)) {
        }
    }
    ~OpScope() { fs_.activeOps.fetch_sub(1); }
    MockRemoteFs &fs_;
};

bool dirExistsLocked(const MockRemoteFs &fs, const std::string &p) {
    if (p == "/")
        return true;
    auto it = fs.entries.find(p);
    return it != fs.entries.end() && it->second.is_dir;
}

} // namespace

void MockRemoteFs::writeFile(const std::string &path, const std::string &content,
                             std::uint64_t mtime) {
    const std::string p = normalize(path);
    makeDirs(parentOf(p));
    std::lock_guard<std::mutex> lk(mtx);
    entries[p] = Entry{content, mtime, false};
}

void MockRemoteFs::makeDirs(const std::string &path) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx);
    std::string cur;
    std::size_t pos = 1;
    while (pos <= p.size() && p != "/") {
        const auto next = p.find('/', pos);
        cur = p.substr(0, next == std::string::npos ? p.size() : next);
        auto &e = entries[cur];
        if (!e.is_dir && e.content.empty()) {
            e.is_dir = true;
            e.mtime = nowSecs();
        }
        if (next == std::string::npos)
            break;
        pos = next + 1;
    }
}

bool MockRemoteFs::readFile(const std::string &path, std::string &content) const {
    std::lock_guard<std::mutex> lk(mtx);
    auto it = entries.find(normalize(path));
    if (it == entries.end() || it->second.is_dir)
        return false;
    content = it->second.content;
    return true;
}

bool MockRemoteFs::exists(const std::string &path) const {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(mtx);
    return p == "/" || entries.count(p) > 0;
}

std::uint64_t MockRemoteFs::mtimeOf(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx);
    auto it = entries.find(normalize(path));
    return it == entries.end() ? 0 : it->second.mtime;
}

std::set<std::string> MockRemoteFs::paths() const {
    std::lock_guard<std::mutex> lk(mtx);
    std::set<std::string> out;
    for (const auto &kv : entries)
        out.insert(kv.first);
    return out;
}

MockSftpClient::MockSftpClient() : fs_(std::make_shared<MockRemoteFs>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    fs_->connectCalls.fetch_add(1);
    const int latency = fs_->latencyMs.load();
    if (latency > 0) {
        if (latency > opt.connect_timeout_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opt.connect_timeout_ms));
            err = "connect timed out";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(latency));
    }
    if (fs_->failConnects.load() > 0) {
        fs_->failConnects.fetch_sub(1);
        err = "Authentication failed (injected)";
        return false;
    }
    interrupted_.store(false);
    epoch_ = fs_->epoch.load();
    lastOpt_ = opt;
    connected_.store(true);
    return true;
}

void MockSftpClient::disconnect() { connected_.store(false); }

bool MockSftpClient::isConnected() const {
    return connected_.load() && !interrupted_.load() && epoch_ == fs_->epoch.load();
}

bool MockSftpClient::begin(const char *op, const std::string &path, std::string &err,
                           const CancelCB &shouldCancel) {
    if (!isConnected()) {
        connected_.store(false);
        err = "Not connected";
        return false;
    }
    int latency = fs_->latencyMs.load();
    if (latency > 0) {
        bool timedOut = false;
        if (latency > lastOpt_.operation_timeout_ms) {
            latency = lastOpt_.operation_timeout_ms;
            timedOut = true;
        }
        // Sleep in slices so interrupt() and cancellation stay prompt.
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(latency);
        while (std::chrono::steady_clock::now() < until) {
            if (interrupted_.load()) {
                err = "Connection interrupted";
                return false;
            }
            if (shouldCancel && shouldCancel()) {
                err = "Cancelled";
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (timedOut) {
            err = std::string(op) + ": operation timed out";
            return false;
        }
    }
    std::lock_guard<std::mutex> lk(fs_->mtx);
    if (fs_->failPaths.count(normalize(path)) > 0) {
        err = std::string(op) + " failed for " + path + " (injected)";
        return false;
    }
    auto it = fs_->failNext.find(op);
    if (it != fs_->failNext.end() && it->second > 0) {
        --it->second;
        err = std::string(op) + " failed (injected)";
        return false;
    }
    return true;
}

bool MockSftpClient::list(const std::string &remote_path, std::vector<FileInfo> &out,
                          std::string &err) {
    OpScope scope(*fs_);
    if (!begin("list", remote_path, err))
        return false;
    const std::string path = normalize(remote_path);

    std::lock_guard<std::mutex> lk(fs_->mtx);
    if (!dirExistsLocked(*fs_, path)) {
        err = "Remote path not found in mock: " + path;
        return false;
    }
    out.clear();
    for (const auto &kv : fs_->entries) {
        if (!isUnder(kv.first, path) || parentOf(kv.first) != path)
            continue;
        FileInfo fi;
        fi.name = baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.content.size();
        fi.mtime = kv.second.mtime;
        fi.mode = kv.second.is_dir ? 0040755 : 0100644;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // dirs first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, FileInfo &info,
                          std::string &err) {
    OpScope scope(*fs_);
    if (!begin("stat", remote_path, err))
        return false;
    const std::string path = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx);
    if (path == "/") {
        info = FileInfo{"/", true, 0, 0, 0040755};
        return true;
    }
    auto it = fs_->entries.find(path);
    if (it == fs_->entries.end()) {
        err.clear();
        return false;
    }
    info.name = baseName(path);
    info.is_dir = it->second.is_dir;
    info.size = it->second.content.size();
    info.mtime = it->second.mtime;
    info.mode = it->second.is_dir ? 0040755 : 0100644;
    return true;
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         std::string &err, ProgressCB progress, CancelCB shouldCancel) {
    OpScope scope(*fs_);
    fs_->getCalls.fetch_add(1);
    if (!begin("get", remote, err, shouldCancel))
        return false;
    std::string content;
    if (!fs_->readFile(remote, content)) {
        err = "No such file: " + remote;
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing";
        return false;
    }
    const bool wrote =
        content.empty() || std::fwrite(content.data(), 1, content.size(), lf) == content.size();
    const bool closed = std::fclose(lf) == 0;
    if (!wrote || !closed) {
        err = "Local write failed";
        return false;
    }
    if (progress)
        progress(content.size(), content.size());
    return true;
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         std::string &err, ProgressCB progress, CancelCB shouldCancel) {
    OpScope scope(*fs_);
    fs_->putCalls.fetch_add(1);
    if (!begin("put", remote, err, shouldCancel))
        return false;
    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    std::string content;
    char buf[8192];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), lf)) > 0)
        content.append(buf, n);
    const bool readOk = !std::ferror(lf);
    std::fclose(lf);
    if (!readOk) {
        err = "Local read failed";
        return false;
    }

    const std::string path = normalize(remote);
    std::lock_guard<std::mutex> lk(fs_->mtx);
    if (!dirExistsLocked(*fs_, parentOf(path))) {
        err = "No such directory: " + parentOf(path);
        return false;
    }
    auto it = fs_->entries.find(path);
    if (it != fs_->entries.end() && it->second.is_dir) {
        err = "Is a directory: " + path;
        return false;
    }
    fs_->entries[path] = MockRemoteFs::Entry{content, nowSecs(), false};
    if (progress)
        progress(content.size(), content.size());
    return true;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, std::string &err, unsigned int) {
    OpScope scope(*fs_);
    if (!begin("mkdir", remote_dir, err))
        return false;
    const std::string path = normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx);
    if (path == "/" || fs_->entries.count(path) > 0) {
        err = "File exists: " + path;
        return false;
    }
    if (!dirExistsLocked(*fs_, parentOf(path))) {
        err = "No such directory: " + parentOf(path);
        return false;
    }
    fs_->entries[path] = MockRemoteFs::Entry{{}, nowSecs(), true};
    return true;
}

bool MockSftpClient::removeFile(const std::string &remote_path, std::string &err) {
    OpScope scope(*fs_);
    fs_->removeCalls.fetch_add(1);
    if (!begin("remove", remote_path, err))
        return false;
    const std::string path = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx);
    auto it = fs_->entries.find(path);
    if (it == fs_->entries.end()) {
        err = "No such file: " + path;
        return false;
    }
    if (it->second.is_dir) {
        err = "Is a directory: " + path;
        return false;
    }
    fs_->entries.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string &from, const std::string &to,
                            std::string &err, bool overwrite) {
    OpScope scope(*fs_);
    fs_->renameCalls.fetch_add(1);
    if (!begin("rename", from, err))
        return false;
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx);
    auto it = fs_->entries.find(src);
    if (it == fs_->entries.end()) {
        err = "No such file: " + src;
        return false;
    }
    if (!dirExistsLocked(*fs_, parentOf(dst))) {
        err = "No such directory: " + parentOf(dst);
        return false;
    }
    if (fs_->entries.count(dst) > 0 && !overwrite) {
        err = "File exists: " + dst;
        return false;
    }
    const MockRemoteFs::Entry moved = it->second;
    fs_->entries.erase(it);
    fs_->entries[dst] = moved;
    if (moved.is_dir) {
        std::vector<std::pair<std::string, MockRemoteFs::Entry>> children;
        for (auto c = fs_->entries.begin(); c != fs_->entries.end();) {
            if (isUnder(c->first, src)) {
                children.emplace_back(dst + c->first.substr(src.size()), c->second);
                c = fs_->entries.erase(c);
            } else {
                ++c;
            }
        }
        for (auto &c : children)
            fs_->entries[c.first] = c.second;
    }
    return true;
}

bool MockSftpClient::setTimes(const std::string &remote_path, std::uint64_t,
                              std::uint64_t mtime, std::string &err) {
    OpScope scope(*fs_);
    if (!begin("setTimes", remote_path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx);
    auto it = fs_->entries.find(normalize(remote_path));
    if (it == fs_->entries.end()) {
        err = "No such file: " + remote_path;
        return false;
    }
    it->second.mtime = mtime;
    return true;
}

bool MockSftpClient::exec(const std::string &command, const ExecOutputCB &onStdout,
                          const ExecOutputCB &onStderr, int &exitCode, std::string &err,
                          CancelCB shouldCancel) {
    OpScope scope(*fs_);
    fs_->execCalls.fetch_add(1);
    exitCode = -1;
    if (!begin("exec", std::string(), err, shouldCancel))
        return false;

    const auto sp = command.find(' ');
    const std::string verb = command.substr(0, sp);
    const std::string arg = sp == std::string::npos ? std::string() : command.substr(sp + 1);
    if (verb == "echo") {
        if (onStdout)
            onStdout(arg + "\n");
        exitCode = 0;
    } else if (verb == "exit") {
        exitCode = arg.empty() ? 0 : std::atoi(arg.c_str());
    } else if (verb == "fail") {
        if (onStderr)
            onStderr(arg + "\n");
        exitCode = 1;
    } else if (verb == "sleep") {
        const auto until = std::chrono::steady_clock::now() +
                           std::chrono::milliseconds(std::atoi(arg.c_str()));
        while (std::chrono::steady_clock::now() < until) {
            if (interrupted_.load()) {
                err = "Connection interrupted";
                return false;
            }
            if (shouldCancel && shouldCancel()) {
                err = "Cancelled";
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        exitCode = 0;
    } else {
        if (onStderr)
            onStderr(verb + ": command not found\n");
        exitCode = 127;
    }
    return true;
}

} // namespace sftpsync
