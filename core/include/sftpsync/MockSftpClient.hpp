// In-memory transport used by the tests. Every client built on the same
// MockRemoteFs sees the same remote tree, so a pool of mock connections behaves
// like several sessions against one server.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sftpsync {

struct MockRemoteFs {
    struct Entry {
        std::string content;
        std::uint64_t mtime = 0;
        bool is_dir = false;
    };

    // Seeds a file (parents are created as needed).
    void writeFile(const std::string &path, const std::string &content,
                   std::uint64_t mtime);
    void makeDirs(const std::string &path);
    bool readFile(const std::string &path, std::string &content) const;
    bool exists(const std::string &path) const;
    std::uint64_t mtimeOf(const std::string &path) const;
    std::set<std::string> paths() const;

    // Breaks every live connection as if the server went away.
    void dropConnections() { epoch.fetch_add(1); }

    // Fault injection
    std::atomic<int> failConnects{0};    // next N connects fail
    std::atomic<int> latencyMs{0};       // added to every remote call
    std::map<std::string, int> failNext; // op name -> remaining failures
    std::set<std::string> failPaths;     // every op touching these fails

    // Counters
    std::atomic<int> connectCalls{0};
    std::atomic<int> putCalls{0};
    std::atomic<int> getCalls{0};
    std::atomic<int> renameCalls{0};
    std::atomic<int> removeCalls{0};
    std::atomic<int> execCalls{0};
    std::atomic<int> activeOps{0};
    std::atomic<int> peakOps{0};
    std::atomic<int> epoch{0};

    mutable std::mutex mtx;
    std::map<std::string, Entry> entries; // absolute paths, "/" is implicit
};

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override;
    void interrupt() override { interrupted_.store(true); }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              std::string &err) override;
    bool stat(const std::string &remote_path, FileInfo &info,
              std::string &err) override;
    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;
    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;
    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode = 0755) override;
    bool removeFile(const std::string &remote_path, std::string &err) override;
    bool rename(const std::string &from, const std::string &to,
                std::string &err, bool overwrite = false) override;
    bool setTimes(const std::string &remote_path, std::uint64_t atime,
                  std::uint64_t mtime, std::string &err) override;
    // Understands "echo <text>", "exit <code>", "sleep <ms>" and
    // "fail <text>" (stderr, exit 1).
    bool exec(const std::string &command, const ExecOutputCB &onStdout,
              const ExecOutputCB &onStderr, int &exitCode, std::string &err,
              CancelCB shouldCancel = {}) override;

    const SessionOptions &lastOptions() const { return lastOpt_; }
    std::shared_ptr<MockRemoteFs> remoteFs() const { return fs_; }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    int epoch_ = 0;
    SessionOptions lastOpt_{};

    // Common prologue: connection check, latency, injected failures.
    bool begin(const char *op, const std::string &path, std::string &err,
               const CancelCB &shouldCancel = {});
};

} // namespace sftpsync
