#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>
#include <vector>

// Forward declarations of the internal libssh2 types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sftpsync {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }
    void interrupt() override;

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
    bool exec(const std::string &command, const ExecOutputCB &onStdout,
              const ExecOutputCB &onStderr, int &exitCode, std::string &err,
              CancelCB shouldCancel = {}) override;

private:
    std::atomic<bool> connected_{false};
    std::atomic<int> sock_{-1};
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;
    int operationTimeoutMs_ = 30000;

    bool tcpConnect(const std::string &host, uint16_t port, int timeoutMs,
                    std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool tryAgentAuth(const SessionOptions &opt);
    // Builds an error message from the last libssh2 error and drops the
    // connection when the socket is gone.
    std::string failure(const std::string &what);
    bool waitSocket(int timeoutMs);
};

} // namespace sftpsync
