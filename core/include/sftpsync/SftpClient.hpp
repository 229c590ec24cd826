// Abstract interface for remote session operations. Concrete transports
// (libssh2, mock) implement this API so the sync runtime stays decoupled from
// the backend. One object equals one connection; objects are not thread-safe
// except for interrupt().
#pragma once
#include "SftpTypes.hpp"
#include <functional>
#include <memory>

namespace sftpsync {

class SftpClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Unblocks in-flight I/O from another thread. The connection is unusable
    // afterwards.
    virtual void interrupt() = 0;

    // Remote directory listing ("." and ".." are skipped)
    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out,
                      std::string &err) = 0;

    // Metadata. Returns false with an EMPTY err when the path does not exist.
    virtual bool stat(const std::string &remote_path,
                      FileInfo &info,
                      std::string &err) = 0;

    // Download remote file to local (create/truncate).
    virtual bool get(const std::string &remote,
                     const std::string &local,
                     std::string &err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Upload local file to remote (create/truncate).
    virtual bool put(const std::string &local,
                     const std::string &remote,
                     std::string &err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    virtual bool mkdir(const std::string &remote_dir,
                       std::string &err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            std::string &err) = 0;

    virtual bool rename(const std::string &from,
                        const std::string &to,
                        std::string &err,
                        bool overwrite = false) = 0;

    // Adjust remote atime/mtime if the server allows it
    virtual bool setTimes(const std::string &remote_path,
                          std::uint64_t atime,
                          std::uint64_t mtime,
                          std::string &err) = 0;

    // Run a command on the remote host, streaming its output. exitCode is -1
    // when the server did not report one.
    virtual bool exec(const std::string &command,
                      const ExecOutputCB &onStdout,
                      const ExecOutputCB &onStderr,
                      int &exitCode,
                      std::string &err,
                      CancelCB shouldCancel = {}) = 0;
};

// Creates a fresh, unconnected client of the configured transport.
using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;

} // namespace sftpsync
