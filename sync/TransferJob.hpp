// Unit of work scheduled by TransferQueue.
#pragma once
#include <QString>
#include <atomic>
#include <functional>
#include <memory>

// Cooperative cancellation flag shared between the queue and a running action.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }
    // Adapter for SftpClient::CancelCB.
    std::function<bool()> callback() const {
        auto f = flag_;
        return [f]() { return f->load(); };
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

enum class TransferJobType { Upload, Download, Delete, CreateDir, Rename };

inline const char *transferJobTypeName(TransferJobType t) {
    switch (t) {
    case TransferJobType::Upload:
        return "UPLOAD";
    case TransferJobType::Download:
        return "DOWNLOAD";
    case TransferJobType::Delete:
        return "DELETE";
    case TransferJobType::CreateDir:
        return "MKDIR";
    case TransferJobType::Rename:
        return "RENAME";
    }
    return "UNKNOWN";
}

// Dispatch order: High before Normal before Low.
enum class TransferPriority { High = 0, Normal = 1, Low = 2 };

struct TransferJob {
    quint64 id = 0;   // assigned by the queue on enqueue
    QString dedupKey; // "<TYPE>:<remote path>"
    TransferJobType type = TransferJobType::Upload;
    QString localPath;
    QString remotePath;
    QString tempRemotePath;
    QString tempLocalPath;
    QString fromLocalPath;  // Rename only
    QString fromRemotePath; // Rename only
    TransferPriority priority = TransferPriority::Normal;
    int retries = 0;
    int maxRetries = 3;
    CancelToken cancel;
    quint64 seq = 0; // enqueue order, renewed on retry

    // Runs on a worker thread. Returns false with err set on failure; a
    // cancelled job should return false after checking the token.
    std::function<bool(const CancelToken &, QString &err)> action;
};

using TransferJobPtr = std::shared_ptr<TransferJob>;

inline QString makeDedupKey(TransferJobType type, const QString &remotePath) {
    return QStringLiteral("%1:%2").arg(QLatin1String(transferJobTypeName(type)), remotePath);
}

struct QueueSnapshot {
    int pending = 0;
    int inflight = 0;
    int total = 0;
};
