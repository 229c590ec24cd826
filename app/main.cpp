// sftpsync command line front end: one-shot push/pull runs, remote exec and a
// watch mode fed with change events on stdin.
#include "ConnectionRegistry.hpp"
#include "SyncEngine.hpp"
#include "SyncSettings.hpp"
#include "sftpsync/Libssh2SftpClient.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>
#include <QTimer>
#include <cstdio>
#include <functional>
#include <memory>
#include <unistd.h>
Q_LOGGING_CATEGORY(ssCli, "sftpsync.cli")

namespace {

enum ExitCode { kOk = 0, kFailed = 1, kUsage = 2 };

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

// Runs a command once the connection is up; exits the loop with kFailed when
// the connection cannot be made.
void whenConnected(SyncEngine &engine, std::function<void()> then) {
    engine.connectToTarget();
    auto conn = engine.connection();
    if (!conn) {
        // The event loop is not running yet.
        QTimer::singleShot(0, []() { QCoreApplication::exit(kUsage); });
        return;
    }
    conn->ensureConnected([then](bool ok, const QString &error) {
        if (!ok) {
            err() << "connection failed: " << error << Qt::endl;
            QCoreApplication::exit(kFailed);
            return;
        }
        then();
    });
}

// Exits once the queue has nothing left; the exit code reflects job failures.
void exitWhenDrained(SyncEngine &engine, const std::shared_ptr<int> &failures) {
    auto check = [&engine, failures]() {
        if (engine.queue().isIdle() && engine.offlineJobCount() == 0) {
            out() << (*failures == 0 ? "done" : "done with failures") << Qt::endl;
            QCoreApplication::exit(*failures == 0 ? kOk : kFailed);
        }
    };
    QObject::connect(&engine.queue(), &TransferQueue::drained, &engine, check);
    check();
}

void handleWatchLine(SyncEngine &engine, const QString &line) {
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#')))
        return;
    const QString verb = trimmed.section(QLatin1Char(' '), 0, 0).toLower();
    const QString rest = trimmed.section(QLatin1Char(' '), 1).trimmed();

    if (verb == QLatin1String("quit") || verb == QLatin1String("exit")) {
        QCoreApplication::exit(kOk);
    } else if (verb == QLatin1String("push")) {
        engine.syncAll();
    } else if (verb == QLatin1String("pull")) {
        engine.syncPull();
    } else if (verb == QLatin1String("changed")) {
        engine.onLocalChange(rest, LocalChangeKind::Changed);
    } else if (verb == QLatin1String("created")) {
        engine.onLocalChange(rest, LocalChangeKind::Created);
    } else if (verb == QLatin1String("deleted")) {
        engine.onLocalChange(rest, LocalChangeKind::Deleted);
    } else if (verb == QLatin1String("mkdir")) {
        engine.scheduleCreateDir(rest);
    } else if (verb == QLatin1String("renamed")) {
        const QString from = rest.section(QLatin1Char(' '), 0, 0);
        const QString to = rest.section(QLatin1Char(' '), 1).trimmed();
        if (from.isEmpty() || to.isEmpty())
            err() << "usage: renamed <old> <new>" << Qt::endl;
        else
            engine.onLocalRename(from, to);
    } else if (verb == QLatin1String("status")) {
        const QueueSnapshot q = engine.queueSnapshot();
        out() << connectionStateName(engine.connectionState()) << " pending=" << q.pending
              << " inflight=" << q.inflight << " changes=" << engine.pendingChanges().size()
              << " conflicts=" << engine.conflicts().size() << Qt::endl;
    } else {
        err() << "unknown command: " << verb << Qt::endl;
    }
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sftpsync"));
    QCoreApplication::setOrganizationName(QStringLiteral("sftpsync"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.3.0"));
    registerSyncMetaTypes();

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Keeps a local folder in sync with a remote directory over SFTP."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                 QStringLiteral("Settings file (INI)."), QStringLiteral("file"));
    QCommandLineOption workspaceOpt({QStringLiteral("w"), QStringLiteral("workspace")},
                                    QStringLiteral("Workspace directory (default: current)."),
                                    QStringLiteral("dir"));
    QCommandLineOption verboseOpt({QStringLiteral("v"), QStringLiteral("verbose")},
                                  QStringLiteral("Enable debug logging."));
    QCommandLineOption timeoutOpt(QStringLiteral("exec-timeout"),
                                  QStringLiteral("Remote command timeout in ms."),
                                  QStringLiteral("ms"), QStringLiteral("60000"));
    parser.addOption(configOpt);
    parser.addOption(workspaceOpt);
    parser.addOption(verboseOpt);
    parser.addOption(timeoutOpt);
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("push | pull | push-path <p> | pull-path <p> | exec <cmd...> | watch"));
    parser.process(app);

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules(QStringLiteral("sftpsync.*.debug=true"));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        err() << parser.helpText();
        return kUsage;
    }
    const QString command = args.front();

    const QString configPath = parser.value(configOpt);
    if (!configPath.isEmpty() && !QFile::exists(configPath)) {
        err() << "settings file not found: " << configPath << Qt::endl;
        return kUsage;
    }
    const QString workspace = parser.isSet(workspaceOpt) ? parser.value(workspaceOpt)
                                                         : QDir::currentPath();

    // Re-read on every bind so edits to the file apply to the next operation.
    SyncEngine::SettingsProvider provider = [configPath]() -> std::optional<SyncSettings> {
        std::unique_ptr<QSettings> s =
            configPath.isEmpty() ? std::make_unique<QSettings>()
                                 : std::make_unique<QSettings>(configPath, QSettings::IniFormat);
        SyncSettings cfg = loadSyncSettings(*s);
        if (cfg.host.isEmpty() || cfg.username.isEmpty()) {
            qCWarning(ssCli) << "Sync/host and Sync/username must be configured";
            return std::nullopt;
        }
        return cfg;
    };

    ConnectionRegistry registry(
        []() { return std::make_unique<sftpsync::Libssh2SftpClient>(); });
    SyncEngine engine(registry, provider, workspace);

    auto failures = std::make_shared<int>(0);
    QObject::connect(&engine, &SyncEngine::notice, [](const QString &msg) {
        out() << msg << Qt::endl;
    });
    QObject::connect(&engine, &SyncEngine::jobFailed,
                     [failures](const QString &path, const QString &type, const QString &error) {
                         ++*failures;
                         err() << type << " " << path << ": " << error << Qt::endl;
                     });
    QObject::connect(&engine, &SyncEngine::conflictDetected, [](const ConflictArtifact &a) {
        out() << "conflict: " << a.sourcePath << "\n  local copy:  " << a.localArtifactPath
              << "\n  remote copy: " << a.remoteArtifactPath << Qt::endl;
    });
    QObject::connect(&engine, &SyncEngine::stateChanged, [](ConnectionState s) {
        qCInfo(ssCli) << "connection" << connectionStateName(s);
    });

    std::unique_ptr<QSocketNotifier> stdinNotifier;
    QFile stdinFile;

    if (command == QLatin1String("push")) {
        whenConnected(engine, [&engine, failures]() {
            engine.forcePush(engine.localRoot());
            exitWhenDrained(engine, failures);
        });
    } else if (command == QLatin1String("pull")) {
        QObject::connect(&engine, &SyncEngine::syncFinished,
                         [](SyncDirection, bool ok, int failed) {
                             out() << "pull finished, " << failed << " failed" << Qt::endl;
                             QCoreApplication::exit(ok ? kOk : kFailed);
                         });
        if (!engine.syncPull())
            return kFailed;
    } else if (command == QLatin1String("push-path") || command == QLatin1String("pull-path")) {
        if (args.size() < 2) {
            err() << command << " needs a path" << Qt::endl;
            return kUsage;
        }
        const QString path = QFileInfo(args.at(1)).absoluteFilePath();
        const bool push = command == QLatin1String("push-path");
        whenConnected(engine, [&engine, failures, path, push]() {
            if (push)
                engine.forcePush(path);
            else
                engine.forcePull(path);
            exitWhenDrained(engine, failures);
        });
    } else if (command == QLatin1String("exec")) {
        if (args.size() < 2) {
            err() << "exec needs a command" << Qt::endl;
            return kUsage;
        }
        const QString remoteCmd = args.mid(1).join(QLatin1Char(' '));
        const int timeoutMs = parser.value(timeoutOpt).toInt();
        whenConnected(engine, [&engine, remoteCmd, timeoutMs]() {
            engine.connection()->execStreaming(
                remoteCmd, timeoutMs > 0 ? timeoutMs : 60000,
                [](const QString &chunk) { out() << chunk << Qt::flush; },
                [](const QString &chunk) { err() << chunk << Qt::flush; },
                [](const ExecResult &r) {
                    if (!r.ok) {
                        err() << r.error << Qt::endl;
                        QCoreApplication::exit(kFailed);
                        return;
                    }
                    QCoreApplication::exit(r.exitCode == 0 ? kOk : kFailed);
                });
        });
    } else if (command == QLatin1String("watch")) {
        if (!stdinFile.open(stdin, QIODevice::ReadOnly)) {
            err() << "cannot read stdin" << Qt::endl;
            return kFailed;
        }
        engine.connectToTarget();
        stdinNotifier = std::make_unique<QSocketNotifier>(STDIN_FILENO, QSocketNotifier::Read);
        QObject::connect(stdinNotifier.get(), &QSocketNotifier::activated, &engine,
                         [&engine, &stdinFile, &stdinNotifier]() {
                             const QByteArray line = stdinFile.readLine();
                             if (line.isEmpty()) {
                                 // EOF
                                 stdinNotifier->setEnabled(false);
                                 QCoreApplication::exit(kOk);
                                 return;
                             }
                             handleWatchLine(engine, QString::fromLocal8Bit(line));
                         });
        out() << "watching " << engine.localRoot() << " -> " << engine.remoteRoot() << Qt::endl;
    } else {
        err() << "unknown command: " << command << "\n\n" << parser.helpText();
        return kUsage;
    }

    const int rc = app.exec();
    engine.dispose();
    return rc;
}
