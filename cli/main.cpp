// Command-line entry point: parse options, wire the transfer core and run one command.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFileInfo>
#include <QTextStream>
#include <QTimer>
#include "AppSettings.hpp"
#include "SecretStore.hpp"
#include "TransferManager.hpp"
#include "openxfer/CloudStrategy.hpp"
#include "openxfer/ConnectionPool.hpp"
#include "openxfer/CurlFtpClient.hpp"
#include "openxfer/DropboxClient.hpp"
#include "openxfer/GoogleDriveClient.hpp"
#include "openxfer/Libssh2SftpClient.hpp"
#include "openxfer/LocalStrategy.hpp"
#include "openxfer/Log.hpp"
#include "openxfer/OneDriveClient.hpp"
#include "openxfer/PathResolver.hpp"
#include "openxfer/RemoteStrategy.hpp"
#include "openxfer/SmbcClient.hpp"
#include "openxfer/TransferOrchestrator.hpp"
#include "openxfer/TrashManager.hpp"
#include <memory>

using namespace openxfer;

namespace {

enum ExitCode { kOk = 0, kFailed = 1, kUsage = 2 };

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

// Plain filesystem arguments become absolute paths; URIs pass through.
QString argPath(const QString& arg) {
    if (arg.contains("://") || arg.startsWith("cloud:")) return arg;
    return QFileInfo(arg).absoluteFilePath();
}

QString joinChild(QString dir, const QString& name) {
    while (dir.size() > 1 && dir.endsWith('/')) dir.chop(1);
    return dir.endsWith('/') ? dir + name : dir + "/" + name;
}

// "KEY=VALUE", e.g. "sftp://host:22=4".
bool splitAssignment(const QString& s, QString& key, qulonglong& value) {
    const int eq = s.lastIndexOf('=');
    if (eq <= 0) return false;
    bool ok = false;
    key = s.left(eq).trimmed();
    value = s.mid(eq + 1).toULongLong(&ok);
    return ok && value > 0;
}

int report(const TransferResult& r, const QString& what) {
    if (r) {
        out() << what << ": " << QString::fromStdString(r.finalPath()) << Qt::endl;
        return kOk;
    }
    err() << what << " failed (" << errorKindName(r.error().kind) << "): "
          << QString::fromStdString(r.error().message) << Qt::endl;
    return kFailed;
}

QString formatTime(std::chrono::system_clock::time_point tp) {
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toString(Qt::ISODate);
}

int runTrash(TrashManager& trash, const QStringList& args) {
    if (args.size() < 2) {
        err() << "usage: trash list|restore|empty|cleanup <dir> [name]" << Qt::endl;
        return kUsage;
    }
    const QString action = args.at(0);
    const std::string root = argPath(args.at(1)).toStdString();

    if (action == "list") {
        for (const TrashedFile& f : trash.trashContents(root))
            out() << formatTime(f.deletedAt) << "  " << QString::fromStdString(f.originalPath) << "  ("
                  << QString::fromStdString(f.trashPath) << ")" << Qt::endl;
        return kOk;
    }
    if (action == "empty") {
        out() << "Removed " << trash.emptyTrash(root) << " item(s)" << Qt::endl;
        return kOk;
    }
    if (action == "cleanup") {
        out() << "Removed " << trash.cleanupOldTrash(root) << " expired item(s)" << Qt::endl;
        return kOk;
    }
    if (action == "restore") {
        const auto items = trash.trashContents(root);
        const QString wanted = args.size() > 2 ? args.at(2) : QString();
        for (const TrashedFile& f : items) {
            // Newest first: without a name the most recent entry is restored
            if (!wanted.isEmpty() && QFileInfo(QString::fromStdString(f.originalPath)).fileName() != wanted)
                continue;
            std::string restoredTo;
            ClientError e;
            if (!trash.restoreFromTrash(f, restoredTo, e)) {
                err() << "restore failed: " << QString::fromStdString(e.message) << Qt::endl;
                return kFailed;
            }
            out() << "Restored " << QString::fromStdString(restoredTo) << Qt::endl;
            return kOk;
        }
        err() << "Nothing to restore in " << QString::fromStdString(root) << Qt::endl;
        return kFailed;
    }
    err() << "unknown trash action: " << action << Qt::endl;
    return kUsage;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("OpenXfer");
    QCoreApplication::setOrganizationName("OpenXfer");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy, move and manage files across local, SMB, SFTP, FTP and cloud storage.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "copy | move | delete | exists | info | mkdir | rename | trash");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    QCommandLineOption overwriteOpt("overwrite", "Replace existing destinations.");
    QCommandLineOption permanentOpt("permanent", "Delete without moving to the trash.");
    QCommandLineOption priorityOpt("high-priority", "Bypass the concurrency limit and exclusive mode.");
    QCommandLineOption limitOpt("limit", "Global network concurrency limit (0 = defaults).", "N");
    QCommandLineOption recommendOpt("recommend", "Recommended threads for an endpoint.", "KEY=N");
    QCommandLineOption bufferOpt("buffer", "Recommended buffer size for an endpoint.", "KEY=BYTES");
    QCommandLineOption stagingOpt("staging", "Directory for temporary files.", "DIR");
    QCommandLineOption saveOpt("save", "Persist the network and staging options.");
    parser.addOptions({ overwriteOpt, permanentOpt, priorityOpt, limitOpt, recommendOpt, bufferOpt, stagingOpt, saveOpt });
    parser.process(app);

    // Settings: persisted values, then command-line overrides
    AppSettings settings = AppSettings::load();
    if (parser.isSet(limitOpt)) {
        bool ok = false;
        const int n = parser.value(limitOpt).toInt(&ok);
        if (!ok || n < 0) {
            err() << "--limit expects a non-negative number" << Qt::endl;
            return kUsage;
        }
        settings.userLimit = n;
    }
    for (const QString& v : parser.values(recommendOpt)) {
        QString key;
        qulonglong n = 0;
        if (!splitAssignment(v, key, n)) {
            err() << "--recommend expects KEY=N, got " << v << Qt::endl;
            return kUsage;
        }
        settings.recommendedThreads.insert(key, int(n));
    }
    for (const QString& v : parser.values(bufferOpt)) {
        QString key;
        qulonglong n = 0;
        if (!splitAssignment(v, key, n)) {
            err() << "--buffer expects KEY=BYTES, got " << v << Qt::endl;
            return kUsage;
        }
        settings.bufferSizes.insert(key, n);
    }
    if (parser.isSet(stagingOpt)) settings.stagingDir = QFileInfo(parser.value(stagingOpt)).absoluteFilePath();
    if (parser.isSet(saveOpt)) settings.save();

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        if (parser.isSet(saveOpt)) return kOk;
        parser.showHelp(kUsage);
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    if (!SecretStore::insecureFallbackActive())
        LOGI("credential store disabled; set OPEN_XFER_ENABLE_INSECURE_FALLBACK=1 to read stored secrets");

    // Core wiring
    auto secrets = std::make_shared<SecretStore>();
    auto admission = std::make_shared<AdmissionController>();
    settings.applyTo(*admission);
    auto staging = std::make_shared<TempFileManager>(settings.stagingConfig());
    const int stale = staging->cleanupOlderThan();
    if (stale > 0) LOGI("removed %d stale temp file(s) from %s", stale, staging->directory().c_str());
    auto trash = std::make_shared<TrashManager>();

    auto pool = std::make_shared<ConnectionPool>(secrets);
    pool->registerPrototype(Protocol::Sftp, std::make_shared<Libssh2SftpClient>());
    pool->registerPrototype(Protocol::Ftp, std::make_shared<CurlFtpClient>());
    pool->registerPrototype(Protocol::Smb, std::make_shared<SmbcClient>());

    auto cloud = std::make_shared<CloudStrategy>(admission, secrets, staging);
    cloud->registerClient(std::make_shared<GoogleDriveClient>());
    cloud->registerClient(std::make_shared<DropboxClient>());
    cloud->registerClient(std::make_shared<OneDriveClient>());

    auto orchestrator = std::make_shared<TransferOrchestrator>(staging);
    orchestrator->setStrategy(Protocol::Local, std::make_shared<LocalStrategy>(trash));
    for (Protocol p : { Protocol::Smb, Protocol::Sftp, Protocol::Ftp })
        orchestrator->setStrategy(p, std::make_shared<RemoteStrategy>(p, admission, pool, staging));
    orchestrator->setStrategy(Protocol::Cloud, cloud);

    OperationControl ctl;
    ctl.highPriority = parser.isSet(priorityOpt);

    if (command == "copy" || command == "move") {
        if (args.size() < 2) {
            err() << "usage: " << command << " <src>... <dst>" << Qt::endl;
            return kUsage;
        }
        TransferManager manager(orchestrator);
        manager.setOverwrite(parser.isSet(overwriteOpt));
        manager.setHighPriority(ctl.highPriority);
        manager.setMaxConcurrent(settings.userLimit > 0 ? settings.userLimit : 4);

        const QString dst = argPath(args.last());
        const QStringList sources = args.mid(0, args.size() - 1);
        for (const QString& raw : sources) {
            const QString src = argPath(raw);
            QString target = dst;
            if (sources.size() > 1) {
                std::string perr;
                auto resolved = PathResolver::resolve(src.toStdString(), perr);
                if (!resolved) {
                    err() << "invalid path " << src << ": " << QString::fromStdString(perr) << Qt::endl;
                    return kUsage;
                }
                target = joinChild(dst, QString::fromStdString(fileName(*resolved)));
            }
            if (command == "move") manager.enqueueMove(src, target);
            else manager.enqueueCopy(src, target);
        }

        QObject::connect(&manager, &TransferManager::finished, &app, &QCoreApplication::quit);
        QTimer::singleShot(0, &manager, &TransferManager::schedule);
        app.exec();

        int code = kOk;
        for (const TransferTask& t : manager.tasks()) {
            if (t.status == TransferTask::Status::Done) {
                out() << "OK  " << t.src << " -> " << t.dst << Qt::endl;
            } else {
                err() << (t.status == TransferTask::Status::Canceled ? "CANCELED  " : "FAILED  ") << t.error
                      << Qt::endl;
                code = kFailed;
            }
        }
        return code;
    }

    if (command == "delete") {
        if (args.isEmpty()) {
            err() << "usage: delete [--permanent] <path>..." << Qt::endl;
            return kUsage;
        }
        int code = kOk;
        for (const QString& raw : args) {
            const std::string path = argPath(raw).toStdString();
            TransferResult r = orchestrator->remove(path, parser.isSet(permanentOpt), ctl);
            if (!r) {
                err() << QString::fromStdString(describeDeleteError(QFileInfo(raw).fileName().toStdString(), path, r))
                      << Qt::endl;
                code = kFailed;
            } else {
                out() << "Deleted " << raw << Qt::endl;
            }
        }
        return code;
    }

    if (command == "exists") {
        if (args.size() != 1) {
            err() << "usage: exists <path>" << Qt::endl;
            return kUsage;
        }
        return orchestrator->exists(argPath(args.first()).toStdString(), ctl) ? kOk : kFailed;
    }

    if (command == "info") {
        if (args.size() != 1) {
            err() << "usage: info <path>" << Qt::endl;
            return kUsage;
        }
        FileInfo info;
        TransferResult r = orchestrator->getInfo(argPath(args.first()).toStdString(), info, ctl);
        if (!r) return report(r, "info");
        out() << "name:     " << QString::fromStdString(info.name) << Qt::endl
              << "type:     " << (info.is_dir ? "directory" : "file") << Qt::endl
              << "size:     " << (qulonglong)info.size << Qt::endl
              << "modified: "
              << (info.mtime ? QDateTime::fromSecsSinceEpoch((qint64)info.mtime).toString(Qt::ISODate) : QString("?"))
              << Qt::endl;
        if (info.mode) out() << "mode:     " << QString::number(info.mode & 07777, 8) << Qt::endl;
        if (!info.id.empty()) out() << "id:       " << QString::fromStdString(info.id) << Qt::endl;
        return kOk;
    }

    if (command == "mkdir") {
        if (args.size() != 1) {
            err() << "usage: mkdir <path>" << Qt::endl;
            return kUsage;
        }
        return report(orchestrator->createDirectory(argPath(args.first()).toStdString(), ctl), "mkdir");
    }

    if (command == "rename") {
        if (args.size() != 2) {
            err() << "usage: rename <path> <new-name>" << Qt::endl;
            return kUsage;
        }
        return report(orchestrator->rename(argPath(args.at(0)).toStdString(), args.at(1).toStdString(), ctl),
                      "rename");
    }

    if (command == "trash") return runTrash(*trash, args);

    err() << "unknown command: " << command << Qt::endl;
    return kUsage;
}
