#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QThread>
#include <QTimer>

#include <memory>
#include <optional>

#include "reel/archive_importer.hpp"
#include "reel/config.hpp"
#include "reel/http_stack.hpp"
#include "reel/logging.hpp"
#include "reel/navigation.hpp"
#include "reel/network_http_client.hpp"
#include "reel/session_recorder.hpp"
#include "reel/telemetry.hpp"
#include "reel/transfer_worker.hpp"

namespace {

const QString kInitialUrl = QStringLiteral("app://reel/");

int printResult(const QJsonObject& result) {
    QTextStream(stdout) << QJsonDocument(result).toJson(QJsonDocument::Indented);
    return result.value("success").toBool(true) ? 0 : 1;
}

QJsonObject failure(const QString& message) {
    return {
        {"success", false},
        {"error", message},
    };
}

qint64 resolveSessionArgument(const QString& argument, const reel::EventStore& store) {
    if (argument == "current" || argument.isEmpty()) {
        const QList<qint64> ids = store.sessionIds();
        return ids.isEmpty() ? 0 : ids.first();
    }
    return argument.toLongLong();
}

QJsonObject listSessions(const reel::EventStore& store) {
    QJsonArray rows;
    for (qint64 id : store.sessionIds()) {
        rows.append(QJsonObject{
            {"session_id", QString::number(id)},
            {"started_utc", QDateTime::fromMSecsSinceEpoch(id).toUTC().toString(Qt::ISODate)},
            {"event_count", store.count(reel::StoreTable::RenderEvent, id)},
            {"entry_count", store.count(reel::StoreTable::ResponseData, id)},
        });
    }
    return {
        {"success", true},
        {"sessions", rows},
    };
}

QJsonObject ingest(reel::SessionRecorder& recorder, reel::HttpStack& http, reel::NavigationHost& navigation,
    const QString& source, const QStringList& fetchUrls, const QStringList& navigateUrls) {
    const QJsonObject started = recorder.start();
    if (started.contains("success") && !started.value("success").toBool()) {
        return started;
    }

    int accepted = 0;
    int rejected = 0;
    if (!source.isEmpty()) {
        QFile file;
        bool opened = false;
        if (source == "-") {
            opened = file.open(stdin, QIODevice::ReadOnly);
        } else {
            file.setFileName(source);
            opened = file.open(QIODevice::ReadOnly);
        }
        if (!opened) {
            recorder.stop();
            return failure(QString("Failed to open %1: %2").arg(source, file.errorString()));
        }
        while (!file.atEnd()) {
            const QByteArray line = file.readLine().trimmed();
            if (line.isEmpty()) {
                continue;
            }
            const QJsonDocument doc = QJsonDocument::fromJson(line);
            if (!doc.isObject() || !recorder.recordEvent(reel::RenderEvent(doc.object()))) {
                ++rejected;
                continue;
            }
            ++accepted;
        }
    }

    for (const QString& url : navigateUrls) {
        navigation.pushState(QJsonValue(), url);
    }

    QJsonArray fetches;
    for (const QString& url : fetchUrls) {
        const reel::HttpResponse response = http.fetch(url);
        fetches.append(QJsonObject{
            {"url", url},
            {"status", response.status},
            {"error", response.errorString},
        });
    }

    QJsonObject status = recorder.stop();
    status.insert("success", true);
    status.insert("accepted_events", accepted);
    status.insert("rejected_lines", rejected);
    status.insert("fetches", fetches);
    return status;
}

QJsonObject inspect(const QString& path) {
    const reel::ImportResult result = reel::ArchiveImporter().readFile(path);
    QJsonObject out = result.toJson();
    if (result.success()) {
        bool complete = true;
        for (const reel::ImportedSession& session : result.sessions) {
            complete = complete && session.hasFullSnapshot;
        }
        out.insert("replayable", complete);
    }
    return out;
}

void runDownload(QCoreApplication& app, const QStringList& args, const QCommandLineParser& parser,
    const reel::RecorderConfig& config) {
    auto* thread = new QThread(&app);
    auto* worker = new reel::TransferWorker(std::make_shared<reel::NetworkHttpClient>());
    worker->moveToThread(thread);
    QObject::connect(thread, &QThread::finished, worker, &QObject::deleteLater);

    QObject::connect(worker, &reel::TransferWorker::progressChanged, &app, [](const QJsonObject& progress) {
        QTextStream(stderr) << QString("progress %1% (%2 / %3 bytes)\n")
                                   .arg(progress.value("percentage").toDouble(), 0, 'f', 1)
                                   .arg(progress.value("loaded").toInteger())
                                   .arg(progress.value("total").toInteger());
    });
    QObject::connect(worker, &reel::TransferWorker::transferFinished, &app, [&app, thread](const QJsonObject& result) {
        const int code = printResult(result);
        thread->quit();
        thread->wait();
        app.exit(code);
    });
    thread->start();

    QJsonObject options{
        {"chunk_size", static_cast<double>(config.chunkSize)},
        {"concurrency", config.maxConcurrent},
        {"max_retries", config.maxRetries},
        {"retry_base_delay_ms", config.retryBaseDelayMs},
    };
    if (parser.isSet("size")) {
        options.insert("size", parser.value("size").toDouble());
    }
    if (parser.isSet("chunk-size")) {
        options.insert("chunk_size", parser.value("chunk-size").toDouble());
    }
    if (parser.isSet("concurrency")) {
        options.insert("concurrency", parser.value("concurrency").toInt());
    }

    QMetaObject::invokeMethod(worker, [worker, url = args.value(1), out = args.value(2), options]() {
        worker->download(url, out, options);
    }, Qt::QueuedConnection);
}

int runCommand(const QCommandLineParser& parser, const QStringList& args, const reel::RecorderConfig& config) {
    const QString command = args.value(0);

    auto http = std::make_shared<reel::HttpStack>(std::make_shared<reel::NetworkHttpClient>());
    reel::NavigationHost navigation(std::make_shared<reel::SimulatedHistory>(kInitialUrl));
    reel::SessionRecorder recorder(config, *http, navigation);
    if (!recorder.openStore()) {
        return printResult(failure(recorder.store().errorString()));
    }

    if (command == "sessions") {
        return printResult(listSessions(recorder.store()));
    }
    if (command == "ingest") {
        return printResult(ingest(recorder, *http, navigation, args.value(1), parser.values("fetch"), parser.values("navigate")));
    }
    if (command == "export") {
        if (args.size() < 3) {
            return printResult(failure("usage: reel export <session-id|current> <out.zip|out.json> [--format zip|json]"));
        }
        const std::optional<reel::ExportFormat> format = reel::exportFormatFromName(parser.value("format"));
        if (!format) {
            return printResult(failure(QString("Unknown export format '%1'").arg(parser.value("format"))));
        }
        const qint64 id = resolveSessionArgument(args.value(1), recorder.store());
        return printResult(recorder.exportSession(args.value(2), !parser.isSet("keep"), id, *format).toJson());
    }
    if (command == "upload") {
        const qint64 id = resolveSessionArgument(args.value(1), recorder.store());
        const reel::UploadResult result = recorder.uploadSession(id, !parser.isSet("keep"), [](double percent) {
            QTextStream(stderr) << QString("progress %1%\n").arg(percent, 0, 'f', 1);
        });
        return printResult(result.toJson());
    }
    if (command == "import") {
        if (args.size() < 2) {
            return printResult(failure("usage: reel import <archive>"));
        }
        return printResult(recorder.importArchive(args.value(1), parser.isSet("clear-before")).toJson());
    }
    if (command == "sweep") {
        QJsonObject report = recorder.sweepNow().toJson();
        report.insert("success", true);
        return printResult(report);
    }
    if (command == "clear") {
        const bool ok = recorder.store().clearTable(reel::StoreTable::RenderEvent)
            && recorder.store().clearTable(reel::StoreTable::ResponseData);
        return printResult(ok ? QJsonObject{{"success", true}} : failure(recorder.store().errorString()));
    }
    return printResult(failure(QString("Unknown command '%1'").arg(command)));
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("ReelKeeper");
    app.setApplicationVersion("2.0.0");
    QObject::connect(&app, &QCoreApplication::aboutToQuit, []() {
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        const QJsonObject exported = reel::Telemetry::instance().exportToFile(path);
        if (!exported.value("success").toBool()) {
            qCWarning(reel::lcApp) << "telemetry export failed:" << exported.value("error").toString();
        }
    });

    QCommandLineParser parser;
    parser.setApplicationDescription("Browser session capture store and archive transfer tool.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "sessions | ingest | export | upload | import | sweep | clear | download | inspect");
    parser.addOptions({
        {"config", "Recorder config file.", "path", reel::RecorderConfig::kDefaultFileName},
        {"fetch", "URL fetched through the traced HTTP stack during ingest.", "url"},
        {"navigate", "URL pushed onto the history during ingest.", "url"},
        {"keep", "Keep the session in the store after export or upload."},
        {"format", "Export format: zip or json.", "format", "zip"},
        {"clear-before", "Clear the store before importing."},
        {"size", "Known resource size in bytes; skips the HEAD probe.", "bytes"},
        {"chunk-size", "Range size in bytes.", "bytes"},
        {"concurrency", "Maximum ranges in flight.", "count"},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    if (command == "inspect") {
        if (args.size() < 2) {
            return printResult(failure("usage: reel inspect <archive>"));
        }
        return printResult(inspect(args.value(1)));
    }

    reel::RecorderConfig config;
    const bool configOptional = command == "download";
    const reel::ConfigLoadResult loaded = reel::loadConfig(parser.value("config"));
    if (loaded.status.success()) {
        config = loaded.config;
    } else if (!configOptional) {
        return printResult(loaded.status.toJson());
    } else {
        qCInfo(reel::lcApp) << "running download with default transfer settings:" << loaded.status.error;
    }

    if (command == "download") {
        if (args.size() < 3) {
            return printResult(failure("usage: reel download <url> <out>"));
        }
        QTimer::singleShot(0, &app, [&app, args, &parser, config]() { runDownload(app, args, parser, config); });
        return QCoreApplication::exec();
    }

    QTimer::singleShot(0, &app, [&app, &parser, args, config]() {
        app.exit(runCommand(parser, args, config));
    });
    return QCoreApplication::exec();
}
