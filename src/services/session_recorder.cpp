#include "reel/session_recorder.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QTimer>

#include <algorithm>

#include "reel/logging.hpp"
#include "reel/telemetry.hpp"

namespace reel {

SessionRecorder::SessionRecorder(RecorderConfig config, HttpStack& http, NavigationHost& navigation)
    : config_(std::move(config)),
      http_(http),
      store_(config_.resolvedStoreDir(), config_.maxEvents),
      packager_(config_.maxEvents),
      network_(
          http,
          InterceptorHooks{
              {},
              [this](const TraceEntry& entry) { onTraceEntry(entry); },
              [this](const QString& url) { return shouldIgnoreUrl(url); },
          },
          config_.maxBodyBytes),
      navigation_(navigation, [this](const QString& url, NavigationTrigger trigger) { onNavigation(url, trigger); }) {}

SessionRecorder::~SessionRecorder() {
    if (active_) {
        stop();
    }
}

bool SessionRecorder::openStore() {
    if (!storeOpen_) {
        storeOpen_ = store_.open();
    }
    return storeOpen_;
}

QJsonObject SessionRecorder::start() {
    if (active_) {
        qCWarning(lcApp) << "recorder already active for session" << sessionId_;
        return status();
    }
    if (!openStore()) {
        return {
            {"success", false},
            {"error", store_.errorString()},
        };
    }

    sessionId_ = std::max(QDateTime::currentMSecsSinceEpoch(), sessionId_ + 1);
    startedUtc_ = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    endedUtc_.clear();
    active_ = true;

    sweepPending_ = true;
    if (config_.sweepDelayMs <= 0 || QCoreApplication::instance() == nullptr) {
        sweepNow();
    } else {
        sweepTimer_ = std::make_unique<QTimer>();
        sweepTimer_->setSingleShot(true);
        QObject::connect(sweepTimer_.get(), &QTimer::timeout, [this]() {
            if (sweepPending_) {
                sweepNow();
            }
        });
        sweepTimer_->start(config_.sweepDelayMs);
    }

    network_.install();
    navigation_.install();

    Telemetry::instance().incrementCounter("recorder.sessions_started");
    Telemetry::instance().recordEvent("session_started", {{"session_id", QString::number(sessionId_)}});
    qCInfo(lcApp) << "recording session" << sessionId_ << "for" << config_.projectName;
    return status();
}

QJsonObject SessionRecorder::stop() {
    if (!active_) {
        return status();
    }
    network_.uninstall();
    navigation_.uninstall();
    if (sweepPending_) {
        sweepNow();
    }
    sweepTimer_.reset();
    active_ = false;
    endedUtc_ = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    qCInfo(lcApp) << "session" << sessionId_ << "stopped";
    return status();
}

QJsonObject SessionRecorder::status() const {
    return {
        {"active", active_},
        {"session_id", QString::number(sessionId_)},
        {"started_utc", startedUtc_},
        {"ended_utc", endedUtc_},
        {"event_count", sessionId_ > 0 ? store_.count(StoreTable::RenderEvent, sessionId_) : 0},
        {"entry_count", sessionId_ > 0 ? store_.count(StoreTable::ResponseData, sessionId_) : 0},
        {"sweep_pending", sweepPending_},
    };
}

bool SessionRecorder::recordEvent(const RenderEvent& event) {
    if (!active_) {
        return false;
    }
    return store_.appendEvent(sessionId_, event);
}

bool SessionRecorder::recordConsole(const QString& level, const QJsonArray& args) {
    return recordEvent(RenderEvent::console(level, args, QDateTime::currentMSecsSinceEpoch()));
}

SweepReport SessionRecorder::sweepNow() {
    sweepPending_ = false;
    const qint64 traceTime = sessionId_ > 0 ? sessionId_ : QDateTime::currentMSecsSinceEpoch();
    return store_.sweep(traceTime, config_.retention());
}

void SessionRecorder::onTraceEntry(const TraceEntry& entry) {
    if (!active_) {
        return;
    }
    if (!store_.appendEntry(sessionId_, entry)) {
        qCWarning(lcCapture) << "dropping trace entry" << entry.correlationId << "for" << entry.request.url;
    }
}

void SessionRecorder::onNavigation(const QString& url, NavigationTrigger trigger) {
    if (!recordEvent(RenderEvent::navigationMarker(url, trigger, QDateTime::currentMSecsSinceEpoch()))) {
        qCWarning(lcCapture) << "dropping navigation marker" << navigationTriggerName(trigger) << url;
    }
}

bool SessionRecorder::shouldIgnoreUrl(const QString& url) const {
    if (!config_.uploadEndpoint.isEmpty() && url.startsWith(config_.uploadEndpoint)) {
        return true;
    }
    for (const QString& pattern : config_.ignorePatterns) {
        if (url.contains(pattern)) {
            return true;
        }
    }
    return false;
}

qint64 SessionRecorder::resolveSession(qint64 sessionId) const {
    return sessionId > 0 ? sessionId : sessionId_;
}

SessionData SessionRecorder::sessionData(qint64 sessionId) const {
    SessionData data;
    data.sessionId = resolveSession(sessionId);
    data.events = store_.read(StoreTable::RenderEvent, data.sessionId);
    data.entries = store_.read(StoreTable::ResponseData, data.sessionId);
    return data;
}

OperationResult SessionRecorder::exportSession(
    const QString& path,
    bool clearAfter,
    qint64 sessionId,
    ExportFormat format) {
    openStore();
    const SessionData data = sessionData(sessionId);
    if (data.sessionId <= 0 || (data.events.isEmpty() && data.entries.isEmpty())) {
        return OperationResult::fail(FailureKind::Io,
            QString("No recorded data to export for session %1.").arg(data.sessionId));
    }

    const PackageResult packaged = format == ExportFormat::Json
        ? packager_.packageJson({data})
        : packager_.package({data});
    const OperationResult written = Packager::writeToFile(packaged, path);
    if (!written.success()) {
        qCWarning(lcApp) << "export failed:" << written.error;
        return written;
    }

    if (clearAfter && !store_.deleteSession(data.sessionId)) {
        qCWarning(lcApp) << "exported session" << data.sessionId << "could not be cleared:" << store_.errorString();
    }
    Telemetry::instance().incrementCounter("recorder.exports");
    qCInfo(lcApp) << "exported session" << data.sessionId << "to" << path;
    return written;
}

UploadResult SessionRecorder::uploadSession(
    qint64 sessionId,
    bool clearAfter,
    const ProgressFn& progress,
    const CancellationToken& cancel) {
    openStore();
    const SessionData data = sessionData(sessionId);
    if (data.sessionId <= 0 || (data.events.isEmpty() && data.entries.isEmpty())) {
        UploadResult result;
        result.failure = FailureKind::Io;
        result.error = QString("No recorded data to upload for session %1.").arg(data.sessionId);
        return result;
    }

    const std::shared_ptr<HttpClient> client = http_.client();
    if (!client) {
        UploadResult result;
        result.failure = FailureKind::Config;
        result.error = "No HTTP client available for upload";
        return result;
    }

    const Uploader uploader(*client);
    UploadResult result = uploader.packageAndUpload(packager_, {data}, config_.uploadOptions(), progress, cancel);
    if (result.success() && clearAfter && !store_.deleteSession(data.sessionId)) {
        qCWarning(lcApp) << "uploaded session" << data.sessionId << "could not be cleared:" << store_.errorString();
    }
    return result;
}

ImportResult SessionRecorder::importArchive(const QString& path, bool clearBefore) {
    ImportResult imported = ArchiveImporter().readFile(path);
    if (!imported.success()) {
        qCWarning(lcApp) << "import failed:" << imported.error;
        return imported;
    }
    if (!openStore()) {
        imported.failure = FailureKind::Io;
        imported.error = store_.errorString();
        return imported;
    }
    if (clearBefore) {
        store_.clearTable(StoreTable::RenderEvent);
        store_.clearTable(StoreTable::ResponseData);
    }

    int failures = 0;
    for (const ImportedSession& session : imported.sessions) {
        for (const QJsonValue& event : session.events) {
            failures += store_.append(StoreTable::RenderEvent, session.sessionId, event.toObject()) ? 0 : 1;
        }
        for (const QJsonValue& entry : session.entries) {
            failures += store_.append(StoreTable::ResponseData, session.sessionId, entry.toObject()) ? 0 : 1;
        }
    }
    if (failures > 0) {
        imported.failure = FailureKind::Io;
        imported.error = QString("%1 rows could not be written to the store").arg(failures);
        return imported;
    }

    Telemetry::instance().incrementCounter("recorder.imports");
    qCInfo(lcApp) << "imported" << imported.sessions.size() << "sessions from" << path;
    return imported;
}

}  // namespace reel
