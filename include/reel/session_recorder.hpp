#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <memory>

#include "reel/archive_importer.hpp"
#include "reel/cancellation.hpp"
#include "reel/config.hpp"
#include "reel/event_store.hpp"
#include "reel/http_stack.hpp"
#include "reel/navigation.hpp"
#include "reel/navigation_interceptor.hpp"
#include "reel/network_interceptor.hpp"
#include "reel/packager.hpp"
#include "reel/progress.hpp"
#include "reel/render_event.hpp"
#include "reel/result.hpp"
#include "reel/uploader.hpp"

class QTimer;

namespace reel {

// Ties capture, persistence and export together for one recording session.
class SessionRecorder {
public:
    SessionRecorder(RecorderConfig config, HttpStack& http, NavigationHost& navigation);
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder&) = delete;
    SessionRecorder& operator=(const SessionRecorder&) = delete;

    bool openStore();
    QJsonObject start();
    QJsonObject stop();
    QJsonObject status() const;

    bool recordEvent(const RenderEvent& event);
    bool recordConsole(const QString& level, const QJsonArray& args);

    SweepReport sweepNow();
    [[nodiscard]] bool sweepPending() const { return sweepPending_; }

    // sessionId 0 selects the current session.
    SessionData sessionData(qint64 sessionId = 0) const;
    OperationResult exportSession(
        const QString& path,
        bool clearAfter = true,
        qint64 sessionId = 0,
        ExportFormat format = ExportFormat::Zip);
    UploadResult uploadSession(
        qint64 sessionId = 0,
        bool clearAfter = true,
        const ProgressFn& progress = {},
        const CancellationToken& cancel = {});
    ImportResult importArchive(const QString& path, bool clearBefore = false);

    [[nodiscard]] bool shouldIgnoreUrl(const QString& url) const;
    [[nodiscard]] bool isActive() const { return active_; }
    [[nodiscard]] qint64 sessionId() const { return sessionId_; }
    [[nodiscard]] const RecorderConfig& config() const { return config_; }
    [[nodiscard]] EventStore& store() { return store_; }
    [[nodiscard]] const EventStore& store() const { return store_; }

private:
    void onTraceEntry(const TraceEntry& entry);
    void onNavigation(const QString& url, NavigationTrigger trigger);
    qint64 resolveSession(qint64 sessionId) const;

    RecorderConfig config_;
    HttpStack& http_;
    EventStore store_;
    Packager packager_;
    NetworkInterceptor network_;
    NavigationInterceptor navigation_;
    std::unique_ptr<QTimer> sweepTimer_;
    bool storeOpen_ = false;
    bool active_ = false;
    bool sweepPending_ = false;
    qint64 sessionId_ = 0;
    QString startedUtc_;
    QString endedUtc_;
};

}  // namespace reel
