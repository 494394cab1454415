#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "reel/navigation.hpp"

namespace reel {

// Event type discriminators of the DOM recording engine that the core recognizes.
enum class RenderEventType : int {
    FullSnapshot = 2,
    Custom = 5,
    Plugin = 6,
};

inline const QString kConsolePlugin = QStringLiteral("rrweb/console@1");
inline const QString kNavigationMarkerTag = QStringLiteral("url-change");

// Opaque timestamped unit of the DOM recording engine. The whole object is preserved; only
// type and timestamp are read.
class RenderEvent {
public:
    RenderEvent() = default;
    explicit RenderEvent(QJsonObject object) : object_(std::move(object)) {}
    RenderEvent(int type, const QJsonValue& data, qint64 timestamp);

    static RenderEvent console(const QString& level, const QJsonArray& args, qint64 timestamp);
    static RenderEvent navigationMarker(const QString& url, NavigationTrigger trigger, qint64 timestamp);

    [[nodiscard]] int type() const { return object_.value("type").toInt(-1); }
    [[nodiscard]] qint64 timestamp() const { return object_.value("timestamp").toInteger(0); }
    [[nodiscard]] bool isFullSnapshot() const { return type() == static_cast<int>(RenderEventType::FullSnapshot); }
    [[nodiscard]] bool isConsoleLog() const;
    [[nodiscard]] bool isNavigationMarker() const;

    [[nodiscard]] const QJsonObject& toJson() const { return object_; }

private:
    QJsonObject object_;
};

}  // namespace reel
