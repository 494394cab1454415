#include "reel/render_event.hpp"

namespace reel {

RenderEvent::RenderEvent(int type, const QJsonValue& data, qint64 timestamp) {
    object_.insert("type", type);
    object_.insert("data", data);
    object_.insert("timestamp", static_cast<double>(timestamp));
}

RenderEvent RenderEvent::console(const QString& level, const QJsonArray& args, qint64 timestamp) {
    const QJsonObject data{
        {"plugin", kConsolePlugin},
        {"payload", QJsonObject{
            {"level", level},
            {"payload", args},
            {"trace", QJsonArray{}},
        }},
    };
    return RenderEvent(static_cast<int>(RenderEventType::Plugin), data, timestamp);
}

RenderEvent RenderEvent::navigationMarker(const QString& url, NavigationTrigger trigger, qint64 timestamp) {
    const QJsonObject data{
        {"tag", kNavigationMarkerTag},
        {"payload", QJsonObject{
            {"url", url},
            {"trigger", navigationTriggerName(trigger)},
            {"timestamp", static_cast<double>(timestamp)},
        }},
    };
    return RenderEvent(static_cast<int>(RenderEventType::Custom), data, timestamp);
}

bool RenderEvent::isConsoleLog() const {
    return type() == static_cast<int>(RenderEventType::Plugin)
        && object_.value("data").toObject().value("plugin").toString() == kConsolePlugin;
}

bool RenderEvent::isNavigationMarker() const {
    return type() == static_cast<int>(RenderEventType::Custom)
        && object_.value("data").toObject().value("tag").toString() == kNavigationMarkerTag;
}

}  // namespace reel
