#include "domain/NotificationPayload.hpp"
#include <map>

namespace foldernotify::domain {

using json = nlohmann::json;

namespace {

const std::map<std::string, int>& NamedPriorities() {
    static const std::map<std::string, int> levels = {
        {"urgent", 5},
        {"high", 4},
        {"default", 3},
        {"low", 2},
        {"min", 1}
    };
    return levels;
}

std::optional<std::string> NonEmpty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

std::optional<int> ResolvePriority(const PriorityValue& priority) {
    if (const auto* level = std::get_if<int>(&priority)) {
        if (*level >= 1 && *level <= 5) return *level;
        return std::nullopt;
    }

    const auto& name = std::get<std::string>(priority);
    auto it = NamedPriorities().find(name);
    if (it == NamedPriorities().end()) return std::nullopt;
    return it->second;
}

NotificationPayload MakePayload(const std::string& topic, const std::string& message, const NotificationOptions& options) {
    NotificationPayload payload;
    payload.topic = topic;
    payload.message = message;
    payload.title = NonEmpty(options.title);
    if (options.priority) {
        payload.priority = ResolvePriority(*options.priority);
    }
    payload.tags = NonEmpty(options.tags);
    payload.click = NonEmpty(options.click);
    payload.attach = NonEmpty(options.attach);
    payload.actions = options.actions;
    return payload;
}

json NotificationPayload::toJson() const {
    json body = {
        {"topic", topic},
        {"message", message}
    };

    if (title) body["title"] = *title;
    if (priority) body["priority"] = *priority;
    if (tags) body["tags"] = json::array({*tags});
    if (click) body["click"] = *click;
    if (attach) body["attach"] = *attach;

    if (!actions.empty()) {
        json list = json::array();
        for (const auto& a : actions) {
            json item = {
                {"action", a.action},
                {"label", a.label},
                {"url", a.url}
            };
            if (a.clear) item["clear"] = true;
            list.push_back(item);
        }
        body["actions"] = list;
    }
    return body;
}

} // namespace foldernotify::domain
