/**
 * @file NotificationPayload.hpp
 * @brief Request body sent to the notification relay, plus the caller-side options it is built from.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace foldernotify::domain {

/**
 * @struct NotificationAction
 * @brief Action button attached to a notification (ntfy "view", "http" or "broadcast").
 */
struct NotificationAction {
    std::string action = "view";
    std::string label;
    std::string url;
    bool clear = false;
};

/** @brief Priority as given by a caller: numeric 1..5 or a named level ("urgent".."min"). */
using PriorityValue = std::variant<int, std::string>;

/**
 * @struct NotificationOptions
 * @brief Optional fields a caller may attach to a message.
 */
struct NotificationOptions {
    std::string title;
    std::optional<PriorityValue> priority;
    std::string tags; ///< Comma-joined tag string, sent as-is.
    std::string click;
    std::string attach;
    std::vector<NotificationAction> actions;
};

/**
 * @struct NotificationPayload
 * @brief Fully resolved notification. The topic always equals the configured topic.
 */
struct NotificationPayload {
    std::string topic;
    std::string message;
    std::optional<std::string> title;
    std::optional<int> priority; ///< Always within [1, 5] when present.
    std::optional<std::string> tags;
    std::optional<std::string> click;
    std::optional<std::string> attach;
    std::vector<NotificationAction> actions;

    /**
     * @brief Serializes to the relay's JSON publish format.
     * @details `tags` becomes a single-element list holding the comma-joined string.
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Maps a priority to the relay's numeric scale.
 * @return 5..1 for "urgent", "high", "default", "low", "min" or an in-range integer;
 *         nullopt for unknown names and out-of-range integers.
 */
std::optional<int> ResolvePriority(const PriorityValue& priority);

/** @brief Builds a payload for @p topic, dropping empty and unresolvable options. */
NotificationPayload MakePayload(const std::string& topic, const std::string& message, const NotificationOptions& options);

} // namespace foldernotify::domain
