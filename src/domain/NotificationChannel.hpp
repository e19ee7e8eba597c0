/**
 * @file NotificationChannel.hpp
 * @brief Interface for transports that publish notifications to the relay.
 */

#pragma once
#include <optional>
#include <string>
#include "NotificationPayload.hpp"

namespace foldernotify::domain {

/**
 * @struct DeliveryResult
 * @brief Outcome of one publish attempt.
 */
struct DeliveryResult {
    std::optional<int> status; ///< HTTP status, absent on transport failure.
    std::string error;         ///< Transport failure description.

    bool delivered() const { return status && *status == 200; }
};

/**
 * @class NotificationChannel
 * @brief Abstract fire-and-forget publisher. One call, one request, no retries.
 */
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    /**
     * @brief Publishes a payload.
     * @return The response status, or an error description when no response arrived.
     */
    virtual DeliveryResult publish(const NotificationPayload& payload) = 0;

    /** @brief Human-readable endpoint, for logs. */
    virtual std::string endpoint() const = 0;
};

} // namespace foldernotify::domain
