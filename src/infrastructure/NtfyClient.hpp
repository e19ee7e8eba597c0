/**
 * @file NtfyClient.hpp
 * @brief HTTP client publishing JSON notifications to an ntfy relay.
 */

#pragma once

#include <string>
#include "domain/NotificationChannel.hpp"

namespace foldernotify::infrastructure {

/**
 * @class NtfyClient
 * @brief Implements NotificationChannel with a single JSON POST per notification.
 *
 * No retries and no authentication. Only the response status is inspected.
 */
class NtfyClient : public domain::NotificationChannel {
public:
    /**
     * @param serverUrl Relay base URL, e.g. "https://ntfy.sh". A trailing path is used as the
     *        publish path, otherwise "/" is used.
     */
    explicit NtfyClient(const std::string& serverUrl = "https://ntfy.sh");

    /** @brief Sends a POST request to the relay. @see domain::NotificationChannel::publish */
    domain::DeliveryResult publish(const domain::NotificationPayload& payload) override;

    std::string endpoint() const override;

private:
    std::string m_base; ///< scheme://host[:port]
    std::string m_path; ///< Publish path on the relay.
};

} // namespace foldernotify::infrastructure
