#include "infrastructure/NtfyClient.hpp"
#include <httplib.h>

namespace foldernotify::infrastructure {

NtfyClient::NtfyClient(const std::string& serverUrl)
    : m_base(serverUrl), m_path("/") {
    auto scheme = serverUrl.find("://");
    auto hostStart = scheme == std::string::npos ? 0 : scheme + 3;
    auto slash = serverUrl.find('/', hostStart);
    if (slash != std::string::npos) {
        m_base = serverUrl.substr(0, slash);
        m_path = serverUrl.substr(slash);
    }
}

domain::DeliveryResult NtfyClient::publish(const domain::NotificationPayload& payload) {
    httplib::Client cli(m_base);

    domain::DeliveryResult result;
    auto body = payload.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto res = cli.Post(m_path, body, "application/json");
    if (res) {
        result.status = res->status;
    } else {
        result.error = "Connection failed: " + httplib::to_string(res.error());
    }
    return result;
}

std::string NtfyClient::endpoint() const {
    return m_base + m_path;
}

} // namespace foldernotify::infrastructure
