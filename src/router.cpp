#include "mcpfs/router.hpp"
#include "mcpfs/error.hpp"
#include "mcpfs/log.hpp"
#include <stdexcept>

namespace mcpfs {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        JsonRpcResponse resp;
        resp.id = req->id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                resp.error = JsonRpcError{
                    error::MethodNotFound,
                    "Method not found: " + req->method,
                    std::nullopt
                };
                return resp;
            }
            handler = it->second;
        }

        const nlohmann::json params = req->params ? *req->params : nlohmann::json();
        try {
            auto result = handler(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else {
                resp.error = std::get<JsonRpcError>(std::move(result));
            }
        } catch (const McpProtocolError& e) {
            resp.error = JsonRpcError{e.code, e.what(), std::nullopt};
        } catch (const std::exception& e) {
            log::get("dispatcher")->error("{} failed: {}", req->method, e.what());
            resp.error = JsonRpcError{error::InternalError, e.what(), std::nullopt};
        }
        return resp;
    }

    const auto& notif = std::get<JsonRpcNotification>(msg);
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            log::get("dispatcher")->debug("ignoring notification {}", notif.method);
            return std::nullopt;
        }
        handler = it->second;
    }
    try {
        handler(notif.params ? *notif.params : nlohmann::json());
    } catch (const std::exception& e) {
        // Notifications have no reply channel
        log::get("dispatcher")->warn("notification {} failed: {}", notif.method, e.what());
    }
    return std::nullopt;
}

} // namespace mcpfs
