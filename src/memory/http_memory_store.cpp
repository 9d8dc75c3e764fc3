#include "agentrelay/memory/memory_store.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace agentrelay::memory {

namespace {

void apply_timeouts(httplib::Client& client, int timeout_ms) {
    auto sec = timeout_ms / 1000;
    auto usec = (timeout_ms % 1000) * 1000;
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

}  // namespace

HttpMemoryStore::HttpMemoryStore(const MemoryStoreConfig& config)
    : config_(config)
{
}

Result<std::string, Error> HttpMemoryStore::fetch_context(const std::string& query) {
    httplib::Client client(config_.base_url);
    apply_timeouts(client, config_.timeout_ms);

    httplib::Params params{
        {"project", config_.project},
        {"query", query}
    };

    auto res = client.Get(config_.context_path, params, httplib::Headers{});

    if (!res) {
        return Result<std::string, Error>::err(
            ErrorCode::ConnectionRefused,
            "Failed to reach memory store: " + httplib::to_string(res.error()),
            config_.base_url
        );
    }

    if (res->status != 200) {
        return Result<std::string, Error>::err(
            ErrorCode::HttpStatusError,
            "Unexpected status code: " + std::to_string(res->status),
            config_.context_path
        );
    }

    // JSON {"context": "..."} or plain text
    auto content_type = res->get_header_value("Content-Type");
    if (content_type.find("json") != std::string::npos) {
        try {
            auto body = Json::parse(res->body);
            if (body.is_object()) {
                return Result<std::string, Error>::ok(body.value("context", ""));
            }
            if (body.is_string()) {
                return Result<std::string, Error>::ok(body.get<std::string>());
            }
            return Result<std::string, Error>::ok(std::string{});
        } catch (const Json::exception& e) {
            return Result<std::string, Error>::err(
                ErrorCode::ContextFetchFailed,
                std::string("Invalid context payload: ") + e.what()
            );
        }
    }

    return Result<std::string, Error>::ok(res->body);
}

Json HttpMemoryStore::build_message(const CaptureRecord& record) const {
    return Json{
        {"session_id", record.context_id.empty() ? record.turn_id : record.context_id},
        {"project", config_.project},
        {"user_message", record.request},
        {"assistant_response", record.sanitized},
        {"channel", record.destination},
        {"source", std::string(requester_to_string(record.requester))},
        {"turn_id", record.turn_id},
        {"timestamp", to_millis(record.ended_at)}
    };
}

Result<void, Error> HttpMemoryStore::forward(const CaptureRecord& record) {
    httplib::Client client(config_.base_url);
    apply_timeouts(client, config_.timeout_ms);

    auto body = build_message(record);
    auto res = client.Post(config_.messages_path, body.dump(), "application/json");

    if (!res) {
        return Result<void, Error>::err(
            ErrorCode::ConnectionRefused,
            "Failed to reach memory store: " + httplib::to_string(res.error()),
            config_.base_url
        );
    }

    if (res->status < 200 || res->status >= 300) {
        spdlog::debug("Memory store rejected {}: {} {}", record.id, res->status, res->body);
        return Result<void, Error>::err(
            ErrorCode::ForwardFailed,
            "Unexpected status code: " + std::to_string(res->status),
            record.id
        );
    }

    return Result<void, Error>::ok();
}

}  // namespace agentrelay::memory
