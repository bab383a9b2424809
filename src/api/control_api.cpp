#include "mip/api/control_api.hpp"

#include "mip/core/logging.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace mip::api {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using network::Responder;
using network::json_response;
using nlohmann::json;

namespace {

constexpr const char* kInvalidId = "Invalid record ID";

std::string iso8601(ingest::Timestamp ts) {
    const std::time_t seconds = ingest::Clock::to_time_t(ts);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

json nullable(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

HttpResponse action_error(HttpStatus status, const std::string& error) {
    return json_response(status, json{{"success", false}, {"error", error}}.dump());
}

HttpStatus status_for(const std::optional<ErrorCode>& code) {
    if (!code) {
        return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    switch (*code) {
        case ErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorCode::InvalidState: return HttpStatus::CONFLICT;
        case ErrorCode::DestinationExists: return HttpStatus::CONFLICT;
        default: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
}

HttpResponse render(const workflow::ActionResult& result) {
    if (!result.success) {
        return action_error(status_for(result.error_code), result.error);
    }

    json data{{"original_filename", result.original_filename}};
    if (result.final_filename) {
        data["final_filename"] = *result.final_filename;
        data["final_path"] = nullable(result.final_path);
        data["version_number"] = result.version_number;
    }
    json body{{"success", true}, {"message", result.message}, {"data", data}};
    return json_response(HttpStatus::OK, body.dump());
}

// Reads {"delete_source": bool}; an empty body means the default
std::optional<bool> delete_source_flag(const HttpContext& ctx, bool default_value, std::string& error) {
    const std::string raw = ctx.request.body_as_string();
    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
        return default_value;
    }

    const json body = json::parse(raw, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        error = "Malformed JSON body";
        return std::nullopt;
    }
    auto it = body.find("delete_source");
    if (it == body.end() || it->is_null()) {
        return default_value;
    }
    if (!it->is_boolean()) {
        error = "delete_source must be a boolean";
        return std::nullopt;
    }
    return it->get<bool>();
}

} // namespace

ControlApi::ControlApi(workflow::Orchestrator& orchestrator, std::size_t approval_workers)
    : orchestrator_(orchestrator),
      approvals_(approval_workers == 0 ? kDefaultApprovalWorkers : approval_workers) {}

ControlApi::~ControlApi() {
    approvals_.join();
}

void ControlApi::register_routes(network::HttpRouter& router) {
    router.get("/api/health", [this](const HttpContext&) { return health(); });
    router.get("/api/records/pending", [this](const HttpContext&) { return pending(); });
    router.get("/api/records/failed", [this](const HttpContext&) { return failed(); });
    router.get("/api/records/history", [this](const HttpContext& ctx) { return history(ctx); });
    router.get("/api/stats", [this](const HttpContext&) { return stats(); });
    router.post_deferred("/api/records/:id/approve",
                         [this](const HttpContext& ctx, Responder respond) { approve(ctx, std::move(respond)); });
    router.post("/api/records/:id/reject", [this](const HttpContext& ctx) { return reject(ctx); });
    router.post("/api/records/:id/resubmit", [this](const HttpContext& ctx) { return resubmit(ctx); });
}

std::optional<std::int64_t> ControlApi::parse_id(const std::string& text) {
    if (text.empty() || text.size() > 18 || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    const std::int64_t id = std::stoll(text);
    if (id <= 0) {
        return std::nullopt;
    }
    return id;
}

json ControlApi::to_json(const store::PendingRecord& record) {
    json meta = json::parse(record.side_metadata, nullptr, false);
    if (meta.is_discarded()) {
        meta = record.side_metadata;
    }
    return json{
        {"id", record.id},
        {"source_path", record.source_path},
        {"filename", record.filename},
        {"size_bytes", record.size_bytes},
        {"size_human", format_bytes(record.size_bytes)},
        {"detected_at", iso8601(record.detected_at)},
        {"status", ingest::RecordStatusUtils::to_string(record.status)},
        {"error_message", nullable(record.error_message)},
        {"side_metadata", meta},
    };
}

json ControlApi::to_json(const store::TerminalRecord& record) {
    return json{
        {"id", record.id},
        {"source_path", record.source_path},
        {"original_filename", record.original_filename},
        {"final_path", nullable(record.final_path)},
        {"final_filename", nullable(record.final_filename)},
        {"size_bytes", record.size_bytes},
        {"detected_at", iso8601(record.detected_at)},
        {"processed_at", iso8601(record.processed_at)},
        {"action", ingest::RecordStatusUtils::to_string(record.action)},
        {"version_number", record.version_number},
        {"renamer_output", record.renamer_output},
        {"notes", record.notes},
    };
}

json ControlApi::to_json(const store::RecordStats& stats) {
    return json{
        {"pending", stats.pending},
        {"failed", stats.failed},
        {"approved", stats.approved},
        {"rejected", stats.rejected},
        {"total", stats.total},
    };
}

HttpResponse ControlApi::health() const {
    return json_response(HttpStatus::OK, json{{"status", "ok"}, {"service", "mip"}}.dump());
}

HttpResponse ControlApi::pending() const {
    auto records = orchestrator_.list_pending();
    if (records.is_error()) {
        spdlog::error("[Api] listing pending failed: {}", records.error().message);
        return action_error(HttpStatus::INTERNAL_SERVER_ERROR, records.error().message);
    }
    json body = json::array();
    for (const auto& record : records.value()) {
        body.push_back(to_json(record));
    }
    return json_response(HttpStatus::OK, body.dump());
}

HttpResponse ControlApi::failed() const {
    auto records = orchestrator_.list_failed();
    if (records.is_error()) {
        spdlog::error("[Api] listing failed records failed: {}", records.error().message);
        return action_error(HttpStatus::INTERNAL_SERVER_ERROR, records.error().message);
    }
    json body = json::array();
    for (const auto& record : records.value()) {
        body.push_back(to_json(record));
    }
    return json_response(HttpStatus::OK, body.dump());
}

HttpResponse ControlApi::history(const HttpContext& ctx) const {
    std::size_t limit = store::RecordStore::kDefaultHistoryLimit;
    const std::string raw = ctx.request.query_param("limit");
    if (!raw.empty()) {
        const auto parsed = parse_id(raw);
        if (!parsed) {
            return action_error(HttpStatus::BAD_REQUEST, "limit must be a positive integer");
        }
        limit = std::min<std::size_t>(static_cast<std::size_t>(*parsed), kMaxHistoryLimit);
    }

    auto records = orchestrator_.list_history(limit);
    if (records.is_error()) {
        spdlog::error("[Api] listing history failed: {}", records.error().message);
        return action_error(HttpStatus::INTERNAL_SERVER_ERROR, records.error().message);
    }
    json body = json::array();
    for (const auto& record : records.value()) {
        body.push_back(to_json(record));
    }
    return json_response(HttpStatus::OK, body.dump());
}

HttpResponse ControlApi::stats() const {
    auto stats = orchestrator_.stats();
    if (stats.is_error()) {
        spdlog::error("[Api] stats failed: {}", stats.error().message);
        return action_error(HttpStatus::INTERNAL_SERVER_ERROR, stats.error().message);
    }
    return json_response(HttpStatus::OK, to_json(stats.value()).dump());
}

void ControlApi::approve(const HttpContext& ctx, Responder respond) {
    const auto id = parse_id(ctx.get_param("id"));
    if (!id) {
        respond(action_error(HttpStatus::BAD_REQUEST, kInvalidId));
        return;
    }
    std::string error;
    const auto delete_source = delete_source_flag(ctx, false, error);
    if (!delete_source) {
        respond(action_error(HttpStatus::BAD_REQUEST, error));
        return;
    }

    spdlog::info("[Api] approve id={}", *id);
    boost::asio::post(approvals_, [this, id = *id, delete_source = *delete_source, respond = std::move(respond)]() {
        respond(render(orchestrator_.approve(id, delete_source)));
    });
}

HttpResponse ControlApi::reject(const HttpContext& ctx) {
    const auto id = parse_id(ctx.get_param("id"));
    if (!id) {
        return action_error(HttpStatus::BAD_REQUEST, kInvalidId);
    }
    std::string error;
    const auto delete_source = delete_source_flag(ctx, true, error);
    if (!delete_source) {
        return action_error(HttpStatus::BAD_REQUEST, error);
    }

    spdlog::info("[Api] reject id={}", *id);
    return render(orchestrator_.reject(*id, *delete_source));
}

HttpResponse ControlApi::resubmit(const HttpContext& ctx) {
    const auto id = parse_id(ctx.get_param("id"));
    if (!id) {
        return action_error(HttpStatus::BAD_REQUEST, kInvalidId);
    }
    spdlog::info("[Api] resubmit id={}", *id);
    return render(orchestrator_.resubmit(*id));
}

} // namespace mip::api
