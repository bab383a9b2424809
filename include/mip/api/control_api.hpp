#pragma once

#include "mip/network/http_router.hpp"
#include "mip/workflow/orchestrator.hpp"

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mip::api {

/**
 * @brief JSON control surface over the orchestrator
 *
 * GET  /api/health
 * GET  /api/records/pending
 * GET  /api/records/failed
 * GET  /api/records/history?limit=N
 * GET  /api/stats
 * POST /api/records/:id/approve    {"delete_source": false}
 * POST /api/records/:id/reject     {"delete_source": true}
 * POST /api/records/:id/resubmit
 *
 * Action responses: {"success", "message"?, "error"?, "data"?}.
 *
 * Approvals run the renamer and the transfer, which can take minutes, so
 * they execute on a pool of their own and answer through the Responder.
 * Every other route answers on the calling thread. Destruction waits for
 * approvals in flight.
 */
class ControlApi {
public:
    static constexpr std::size_t kMaxHistoryLimit = 1000;
    static constexpr std::size_t kDefaultApprovalWorkers = 4;

    explicit ControlApi(workflow::Orchestrator& orchestrator,
                        std::size_t approval_workers = kDefaultApprovalWorkers);
    ~ControlApi();

    ControlApi(const ControlApi&) = delete;
    ControlApi& operator=(const ControlApi&) = delete;

    void register_routes(network::HttpRouter& router);

    static nlohmann::json to_json(const store::PendingRecord& record);
    static nlohmann::json to_json(const store::TerminalRecord& record);
    static nlohmann::json to_json(const store::RecordStats& stats);

    /// Positive decimal id, nullopt otherwise
    static std::optional<std::int64_t> parse_id(const std::string& text);

private:
    network::HttpResponse health() const;
    network::HttpResponse pending() const;
    network::HttpResponse failed() const;
    network::HttpResponse history(const network::HttpContext& ctx) const;
    network::HttpResponse stats() const;
    void approve(const network::HttpContext& ctx, network::Responder respond);
    network::HttpResponse reject(const network::HttpContext& ctx);
    network::HttpResponse resubmit(const network::HttpContext& ctx);

    workflow::Orchestrator& orchestrator_;
    boost::asio::thread_pool approvals_;
};

} // namespace mip::api
