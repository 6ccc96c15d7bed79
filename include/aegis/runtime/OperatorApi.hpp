#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "aegis/infra/Errors.hpp"
#include "aegis/runtime/ControlPlane.hpp"

namespace aegis {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// ---------------------------------------------------------------------------
// Operator HTTP API as a pure function: (method, target, body) -> response.
// No sockets here, so the whole surface is testable in-process.
//
// Errors come back as {"success": false, "error": <ErrorKind>, "message"}
// with the status from status_for(). Malformed JSON is a 400.
//
//   GET  /api/health
//   GET  /api/safety/status
//   POST /api/safety/trading-mode             {"mode"}
//   POST /api/safety/emergency-stop           {"active", "reason"}
//   POST /api/safety/circuit-breaker/reset    {"reason"?}
//   POST /api/orders                          OrderIntent
//   GET  /api/pipelines
//   GET  /api/pipelines/{id}
//   POST /api/pipelines/{id}/active           {"active"}
//   POST /api/pipelines/{pid}/candidates/{cid}/promote
//   POST /api/candidates                      StrategyCandidate
//   GET  /api/candidates/{id}
//   GET  /api/candidates/{id}/validations
//   POST /api/candidates/{id}/paper-trades    {"pnl", "ts"?} or {"trades": [...]}
//   GET  /api/promotion/stats
//   POST /api/promotion/sweep
//   GET  /api/strategies
//   GET  /api/capital/pools
//   GET  /api/capital/pools/{id}
//   GET  /api/capital/pools/{id}/analytics
//   GET  /api/capital/transactions?pool=&limit=
//   GET  /api/capital/allocations?active=true
//   POST /api/capital/allocate                {"poolId","experimentId","amount","riskLevel"}
//   POST /api/capital/release                 {"allocationId","finalPnl"}
//   POST /api/capital/transfer                {"fromPoolId","toPoolId","amount","reason"}
//   POST /api/capital/pnl                     {"allocationId","delta"}
//   POST /api/decisions                       DecisionRequest
//   GET  /api/evidence/traces/{id}
//   POST /api/evidence/traces/{id}/execution  {"status","brokerOrderIds"?,"reason"?,"realizedPnl"?}
//   GET  /api/evidence/symbols/{symbol}?limit=
//   GET  /api/nudge/stats
//   POST /api/nudge/reset
//   GET  /api/notifications?limit=
// ---------------------------------------------------------------------------
class OperatorApi {
public:
    explicit OperatorApi(ControlPlane& cp);

    ApiResponse handle(const std::string& method, const std::string& target,
                       const std::string& body);

    static int status_for(ErrorKind kind);

private:
    using Query = std::map<std::string, std::string>;
    using Segments = std::vector<std::string>;

    ApiResponse route(const std::string& method, const Segments& path,
                      const Query& query, const nlohmann::json& body);

    ApiResponse safety(const std::string& method, const Segments& path, const nlohmann::json& body);
    ApiResponse pipelines(const std::string& method, const Segments& path, const nlohmann::json& body);
    ApiResponse candidates(const std::string& method, const Segments& path, const nlohmann::json& body);
    ApiResponse capital(const std::string& method, const Segments& path,
                        const Query& query, const nlohmann::json& body);
    ApiResponse evidence(const std::string& method, const Segments& path,
                         const Query& query, const nlohmann::json& body);

    ControlPlane& cp_;
};

DecisionRequest decision_request_from_json(const nlohmann::json& j);

} // namespace aegis
