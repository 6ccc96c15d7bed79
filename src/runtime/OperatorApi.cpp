#include "aegis/runtime/OperatorApi.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace aegis {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (s[i] == '+') {
            out += ' ';
        } else {
            out += s[i];
        }
    }
    return out;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(sep, start);
        if (end == std::string::npos) end = s.size();
        if (end > start) parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

static ApiResponse ok(json body) {
    body["success"] = true;
    return {200, std::move(body)};
}

static ApiResponse fail(int status, ErrorKind kind, const std::string& message) {
    return {status, json{{"success", false},
                         {"error", error_kind_to_string(kind)},
                         {"message", message}}};
}

static ApiResponse no_route(const std::string& method, const std::vector<std::string>& path) {
    std::string p;
    for (const auto& s : path) p += "/" + s;
    return fail(404, ErrorKind::NOT_FOUND, "no route for " + method + " " + (p.empty() ? "/" : p));
}

static ApiResponse wrong_method(const std::string& method) {
    return fail(405, ErrorKind::INVALID_ARGUMENT, "method " + method + " not allowed");
}

static size_t query_size(const std::map<std::string, std::string>& q,
                         const std::string& key, size_t def) {
    auto it = q.find(key);
    if (it == q.end() || it->second.empty()) return def;
    return static_cast<size_t>(std::stoul(it->second));
}

static std::string query_str(const std::map<std::string, std::string>& q,
                             const std::string& key, const std::string& def = "") {
    auto it = q.find(key);
    return it == q.end() ? def : it->second;
}

static double finite_number(const json& body, const char* key) {
    double v = body.at(key).get<double>();
    if (!std::isfinite(v)) throw InvalidArgument(std::string(key) + " must be finite");
    return v;
}

DecisionRequest decision_request_from_json(const json& j) {
    DecisionRequest r;
    r.symbol = j.at("symbol").get<std::string>();
    r.sector = j.value("sector", "");
    r.strategy_id = j.value("strategy_id", "");
    r.plan = j.at("plan").get<TradePlan>();
    if (j.contains("risk_gate")) r.risk_gate = j.at("risk_gate").get<RiskGate>();
    if (j.contains("market_context") && j.at("market_context").is_object())
        r.market_context = j.at("market_context").get<MarketContext>();
    if (j.contains("news_evidence"))
        r.news_evidence = j.at("news_evidence").get<std::vector<NewsEvidence>>();
    if (j.contains("events"))
        r.events = j.at("events").get<std::vector<EventSignal>>();
    r.is_entry = j.value("is_entry", true);
    r.limit_price = j.value("limit_price", 0.0);
    return r;
}

// ---------------------------------------------------------------------------

OperatorApi::OperatorApi(ControlPlane& cp)
    : cp_(cp) {}

int OperatorApi::status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ARGUMENT:        return 400;
        case ErrorKind::NOT_FOUND:               return 404;
        case ErrorKind::INVALID_STATE:           return 409;
        case ErrorKind::INSUFFICIENT_CAPITAL:    return 409;
        case ErrorKind::LIMIT_EXCEEDED:          return 422;
        case ErrorKind::VALIDATION_FAILED:       return 422;
        case ErrorKind::DEPLOYMENT_FAILURE:      return 502;
        case ErrorKind::CIRCUIT_BREAKER_TRIPPED: return 503;
        case ErrorKind::NUDGE_ENGINE_DEGRADED:   return 503;
        case ErrorKind::STORE_FAILURE:           return 500;
        default:                                 return 500;
    }
}

ApiResponse OperatorApi::handle(const std::string& method, const std::string& target,
                                const std::string& body) {
    try {
        std::string path_part = target;
        Query query;
        size_t qpos = target.find('?');
        if (qpos != std::string::npos) {
            path_part = target.substr(0, qpos);
            for (const auto& kv : split(target.substr(qpos + 1), '&')) {
                size_t eq = kv.find('=');
                if (eq == std::string::npos) query[url_decode(kv)] = "";
                else query[url_decode(kv.substr(0, eq))] = url_decode(kv.substr(eq + 1));
            }
        }

        Segments path;
        for (const auto& s : split(path_part, '/')) path.push_back(url_decode(s));

        json parsed = body.empty() ? json::object() : json::parse(body);
        return route(method, path, query, parsed);

    } catch (const AegisError& e) {
        return fail(status_for(e.kind()), e.kind(), e.what());
    } catch (const json::exception& e) {
        return fail(400, ErrorKind::INVALID_ARGUMENT, std::string("bad request body: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return fail(400, ErrorKind::INVALID_ARGUMENT, std::string("bad parameter: ") + e.what());
    } catch (const std::out_of_range& e) {
        return fail(400, ErrorKind::INVALID_ARGUMENT, std::string("bad parameter: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] " << method << " " << target << " failed: " << e.what() << "\n";
        return fail(500, ErrorKind::NONE, e.what());
    }
}

ApiResponse OperatorApi::route(const std::string& method, const Segments& path,
                               const Query& query, const json& body) {
    if (path.size() < 2 || path[0] != "api") return no_route(method, path);
    const std::string& area = path[1];

    if (area == "health") {
        if (method != "GET") return wrong_method(method);
        return ok({{"status", cp_.started() ? "up" : "stopped"},
                   {"tradingMode", trading_mode_to_string(cp_.safety().trading_mode())}});
    }
    if (area == "safety") return safety(method, path, body);
    if (area == "pipelines") return pipelines(method, path, body);
    if (area == "candidates") return candidates(method, path, body);
    if (area == "capital") return capital(method, path, query, body);
    if (area == "evidence") return evidence(method, path, query, body);

    if (area == "orders" && path.size() == 2) {
        if (method != "POST") return wrong_method(method);
        OrderIntent intent = body.get<OrderIntent>();
        ExecutionReport r = cp_.gateway().submit(intent);
        return ok({{"report", r}});
    }

    if (area == "promotion" && path.size() == 3) {
        if (path[2] == "stats") {
            if (method != "GET") return wrong_method(method);
            return ok({{"stats", cp_.pipeline().stats()}});
        }
        if (path[2] == "sweep") {
            if (method != "POST") return wrong_method(method);
            return ok({{"decided", cp_.pipeline().check_for_promotions()}});
        }
    }

    if (area == "strategies" && path.size() == 2) {
        if (method != "GET") return wrong_method(method);
        return ok({{"strategies", cp_.registry().all()}});
    }

    if (area == "decisions" && path.size() == 2) {
        if (method != "POST") return wrong_method(method);
        DecisionTrace t = cp_.execute_decision(decision_request_from_json(body));
        return ok({{"trace", t},
                   {"proofStrength", proof_strength_to_string(DecisionRecorder::proof_strength(t))}});
    }

    if (area == "nudge" && path.size() == 3) {
        if (path[2] == "stats") {
            if (method != "GET") return wrong_method(method);
            return ok({{"stats", cp_.nudge().stats()}});
        }
        if (path[2] == "reset") {
            if (method != "POST") return wrong_method(method);
            cp_.nudge().reset_breaker(body.value("reason", "operator reset"));
            return ok({{"breaker", cp_.nudge().breaker_status()}});
        }
    }

    if (area == "notifications" && path.size() == 2) {
        if (method != "GET") return wrong_method(method);
        json arr = json::array();
        for (const auto& n : cp_.bus().recent(query_size(query, "limit", 50)))
            arr.push_back(to_json_record(n));
        return ok({{"notifications", arr}});
    }

    return no_route(method, path);
}

// ---------------------------------------------------------------------------
// Safety
// ---------------------------------------------------------------------------

ApiResponse OperatorApi::safety(const std::string& method, const Segments& path, const json& body) {
    auto& s = cp_.safety();

    if (path.size() == 3 && path[2] == "status") {
        if (method != "GET") return wrong_method(method);
        return ok({{"status", s.status()}});
    }
    if (path.size() == 3 && path[2] == "trading-mode") {
        if (method != "POST") return wrong_method(method);
        s.set_trading_mode(trading_mode_from_string(body.at("mode").get<std::string>()));
        return ok({{"status", s.status()}});
    }
    if (path.size() == 3 && path[2] == "emergency-stop") {
        if (method != "POST") return wrong_method(method);
        s.set_emergency_stop(body.at("active").get<bool>(), body.value("reason", "operator"));
        return ok({{"status", s.status()}});
    }
    if (path.size() == 4 && path[2] == "circuit-breaker" && path[3] == "reset") {
        if (method != "POST") return wrong_method(method);
        s.reset_circuit_breaker(body.value("reason", "operator reset"));
        return ok({{"status", s.status()}});
    }
    return no_route(method, path);
}

// ---------------------------------------------------------------------------
// Pipelines / candidates
// ---------------------------------------------------------------------------

ApiResponse OperatorApi::pipelines(const std::string& method, const Segments& path, const json& body) {
    auto& p = cp_.pipeline();

    if (path.size() == 2) {
        if (method != "GET") return wrong_method(method);
        return ok({{"pipelines", p.pipelines()}});
    }

    const std::string& id = path[2];
    if (path.size() == 3) {
        if (method != "GET") return wrong_method(method);
        auto st = p.pipeline(id);
        if (!st) throw NotFound("pipeline " + id);
        return ok({{"pipeline", *st}});
    }
    if (path.size() == 4 && path[3] == "active") {
        if (method != "POST") return wrong_method(method);
        p.set_pipeline_active(id, body.at("active").get<bool>());
        return ok({{"pipeline", *p.pipeline(id)}});
    }
    if (path.size() == 6 && path[3] == "candidates" && path[5] == "promote") {
        if (method != "POST") return wrong_method(method);
        ValidationResult r = p.promote_candidate(path[4], id);
        return ok({{"result", r}});
    }
    return no_route(method, path);
}

ApiResponse OperatorApi::candidates(const std::string& method, const Segments& path, const json& body) {
    auto& p = cp_.pipeline();

    if (path.size() == 2) {
        if (method != "POST") return wrong_method(method);
        StrategyCandidate c = body.get<StrategyCandidate>();
        auto joined = p.add_candidate(c);
        return ok({{"candidateId", c.id}, {"joined", joined}});
    }

    const std::string& id = path[2];
    if (path.size() == 3) {
        if (method != "GET") return wrong_method(method);
        auto c = p.candidate(id);
        if (!c) throw NotFound("candidate " + id);

        json membership = json::array();
        for (const auto& st : p.pipelines()) {
            if (!st.contains(id)) continue;
            std::string where = "pending";
            if (!st.is_pending(id)) {
                bool promoted = std::any_of(st.promoted.begin(), st.promoted.end(),
                                            [&](const StrategyCandidate& x) { return x.id == id; });
                where = promoted ? "promoted" : "rejected";
            }
            membership.push_back({{"pipelineId", st.id}, {"status", where}});
        }
        return ok({{"candidate", *c}, {"pipelines", membership}});
    }
    if (path.size() == 4 && path[3] == "validations") {
        if (method != "GET") return wrong_method(method);
        return ok({{"results", p.validation_results(id)}});
    }
    if (path.size() == 4 && path[3] == "paper-trades") {
        if (method != "POST") return wrong_method(method);
        auto& v = cp_.paper_validator();
        const uint64_t now = cp_.clock().wall_ns();

        size_t recorded = 0;
        if (body.contains("trades")) {
            for (const auto& t : body.at("trades")) {
                v.record_trade(id, finite_number(t, "pnl"), t.value("ts", now));
                ++recorded;
            }
        } else {
            v.record_trade(id, finite_number(body, "pnl"), body.value("ts", now));
            ++recorded;
        }
        return ok({{"recorded", recorded}, {"total", v.trade_count(id)}});
    }
    return no_route(method, path);
}

// ---------------------------------------------------------------------------
// Capital
// ---------------------------------------------------------------------------

ApiResponse OperatorApi::capital(const std::string& method, const Segments& path,
                                 const Query& query, const json& body) {
    auto& l = cp_.ledger();
    if (path.size() < 3) return no_route(method, path);
    const std::string& what = path[2];

    if (what == "pools") {
        if (method != "GET") return wrong_method(method);
        if (path.size() == 3) return ok({{"pools", l.pools()}});

        const std::string& id = path[3];
        if (path.size() == 4) {
            auto pool = l.pool(id);
            if (!pool) throw NotFound("pool " + id);
            return ok({{"pool", *pool}, {"allocations", l.allocations_for_pool(id)}});
        }
        if (path.size() == 5 && path[4] == "analytics") {
            return ok({{"analytics", l.analytics(id)}});
        }
        return no_route(method, path);
    }

    if (path.size() != 3) return no_route(method, path);

    if (what == "transactions") {
        if (method != "GET") return wrong_method(method);
        return ok({{"transactions",
                    l.transactions(query_str(query, "pool"), query_size(query, "limit", 100))}});
    }
    if (what == "allocations") {
        if (method != "GET") return wrong_method(method);
        return ok({{"allocations", l.allocations(query_str(query, "active") == "true")}});
    }

    if (method != "POST") return wrong_method(method);

    if (what == "allocate") {
        auto a = l.allocate_capital(body.at("poolId").get<std::string>(),
                                    body.at("experimentId").get<std::string>(),
                                    body.at("amount").get<double>(),
                                    risk_level_from_string(body.value("riskLevel", "low")));
        return ok({{"allocation", a}});
    }
    if (what == "release") {
        auto a = l.release_capital(body.at("allocationId").get<std::string>(),
                                   finite_number(body, "finalPnl"));
        return ok({{"allocation", a}});
    }
    if (what == "transfer") {
        const std::string from = body.at("fromPoolId").get<std::string>();
        const std::string to = body.at("toPoolId").get<std::string>();
        l.transfer_capital(from, to, body.at("amount").get<double>(),
                           body.value("reason", "operator transfer"));
        return ok({{"from", *l.pool(from)}, {"to", *l.pool(to)}});
    }
    if (what == "pnl") {
        auto a = l.update_pnl(body.at("allocationId").get<std::string>(),
                              finite_number(body, "delta"));
        return ok({{"allocation", a}});
    }
    return no_route(method, path);
}

// ---------------------------------------------------------------------------
// Evidence
// ---------------------------------------------------------------------------

static json trace_view(const DecisionTrace& t) {
    return json{{"trace", t},
                {"proofStrength", proof_strength_to_string(DecisionRecorder::proof_strength(t))},
                {"verified", DecisionRecorder::verify(t)}};
}

ApiResponse OperatorApi::evidence(const std::string& method, const Segments& path,
                                  const Query& query, const json& body) {
    if (path.size() == 5 && path[2] == "traces" && path[4] == "execution") {
        if (method != "POST") return wrong_method(method);
        std::optional<double> pnl;
        if (body.contains("realizedPnl")) pnl = finite_number(body, "realizedPnl");
        DecisionTrace t = cp_.report_execution(
            path[3],
            execution_status_from_string(body.at("status").get<std::string>()),
            body.value("brokerOrderIds", std::vector<std::string>{}),
            body.value("reason", ""),
            pnl);
        return ok(trace_view(t));
    }

    if (method != "GET") return wrong_method(method);
    if (path.size() != 4) return no_route(method, path);

    auto& r = cp_.recorder();
    if (path[2] == "traces") {
        auto t = r.get(path[3]);
        if (!t) throw NotFound("trace " + path[3]);
        return ok(trace_view(*t));
    }
    if (path[2] == "symbols") {
        json arr = json::array();
        for (const auto& t : r.by_symbol(path[3], query_size(query, "limit", 20)))
            arr.push_back(trace_view(t));
        return ok({{"symbol", path[3]}, {"traces", arr}});
    }
    return no_route(method, path);
}

} // namespace aegis
