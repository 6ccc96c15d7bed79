#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "aegis/runtime/OperatorApi.hpp"
#include "aegis/runtime/OperatorServer.hpp"
#include "aegis/store/MemoryStateStore.hpp"

using namespace aegis;
using json = nlohmann::json;

namespace {

ControlPlaneSettings test_settings() {
    ControlPlaneSettings s;
    s.pools = default_pools();
    s.pipelines = default_pipelines();
    s.http.enabled = false;
    // Periodic tasks stay out of the way; tests drive everything directly.
    s.schedule.promotion_sweep_sec = 3600;
    s.schedule.safety_tick_ms = 60000;
    s.schedule.nudge_tick_ms = 60000;
    return s;
}

json candidate_body(const std::string& id) {
    return json{
        {"id", id},
        {"name", "breakout " + id},
        {"fitness", 2.4},
        {"generation", 12},
        {"experimentId", "exp_" + id},
        {"performance", {{"totalTrades", 150}, {"winRate", 0.65}, {"profitFactor", 1.8},
                         {"maxDrawdown", 0.12}, {"sharpeRatio", 1.82}}},
        {"metadata", {{"riskLevel", "low"}, {"strategyType", "breakout"}}}
    };
}

json decision_body(const std::string& symbol) {
    return json{
        {"symbol", symbol},
        {"sector", "tech"},
        {"strategy_id", "strat_x"},
        {"plan", {{"action", "buy"}, {"qty", 10}}},
        {"risk_gate", {{"position_limits_ok", true}, {"portfolio_heat_ok", true},
                       {"drawdown_ok", true}}},
        {"market_context", {{"vix", 17.0}}}
    };
}

// Accepts every order as a working order; fills arrive later.
class WorkingOrderBroker : public BrokerAdapter {
public:
    int calls = 0;

    std::string name() const override { return "ext"; }

    ExecutionReport submit(const OrderIntent&) override {
        ExecutionReport r;
        r.status = ExecutionStatus::LIVE;
        r.mode = TradingMode::LIVE;
        r.broker_order_ids = {"ext-" + std::to_string(++calls)};
        return r;
    }
};

struct ApiFixture : ::testing::Test {
    ManualClock clock;
    MemoryStateStore store;
    ControlPlane cp{test_settings(), store, clock};
    OperatorApi api{cp};

    void SetUp() override { cp.start(); }
    void TearDown() override { cp.stop(); }

    ApiResponse get(const std::string& target) { return api.handle("GET", target, ""); }
    ApiResponse post(const std::string& target, const json& body = json::object()) {
        return api.handle("POST", target, body.dump());
    }
};

} // namespace

// --- Routing ---

TEST_F(ApiFixture, HealthReportsPaperMode) {
    auto r = get("/api/health");
    EXPECT_EQ(r.status, 200);
    EXPECT_TRUE(r.body["success"].get<bool>());
    EXPECT_EQ(r.body["status"], "up");
    EXPECT_EQ(r.body["tradingMode"], "paper");
}

TEST_F(ApiFixture, UnknownRouteAndWrongMethod) {
    auto r = get("/api/nothing-here");
    EXPECT_EQ(r.status, 404);
    EXPECT_FALSE(r.body["success"].get<bool>());
    EXPECT_EQ(r.body["error"], "NotFound");

    EXPECT_EQ(post("/api/health").status, 405);
}

TEST_F(ApiFixture, MalformedJsonIsBadRequest) {
    auto r = api.handle("POST", "/api/capital/allocate", "{\"poolId\": ");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.body["error"], "InvalidArgument");

    // Missing required field.
    EXPECT_EQ(post("/api/capital/allocate", json{{"poolId", "research_pool"}}).status, 400);
}

// --- Safety ---

TEST_F(ApiFixture, EmergencyStopBlocksDecisions) {
    auto r = post("/api/safety/emergency-stop", json{{"active", true}, {"reason", "exchange halt"}});
    ASSERT_EQ(r.status, 200);
    EXPECT_TRUE(r.body["status"]["emergencyStopActive"].get<bool>());

    auto d = post("/api/decisions", decision_body("AAPL"));
    ASSERT_EQ(d.status, 200);
    EXPECT_EQ(d.body["trace"]["execution"]["status"], "blocked");
    EXPECT_NE(d.body["trace"]["execution"]["reason"].get<std::string>().find("exchange halt"),
              std::string::npos);

    post("/api/safety/emergency-stop", json{{"active", false}, {"reason", "resumed"}});
    auto again = post("/api/decisions", decision_body("AAPL"));
    EXPECT_EQ(again.body["trace"]["execution"]["status"], "filled");
}

TEST_F(ApiFixture, TradingModeValidated) {
    EXPECT_EQ(post("/api/safety/trading-mode", json{{"mode", "yolo"}}).status, 400);
    auto r = post("/api/safety/trading-mode", json{{"mode", "live"}});
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(get("/api/health").body["tradingMode"], "live");
}

// --- Capital ---

TEST_F(ApiFixture, PoolsInstalledFromSettings) {
    auto r = get("/api/capital/pools");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["pools"].size(), 3u);

    auto one = get("/api/capital/pools/competition_pool");
    EXPECT_DOUBLE_EQ(one.body["pool"]["totalCapital"].get<double>(), 50000.0);
    EXPECT_EQ(get("/api/capital/pools/nope").status, 404);
}

TEST_F(ApiFixture, InsufficientCapitalIsConflict) {
    auto r = post("/api/capital/allocate", json{{"poolId", "research_pool"},
                                                {"experimentId", "exp_big"},
                                                {"amount", 20000},
                                                {"riskLevel", "low"}});
    EXPECT_EQ(r.status, 409);
    EXPECT_EQ(r.body["error"], "InsufficientCapital");
    EXPECT_TRUE(get("/api/capital/allocations?active=true").body["allocations"].empty());
}

TEST_F(ApiFixture, AllocateThenRelease) {
    auto a = post("/api/capital/allocate", json{{"poolId", "research_pool"},
                                                {"experimentId", "exp_1"},
                                                {"amount", 800},
                                                {"riskLevel", "low"}});
    ASSERT_EQ(a.status, 200);
    std::string id = a.body["allocation"]["id"];

    auto r = post("/api/capital/release", json{{"allocationId", id}, {"finalPnl", 120}});
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["allocation"]["status"], "released");

    auto txns = get("/api/capital/transactions?pool=research_pool&limit=10");
    EXPECT_EQ(txns.body["transactions"].size(), 3u);   // created, allocation, release
}

// --- Pipelines ---

TEST_F(ApiFixture, CandidateMembershipAndPromotion) {
    auto sub = post("/api/candidates", candidate_body("c7"));
    ASSERT_EQ(sub.status, 200);
    // high_freq_promotion is inactive by default.
    EXPECT_EQ(sub.body["joined"].size(), 2u);

    auto view = get("/api/candidates/c7");
    ASSERT_EQ(view.status, 200);
    EXPECT_EQ(view.body["pipelines"].size(), 2u);
    EXPECT_EQ(view.body["pipelines"][0]["status"], "pending");

    post("/api/candidates/c7/paper-trades",
         json{{"trades", json::array({json{{"pnl", 400.0}}, json{{"pnl", 250.0}},
                                      json{{"pnl", -40.0}}})}});

    auto promo = post("/api/pipelines/aggressive_promotion/candidates/c7/promote");
    ASSERT_EQ(promo.status, 200);
    EXPECT_TRUE(promo.body["result"]["passed"].get<bool>());

    auto strategies = get("/api/strategies");
    EXPECT_EQ(strategies.body["strategies"].size(), 1u);

    auto again = post("/api/pipelines/aggressive_promotion/candidates/c7/promote");
    EXPECT_EQ(again.status, 409);

    EXPECT_EQ(get("/api/candidates/c7/validations").body["results"].size(), 1u);
    EXPECT_EQ(get("/api/candidates/unknown").status, 404);
}

TEST_F(ApiFixture, PipelineToggle) {
    auto r = post("/api/pipelines/high_freq_promotion/active", json{{"active", true}});
    ASSERT_EQ(r.status, 200);
    EXPECT_TRUE(r.body["pipeline"]["active"].get<bool>());
    EXPECT_EQ(get("/api/promotion/stats").body["stats"]["activePipelines"], 3);
}

// --- Decisions / evidence ---

TEST_F(ApiFixture, DecisionIsRecordedAndRetrievable) {
    auto d = post("/api/decisions", decision_body("NVDA"));
    ASSERT_EQ(d.status, 200);
    const auto& trace = d.body["trace"];
    EXPECT_EQ(trace["execution"]["status"], "filled");
    EXPECT_EQ(trace["execution"]["brokerOrderIds"][0], "paper-1");

    std::string id = trace["trace_id"];
    auto fetched = get("/api/evidence/traces/" + id);
    ASSERT_EQ(fetched.status, 200);
    EXPECT_TRUE(fetched.body["verified"].get<bool>());

    auto by_symbol = get("/api/evidence/symbols/NVDA?limit=5");
    EXPECT_EQ(by_symbol.body["traces"].size(), 1u);
    EXPECT_EQ(get("/api/evidence/traces/trace_missing").status, 404);
}

TEST_F(ApiFixture, LaterFillIsRecordedAndCountedBySafety) {
    WorkingOrderBroker live;
    cp.set_live_broker(&live);
    ASSERT_EQ(post("/api/safety/trading-mode", json{{"mode", "live"}}).status, 200);

    auto d = post("/api/decisions", decision_body("AAPL"));
    ASSERT_EQ(d.status, 200);
    EXPECT_EQ(d.body["trace"]["execution"]["status"], "live");
    std::string id = d.body["trace"]["trace_id"];
    EXPECT_EQ(get("/api/safety/status").body["status"]["circuitBreaker"]["currentTradeCount"], 0);

    const std::string target = "/api/evidence/traces/" + id + "/execution";
    auto r = post(target, json{{"status", "filled"}, {"realizedPnl", -75.0}, {"reason", "closed"}});
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["trace"]["execution"]["status"], "filled");
    EXPECT_EQ(r.body["trace"]["execution"]["brokerOrderIds"][0], "ext-1");
    EXPECT_TRUE(r.body["verified"].get<bool>());

    auto status = get("/api/safety/status").body["status"];
    EXPECT_EQ(status["circuitBreaker"]["currentTradeCount"], 1);
    EXPECT_DOUBLE_EQ(status["dailyPnl"].get<double>(), -75.0);
    EXPECT_DOUBLE_EQ(status["circuitBreaker"]["currentDailyLoss"].get<double>(), 75.0);
    EXPECT_TRUE(status["cooldown"]["active"].get<bool>());

    // Terminal: a second report is refused and safety is not counted twice.
    EXPECT_EQ(post(target, json{{"status", "filled"}}).status, 409);
    EXPECT_EQ(get("/api/safety/status").body["status"]["circuitBreaker"]["currentTradeCount"], 1);

    cp.set_live_broker(nullptr);
}

TEST_F(ApiFixture, ExecutionReportValidated) {
    auto d = post("/api/decisions", decision_body("MSFT"));
    std::string id = d.body["trace"]["trace_id"];
    const std::string target = "/api/evidence/traces/" + id + "/execution";

    EXPECT_EQ(post(target, json{{"status", "blocked"}}).status, 400);
    EXPECT_EQ(post(target, json{{"status", "sideways"}}).status, 400);
    EXPECT_EQ(post(target, json{{"status", "rejected"}, {"realizedPnl", 10.0}}).status, 400);
    EXPECT_EQ(post("/api/evidence/traces/trace_missing/execution",
                   json{{"status", "filled"}}).status, 404);
    EXPECT_EQ(get(target).status, 405);
}

TEST_F(ApiFixture, FailedRiskGateNeverReachesBroker) {
    auto body = decision_body("AMD");
    body["risk_gate"]["drawdown_ok"] = false;
    auto d = post("/api/decisions", body);
    ASSERT_EQ(d.status, 200);
    EXPECT_EQ(d.body["trace"]["execution"]["status"], "blocked");
    EXPECT_EQ(d.body["trace"]["execution"]["reason"], "risk gate failed (2/3 passed)");
    EXPECT_EQ(cp.gateway().routed_count(), 0u);
}

TEST_F(ApiFixture, NotificationsListed) {
    post("/api/safety/emergency-stop", json{{"active", true}, {"reason", "drill"}});
    auto r = get("/api/notifications?limit=5");
    ASSERT_EQ(r.status, 200);
    ASSERT_FALSE(r.body["notifications"].empty());
    EXPECT_EQ(r.body["notifications"].back()["type"], "emergency_stop_changed");
}

// --- HTTP front ---

TEST_F(ApiFixture, IdleClientDoesNotStallOtherRequests) {
    namespace asio = boost::asio;
    namespace http = boost::beast::http;
    using tcp = asio::ip::tcp;

    OperatorServer server(api, "127.0.0.1", 0, std::chrono::milliseconds(200));
    std::atomic<bool> running{true};
    std::thread th([&] { server.run(running); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (server.bound_port() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_NE(server.bound_port(), 0);
    const tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), server.bound_port());

    asio::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(ep);   // connects, never sends

    tcp::socket client(ioc);
    client.connect(ep);
    http::request<http::string_body> req{http::verb::get, "/api/health", 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(client, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(client, buffer, res);
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(json::parse(res.body())["status"], "up");

    running.store(false);
    th.join();
    EXPECT_EQ(server.timed_out(), 1u);
    EXPECT_EQ(server.served(), 1u);
}

TEST(OperatorApiStatus, ErrorKindMapping) {
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::INVALID_ARGUMENT), 400);
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::NOT_FOUND), 404);
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::INSUFFICIENT_CAPITAL), 409);
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::LIMIT_EXCEEDED), 422);
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::DEPLOYMENT_FAILURE), 502);
    EXPECT_EQ(OperatorApi::status_for(ErrorKind::CIRCUIT_BREAKER_TRIPPED), 503);
}
