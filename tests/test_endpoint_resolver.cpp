#include <gtest/gtest.h>
#include "core/endpoint_resolver.hpp"
#include "core/profile_lifecycle.hpp"
#include "debug_endpoint_server.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <memory>

using json = nlohmann::json;
using std::chrono::milliseconds;

static const char* kStart = "/api/profiles/start";
static const char* kForceStop = "/api/profiles/force_stop";

static json endpoint_body(int port) {
    return {
        {"uuid", "p1"},
        {"debug_port", port},
        {"ws_endpoint", "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser/x"},
    };
}

static FakeReply ambiguous() {
    return FakeReply::json({{"success", true}, {"data", nullptr}});
}

static FakeReply zombie() {
    return FakeReply::error(400, R"({"error":"already_started","msg":"zombie: no debug port"})");
}

class EndpointResolverTest : public ::testing::Test {
protected:
    EndpointResolverTest() : transport(test_transport_options()), probe(probe_options()) {
        api.attach(transport);
        transport.set_sleep(sleeper.fn());
    }

    static ProbeOptions probe_options() {
        ProbeOptions opts;
        opts.http_timeout_ms = 500;
        return opts;
    }

    ResolveResult resolve(StartOptions options = {}, ResolverPolicy policy = {},
                          const std::atomic<bool>* cancel = nullptr) {
        lifecycle = std::make_unique<ProfileLifecycle>(transport, probe, EndpointCatalog::defaults(),
                                                       policy, sleeper.fn());
        return lifecycle->start("p1", options, cancel);
    }

    bool tried(const ResolveResult& r, const std::string& name) const {
        const auto& t = r.attempt.tried;
        return std::find(t.begin(), t.end(), name) != t.end();
    }

    FakeOctoApi api;
    SleepRecorder sleeper;
    Transport transport;
    PortProbe probe;
    std::unique_ptr<ProfileLifecycle> lifecycle;
};

// ── Starting ────────────────────────────────────────────────

TEST_F(EndpointResolverTest, StartPayload) {
    StartOptions opts;
    opts.headless = true;
    opts.flags = {"--mute-audio"};
    json p = EndpointResolver::build_start_payload("p1", opts, 120);
    EXPECT_EQ(p["uuid"], "p1");
    EXPECT_EQ(p["headless"], true);
    EXPECT_EQ(p["debug_port"], true);
    EXPECT_EQ(p["timeout"], 120);
    EXPECT_EQ(p["only_local"], true);
    EXPECT_EQ(p["flags"], json::array({"--mute-audio"}));

    opts.debug_port = 52400;
    EXPECT_EQ(EndpointResolver::build_start_payload("p1", opts, 120)["debug_port"], 52400);
}

TEST_F(EndpointResolverTest, StartReturnsEndpointDirectly) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {FakeReply::json(endpoint_body(52341))});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(*r.endpoint->ws_endpoint(), "ws://127.0.0.1:52341/devtools/browser/x");
    EXPECT_EQ(r.attempt.start_attempts, 1);
    EXPECT_TRUE(sleeper.waits.empty());
    EXPECT_EQ(r.error.kind, ErrorKind::None);

    ASSERT_EQ(api.requests.size(), 1u);
    EXPECT_EQ(json::parse(api.requests[0].body)["uuid"], "p1");
}

TEST_F(EndpointResolverTest, StartEndpointUnderData) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::json({{"success", true}, {"data", endpoint_body(52342)}})});
    auto r = resolve();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.endpoint->port(), 52342);
}

TEST_F(EndpointResolverTest, PortWithoutWebsocketStillResolves) {
    // Nothing listens on the port, so derivation fails and only the port is kept
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {FakeReply::json({{"debug_port", "127.0.0.1:52999"}})});
    auto r = resolve();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.endpoint->port(), 52999);
    EXPECT_FALSE(r.endpoint->ws_endpoint().has_value());
}

TEST_F(EndpointResolverTest, WebsocketDerivedFromLivePort) {
    DebugEndpointServer server(52341);
    if (!server.start()) GTEST_SKIP() << "port 52341 unavailable";

    api.on(HttpMethod::Post, ApiBase::Local, kStart, {FakeReply::json({{"debug_port", 52341}})});
    auto r = resolve();
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.endpoint->ws_endpoint().has_value());
    EXPECT_EQ(*r.endpoint->ws_endpoint(), server.ws_url());
}

TEST_F(EndpointResolverTest, UnexpectedErrorIsTerminal) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {FakeReply::error(500, "internal")});
    auto r = resolve();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::ServerError);
    EXPECT_EQ(r.error.status, 500);
    EXPECT_FALSE(r.is_operator_actionable());
    EXPECT_EQ(api.calls_to(kStart), 1);
}

TEST_F(EndpointResolverTest, ExplicitFailureInSuccessStatus) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::json({{"success", false}, {"error", "profile is locked"}})});
    auto r = resolve();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::ClientError);
    EXPECT_TRUE(r.error.mentions("profile is locked"));
}

// ── Cross-store lag ─────────────────────────────────────────

TEST_F(EndpointResolverTest, NotYetVisibleIsRetried) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::error(404), FakeReply::error(404), FakeReply::json(endpoint_body(52343))});
    auto r = resolve();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.attempt.start_attempts, 3);
    EXPECT_EQ(sleeper.waits, (std::vector<milliseconds>{milliseconds(2000), milliseconds(2000)}));
}

TEST_F(EndpointResolverTest, NotYetVisibleExhausted) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {FakeReply::error(404)});
    auto r = resolve();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::ClientError);
    EXPECT_EQ(r.error.status, 404);
    EXPECT_EQ(api.calls_to(kStart), 5);
}

// ── Ambiguous success and polling ───────────────────────────

TEST_F(EndpointResolverTest, AmbiguousSuccessThenPolling) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    api.on(HttpMethod::Get, ApiBase::Local, "/api/v2/automation/profiles/p1",
           {FakeReply::json({{"success", true}, {"data", endpoint_body(52555)}})});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52555);
    EXPECT_EQ(r.attempt.poll_rounds, 1);
    ASSERT_FALSE(sleeper.waits.empty());
    EXPECT_EQ(sleeper.waits[0], milliseconds(2000));
}

TEST_F(EndpointResolverTest, PollingFindsProfileInListing) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    api.on(HttpMethod::Get, ApiBase::Local, "/api/profiles/active",
           {FakeReply::json(json::array({json{{"uuid", "other"}, {"debug_port", 52001}}, endpoint_body(52556)}))});

    auto r = resolve();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.endpoint->port(), 52556);
    EXPECT_TRUE(tried(r, "list/active"));
}

TEST_F(EndpointResolverTest, PollingExhaustedWithoutProbingIsActionable) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});

    auto r = resolve();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::NoEndpoint);
    EXPECT_TRUE(r.is_operator_actionable());
    EXPECT_TRUE(r.error.mentions("port scanning"));
    EXPECT_EQ(r.attempt.poll_rounds, 5);
    EXPECT_EQ(sleeper.total(), milliseconds(2000 + 4000 + 6000 + 8000 + 10000));
    EXPECT_EQ(r.attempt.waited, sleeper.total());
}

TEST_F(EndpointResolverTest, FinalRoundTriesCloudStart) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous(), FakeReply::error(500)});
    api.on(HttpMethod::Post, ApiBase::Cloud, "/api/v2/automation/profiles/p1/start",
           {FakeReply::json(endpoint_body(52600))});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52600);
    EXPECT_EQ(r.attempt.poll_rounds, 5);
    EXPECT_EQ(api.calls(HttpMethod::Post, ApiBase::Cloud, "/api/v2/automation/profiles/p1/start"), 1);
}

TEST_F(EndpointResolverTest, CancelMidPoll) {
    std::atomic<bool> cancel{false};
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    api.on_request = [&](const RawRequest& req) {
        if (req.path == "/api/v2/automation/profiles/p1") cancel.store(true);
    };

    auto r = resolve({}, {}, &cancel);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(r.is_operator_actionable());
    EXPECT_EQ(r.attempt.poll_rounds, 1);
    EXPECT_EQ(api.calls_to(kStart), 2);
    EXPECT_EQ(api.calls_to("/api/v2/automation/profiles/p1"), 1);
}

TEST_F(EndpointResolverTest, CancelledBeforeStartMakesNoCalls) {
    std::atomic<bool> cancel{true};
    auto r = resolve({}, {}, &cancel);
    EXPECT_EQ(r.error.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(api.requests.empty());
}

// ── Probing ─────────────────────────────────────────────────

TEST_F(EndpointResolverTest, ManualPortOutOfRangeRejected) {
    StartOptions opts;
    opts.debug_port = 70000;
    auto r = resolve(opts);
    EXPECT_EQ(r.error.kind, ErrorKind::NoEndpoint);
    EXPECT_TRUE(api.requests.empty());
}

TEST_F(EndpointResolverTest, ManualPortNotLiveFails) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    StartOptions opts;
    opts.debug_port = 52998;

    auto r = resolve(opts);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::NoEndpoint);
    EXPECT_TRUE(tried(r, "probe/manual-port"));
    EXPECT_FALSE(tried(r, "probe/scan"));
    EXPECT_EQ(json::parse(api.requests[0].body)["debug_port"], 52998);
}

TEST_F(EndpointResolverTest, ManualPortLiveResolves) {
    DebugEndpointServer server(52341);
    if (!server.start()) GTEST_SKIP() << "port 52341 unavailable";

    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    StartOptions opts;
    opts.debug_port = 52341;

    auto r = resolve(opts);
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(*r.endpoint->ws_endpoint(), server.ws_url());
}

TEST_F(EndpointResolverTest, ScanFallbackFindsLivePort) {
    DebugEndpointServer server(52341);
    if (!server.start()) GTEST_SKIP() << "port 52341 unavailable";

    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    StartOptions opts;
    opts.allow_port_scan = true;
    ResolverPolicy policy;
    policy.scan_ports = {52339, 52340, 52341, 52342};

    auto r = resolve(opts, policy);
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_TRUE(tried(r, "probe/scan"));
}

TEST_F(EndpointResolverTest, ScanExhaustedIsNoEndpoint) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {ambiguous()});
    StartOptions opts;
    opts.allow_port_scan = true;
    ResolverPolicy policy;
    policy.scan_ports = {1, 2};

    auto r = resolve(opts, policy);
    EXPECT_EQ(r.error.kind, ErrorKind::NoEndpoint);
    EXPECT_TRUE(r.is_operator_actionable());
}

// ── Already running and zombies ─────────────────────────────

TEST_F(EndpointResolverTest, AlreadyRunningFoundInListing) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::error(400, R"({"error":"already_started"})")});
    api.on(HttpMethod::Get, ApiBase::Local, "/api/profiles/active",
           {FakeReply::json({{"data", json::array({endpoint_body(52777)})}})});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52777);
    EXPECT_EQ(api.calls_to(kForceStop), 0);
    EXPECT_EQ(r.attempt.zombie_rounds, 0);
}

TEST_F(EndpointResolverTest, AlreadyRunningNotListedIsTreatedAsZombie) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::error(400, R"({"error":"already_started"})"),
            FakeReply::json(endpoint_body(52778))});
    api.on(HttpMethod::Post, ApiBase::Local, kForceStop, {FakeReply::json({{"success", true}})});

    auto r = resolve();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(api.calls_to(kForceStop), 1);
    EXPECT_EQ(r.attempt.zombie_rounds, 1);
}

TEST_F(EndpointResolverTest, ZombieTwiceThenSuccess) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {zombie(), zombie(), FakeReply::json(endpoint_body(52341))});
    api.on(HttpMethod::Post, ApiBase::Local, kForceStop, {FakeReply::json({{"success", true}})});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(api.calls_to(kForceStop), 2);
    EXPECT_EQ(r.attempt.start_attempts, 3);
    EXPECT_EQ(r.attempt.zombie_rounds, 2);
    EXPECT_EQ(sleeper.waits, (std::vector<milliseconds>{milliseconds(12000), milliseconds(15000)}));
    // Each round looks the profile up before force-stopping it
    EXPECT_EQ(api.calls_to("/api/profiles/active"), 2);
}

TEST_F(EndpointResolverTest, ZombiePersistsIsUnrecoverable) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {zombie()});
    api.on(HttpMethod::Post, ApiBase::Local, kForceStop, {FakeReply::json({{"success", true}})});

    auto r = resolve();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error.kind, ErrorKind::ZombieUnrecoverable);
    EXPECT_FALSE(r.is_operator_actionable());
    EXPECT_EQ(r.attempt.start_attempts, 3);
    EXPECT_EQ(r.attempt.zombie_rounds, 3);
    EXPECT_EQ(api.calls_to(kForceStop), 2);
    EXPECT_TRUE(r.error.mentions("3 start attempts"));
}

TEST_F(EndpointResolverTest, SingleRoundPolicyNeverForceStops) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {zombie()});
    ResolverPolicy policy;
    policy.zombie_rounds = 1;

    auto r = resolve({}, policy);
    EXPECT_EQ(r.error.kind, ErrorKind::ZombieUnrecoverable);
    EXPECT_EQ(api.calls_to(kForceStop), 0);
    EXPECT_EQ(r.attempt.start_attempts, 1);
}

TEST_F(EndpointResolverTest, AlreadyRunningWithPortInErrorBodyResolves) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::error(409, R"({"error":"already_started","debug_port":52341,)"
                                  R"("ws_endpoint":"ws://127.0.0.1:52341/devtools/browser/x"})")});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(api.calls_to(kForceStop), 0);
    EXPECT_EQ(r.attempt.zombie_rounds, 0);
}

TEST_F(EndpointResolverTest, FieldNamesInErrorTextAreNotZombieMarkers) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart,
           {FakeReply::error(409, R"({"error":"already_started","detail":"debug_port, ws_endpoint"})")});
    api.on(HttpMethod::Get, ApiBase::Local, "/api/profiles/active",
           {FakeReply::json(json::array({endpoint_body(52341)}))});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(api.calls_to(kForceStop), 0);
    EXPECT_EQ(api.calls_to("/api/profiles/active"), 1);
}

TEST_F(EndpointResolverTest, ZombieFoundInListingIsNotForceStopped) {
    api.on(HttpMethod::Post, ApiBase::Local, kStart, {zombie()});
    api.on(HttpMethod::Get, ApiBase::Local, "/api/profiles/active",
           {FakeReply::json(json::array({endpoint_body(52341)}))});

    auto r = resolve();
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.endpoint->port(), 52341);
    EXPECT_EQ(api.calls_to(kForceStop), 0);
    EXPECT_EQ(r.attempt.start_attempts, 1);
}
