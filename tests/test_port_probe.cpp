#include <gtest/gtest.h>
#include "api/port_probe.hpp"

#include "debug_endpoint_server.hpp"

#include <atomic>
#include <vector>

TEST(PortProbeTest, DefaultCandidatesOrder) {
    auto ports = PortProbe::default_candidates();
    ASSERT_EQ(ports.size(), (53200u - 52000u + 1u) + (9350u - 9222u + 1u));
    EXPECT_EQ(ports.front(), 52000);
    EXPECT_EQ(ports[53200 - 52000], 53200);
    EXPECT_EQ(ports[53200 - 52000 + 1], 9222);
    EXPECT_EQ(ports.back(), 9350);
}

TEST(PortProbeTest, ExpandRangesDropsInvalidPorts) {
    auto ports = PortProbe::expand_ranges({{65534, 65537}, {0, 1}});
    EXPECT_EQ(ports, (std::vector<int>{65534, 65535, 1}));
}

TEST(PortProbeTest, ClosedPortIsNotLive) {
    PortProbe probe;
    // Port 1 (tcpmux) is essentially never served on a test machine
    EXPECT_FALSE(probe.tcp_connect(1, 100));
    EXPECT_FALSE(probe.is_live_debug_port(1));
    EXPECT_FALSE(probe.tcp_connect(0, 100));
}

TEST(PortProbeTest, LiveEndpointAnswers) {
    DebugEndpointServer server(52341);
    if (!server.start()) GTEST_SKIP() << "port 52341 unavailable";

    PortProbe probe;
    EXPECT_TRUE(probe.tcp_connect(52341, 500));
    EXPECT_TRUE(probe.is_live_debug_port(52341));
    auto ws = probe.fetch_ws_endpoint(52341);
    ASSERT_TRUE(ws.has_value());
    EXPECT_EQ(*ws, "ws://127.0.0.1:52341/devtools/browser/test");
}

TEST(PortProbeTest, ScanStopsAtFirstMatch) {
    DebugEndpointServer server(52341);
    if (!server.start()) GTEST_SKIP() << "port 52341 unavailable";

    PortProbe probe;
    std::vector<int> visited;
    probe.on_probe = [&](int port) { visited.push_back(port); };

    std::vector<int> ports = {52338, 52339, 52340, 52341, 52342, 52343};
    auto found = probe.scan_range(ports, 100, "profile-1");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->port(), 52341);
    EXPECT_EQ(found->profile_id(), "profile-1");
    ASSERT_TRUE(found->ws_endpoint().has_value());
    EXPECT_EQ(visited.back(), 52341);
    EXPECT_EQ(visited.size(), 4u);
}

TEST(PortProbeTest, ScanExhaustedReturnsNothing) {
    PortProbe probe;
    std::vector<int> visited;
    probe.on_probe = [&](int port) { visited.push_back(port); };

    auto found = probe.scan_range({1, 2, 3}, 50, "p");
    EXPECT_FALSE(found.has_value());
    EXPECT_EQ(visited.size(), 3u);
}

TEST(PortProbeTest, ScanObservesCancel) {
    PortProbe probe;
    std::atomic<bool> cancel{false};
    std::vector<int> visited;
    probe.on_probe = [&](int port) {
        visited.push_back(port);
        cancel.store(true);
    };

    auto found = probe.scan_range({1, 2, 3}, 50, "p", &cancel);
    EXPECT_FALSE(found.has_value());
    EXPECT_EQ(visited.size(), 1u);
}
