#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/DiscoveryOrchestrator.h"
#include "../src/core/DeviceRegistry.h"
#include "../src/core/AliasStore.h"
#include "../src/core/Config.h"
#include "../src/core/ScanProgress.h"
#include "../src/core/ThreadPool.h"
#include "../src/discovery/AddressDiscovery.h"
#include "../src/discovery/RangeScanDiscovery.h"
#include "../src/net/Prober.h"

namespace plug_scan {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockDeviceControl : public DeviceControl {
public:
    MOCK_METHOD(std::optional<DeviceInfo>, identify, (const std::string& host, uint16_t port, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(PowerState, query_state, (const Device& device, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(CommandResult, invoke, (const Device& device, const std::string& command, const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout), (override));
};

class MockStrategy : public DiscoveryStrategy {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, description, (), (const, override));
    MOCK_METHOD(bool, applies, (const DiscoveryRequest& request), (const, override));
    MOCK_METHOD(std::vector<Candidate>, discover, (const DiscoveryRequest& request, ScanSession* session), (override));
};

class MockProber : public Prober {
public:
    MOCK_METHOD(ConnectResult, connect, (uint32_t addr, uint16_t port, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(SignatureResult, verify_signature, (uint32_t addr, uint16_t port, std::chrono::milliseconds timeout), (override));
};

static Candidate candidate(const std::string& host, const std::string& source) {
    Candidate c;
    c.host = host;
    c.port = 49153;
    c.source = source;
    return c;
}

class DiscoveryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(control_, identify(_, _, _)).WillByDefault(Invoke([](const std::string& host, uint16_t port, std::chrono::milliseconds){
            DeviceInfo i;
            i.udn = "uuid:" + host;
            i.name = "Plug " + host;
            i.host = host;
            i.port = port;
            return std::optional<DeviceInfo>(i);
        }));
    }

    // Registers a strategy that always applies and reports the given candidates.
    MockStrategy* add_strategy(DiscoveryOrchestrator& orch, const std::string& name, std::vector<Candidate> found) {
        auto s = std::make_unique<NiceMock<MockStrategy>>();
        ON_CALL(*s, name()).WillByDefault(Return(name));
        ON_CALL(*s, applies(_)).WillByDefault(Return(true));
        ON_CALL(*s, discover(_, _)).WillByDefault(Return(found));
        MockStrategy* raw = s.get();
        orch.register_strategy(std::move(s));
        return raw;
    }

    DiscoveryOrchestrator::Options opts() {
        DiscoveryOrchestrator::Options o;
        o.identify_timeout = std::chrono::milliseconds(100);
        o.identify_concurrency = 4;
        return o;
    }

    AliasStore aliases_;
    DeviceRegistry registry_{aliases_};
    NiceMock<MockDeviceControl> control_;
    ScanProgressTracker tracker_;
};

TEST_F(DiscoveryOrchestratorTest, MergesCandidatesFromAllStrategies) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    add_strategy(orch, "broadcast", {candidate("192.168.1.10", "broadcast")});
    add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan"), candidate("192.168.1.11", "range_scan")});

    DiscoverySummary s = orch.discover(DiscoveryRequest{});
    EXPECT_EQ(s.added, 2u);
    EXPECT_EQ(s.already_known, 0u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(s.results.size(), 2u);
    EXPECT_EQ(s.device_count, 2u);
    ASSERT_EQ(s.strategies_run.size(), 2u);
    EXPECT_EQ(s.strategies_run[0], "broadcast");
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(DiscoveryOrchestratorTest, RediscoveryIsIdempotent) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan"), candidate("192.168.1.11", "range_scan")});
    orch.discover(DiscoveryRequest{});
    registry_.set_alias("uuid:192.168.1.10", "Aquarium");

    DiscoverySummary again = orch.discover(DiscoveryRequest{});
    EXPECT_EQ(again.added, 0u);
    EXPECT_EQ(again.already_known, 2u);
    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.find("uuid:192.168.1.10")->alias.value_or(""), "Aquarium");
}

TEST_F(DiscoveryOrchestratorTest, FailingStrategyDoesNotStopOthers) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    MockStrategy* broken = add_strategy(orch, "broadcast", {});
    ON_CALL(*broken, discover(_, _)).WillByDefault(Throw(std::runtime_error("cannot send M-SEARCH: Network is unreachable")));
    add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan")});

    DiscoverySummary s = orch.discover(DiscoveryRequest{});
    EXPECT_EQ(s.added, 1u);
    ASSERT_EQ(s.failed_strategies.size(), 1u);
    EXPECT_EQ(s.failed_strategies[0].strategy, "broadcast");
    EXPECT_EQ(s.failed_strategies[0].error, "cannot send M-SEARCH: Network is unreachable");
}

TEST_F(DiscoveryOrchestratorTest, InapplicableStrategiesAreSkipped) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    MockStrategy* skipped = add_strategy(orch, "broadcast", {});
    ON_CALL(*skipped, applies(_)).WillByDefault(Return(false));
    EXPECT_CALL(*skipped, discover(_, _)).Times(0);
    add_strategy(orch, "range_scan", {});
    DiscoverySummary s = orch.discover(DiscoveryRequest{});
    ASSERT_EQ(s.strategies_run.size(), 1u);
    EXPECT_EQ(s.strategies_run[0], "range_scan");
}

TEST_F(DiscoveryOrchestratorTest, IdentificationFailuresAreCounted) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    ON_CALL(control_, identify("192.168.1.12", _, _)).WillByDefault(Return(std::optional<DeviceInfo>()));
    ON_CALL(control_, identify("192.168.1.13", _, _)).WillByDefault(Throw(DeviceError("connect 192.168.1.13:49153: timeout")));
    add_strategy(orch, "range_scan", {candidate("192.168.1.11", "range_scan"), candidate("192.168.1.12", "range_scan"),
                                      candidate("192.168.1.13", "range_scan")});
    DiscoverySummary s = orch.discover(DiscoveryRequest{});
    EXPECT_EQ(s.added, 1u);
    EXPECT_EQ(s.failed, 2u);
    for (const auto& r : s.results) {
        if (r.host == "192.168.1.12") EXPECT_EQ(r.error, "No device found");
        if (r.host == "192.168.1.13") EXPECT_EQ(r.error, "connect 192.168.1.13:49153: timeout");
    }
}

TEST_F(DiscoveryOrchestratorTest, ManualAddressesKeepInputAndErrors) {
    auto o = opts();
    o.identify_concurrency = 1;
    DiscoveryOrchestrator orch(registry_, control_, o);
    orch.register_strategy(std::make_unique<AddressDiscovery>(49153));
    EXPECT_CALL(control_, identify("not-an-ip", _, _)).Times(0);

    DiscoveryRequest req;
    req.addresses = {"192.168.1.20", "not-an-ip", "192.168.1.20"};
    DiscoverySummary s = orch.discover(req);
    ASSERT_EQ(s.results.size(), 3u);
    EXPECT_EQ(s.results[0].outcome, CandidateOutcome::Added);
    EXPECT_EQ(s.results[1].outcome, CandidateOutcome::Failed);
    EXPECT_EQ(s.results[1].input, "not-an-ip");
    EXPECT_EQ(s.results[1].error, "Invalid IP address format");
    EXPECT_EQ(s.results[2].outcome, CandidateOutcome::AlreadyKnown);
    EXPECT_EQ(s.device_count, 1u);
}

TEST_F(DiscoveryOrchestratorTest, SessionCompletesWithDeviceCount) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan"), candidate("192.168.1.11", "range_scan"),
                                      candidate("192.168.1.12", "range_scan")});
    auto session = tracker_.try_begin(ScanKind::Network, std::nullopt);
    ASSERT_TRUE(session.has_value());
    DiscoverySummary s = orch.discover(DiscoveryRequest{}, &*session);
    EXPECT_FALSE(s.cancelled);
    EXPECT_FALSE(session->open());
    ScanProgress p = tracker_.snapshot();
    EXPECT_FALSE(p.active);
    EXPECT_EQ(p.percent, 100);
    EXPECT_EQ(p.found, 3u);
    EXPECT_EQ(p.step, "Discovery completed - Found 3 devices");
}

TEST_F(DiscoveryOrchestratorTest, CancelledSessionSkipsStrategies) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    MockStrategy* s = add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan")});
    EXPECT_CALL(*s, discover(_, _)).Times(0);
    auto session = tracker_.try_begin(ScanKind::Network, std::nullopt);
    ASSERT_TRUE(session.has_value());
    ASSERT_EQ(tracker_.request_cancel(), CancelResult::Accepted);
    DiscoverySummary summary = orch.discover(DiscoveryRequest{}, &*session);
    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(summary.results.empty());
    ScanProgress p = tracker_.snapshot();
    EXPECT_FALSE(p.active);
    EXPECT_TRUE(p.cancelled);
    EXPECT_EQ(p.step, "Scan cancelled");
}

TEST_F(DiscoveryOrchestratorTest, ResourceErrorFailsSessionAndPropagates) {
    DiscoveryOrchestrator orch(registry_, control_, opts());
    MockStrategy* s = add_strategy(orch, "range_scan", {});
    ON_CALL(*s, discover(_, _)).WillByDefault(Throw(ResourceError("unable to start any worker thread")));
    auto session = tracker_.try_begin(ScanKind::Network, std::nullopt);
    EXPECT_THROW(orch.discover(DiscoveryRequest{}, &*session), ResourceError);
    ScanProgress p = tracker_.snapshot();
    EXPECT_FALSE(p.active);
    EXPECT_EQ(p.error, "unable to start any worker thread");
}

TEST_F(DiscoveryOrchestratorTest, ParallelStrategiesGiveSameResult) {
    auto o = opts();
    o.parallel = true;
    DiscoveryOrchestrator orch(registry_, control_, o);
    add_strategy(orch, "broadcast", {candidate("192.168.1.10", "broadcast")});
    add_strategy(orch, "range_scan", {candidate("192.168.1.10", "range_scan"), candidate("192.168.1.11", "range_scan")});
    DiscoverySummary s = orch.discover(DiscoveryRequest{});
    EXPECT_EQ(s.added, 2u);
    EXPECT_EQ(s.results.size(), 2u);
}

TEST_F(DiscoveryOrchestratorTest, RegistersDefaultStrategies) {
    NiceMock<MockProber> prober;
    Config cfg;
    DiscoveryOrchestrator orch(registry_, control_, opts());
    orch.register_all_default(prober, cfg);
    EXPECT_EQ(orch.strategy_count(), 3u);
}

TEST_F(DiscoveryOrchestratorTest, RangeScanStrategyFeedsScanner) {
    NiceMock<MockProber> prober;
    uint32_t hit = 0;
    parse_ipv4("10.0.0.7", hit);
    ON_CALL(prober, connect(_, _, _)).WillByDefault(Return(ConnectResult::Refused));
    ON_CALL(prober, connect(hit, 49153, _)).WillByDefault(Return(ConnectResult::Connected));
    ON_CALL(prober, verify_signature(_, _, _)).WillByDefault(Return(SignatureResult::Match));
    PortScanOptions scan;
    scan.probe_timeout = std::chrono::milliseconds(20);

    DiscoveryOrchestrator orch(registry_, control_, opts());
    orch.register_strategy(std::make_unique<RangeScanDiscovery>(prober, scan));
    DiscoveryRequest req;
    EXPECT_EQ(orch.discover(req).strategies_run.size(), 0u);
    req.range = validate_network("10.0.0.0/28").range;
    DiscoverySummary s = orch.discover(req);
    ASSERT_EQ(s.results.size(), 1u);
    EXPECT_EQ(s.results[0].host, "10.0.0.7");
    EXPECT_EQ(s.results[0].source, "range_scan");
}

TEST(SplitAddressesTest, SeparatorsAndBlanks) {
    auto v = split_addresses(" 192.168.1.5,192.168.1.6 ;\n10.0.0.1\t,, ");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0], "192.168.1.5");
    EXPECT_EQ(v[1], "192.168.1.6");
    EXPECT_EQ(v[2], "10.0.0.1");
    EXPECT_TRUE(split_addresses(" , ; ").empty());
}

TEST(ManualAddressTest, LeadingZerosAreDecimal) {
    uint32_t addr = 0;
    ASSERT_TRUE(parse_manual_ipv4("192.168.001.005", addr));
    EXPECT_EQ(ipv4_to_string(addr), "192.168.1.5");
    ASSERT_TRUE(parse_manual_ipv4("010.000.000.010", addr));
    EXPECT_EQ(ipv4_to_string(addr), "10.0.0.10");
    EXPECT_FALSE(parse_manual_ipv4("192.168.1.256", addr));
    EXPECT_FALSE(parse_manual_ipv4("192.168.0001.5", addr));
    EXPECT_FALSE(parse_manual_ipv4("192.168.1", addr));
    EXPECT_FALSE(parse_manual_ipv4("192.168.1.5.", addr));
    EXPECT_FALSE(parse_manual_ipv4("", addr));

    AddressDiscovery discovery(49153);
    DiscoveryRequest req;
    req.addresses = {"192.168.001.005"};
    auto found = discovery.discover(req, nullptr);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_TRUE(found[0].error.empty());
    EXPECT_EQ(found[0].host, "192.168.1.5");
    EXPECT_EQ(found[0].input, "192.168.001.005");
}

TEST(CandidateOutcomeTest, Names) {
    EXPECT_STREQ(candidate_outcome_name(CandidateOutcome::Added), "added");
    EXPECT_STREQ(candidate_outcome_name(CandidateOutcome::AlreadyKnown), "already_known");
    EXPECT_STREQ(candidate_outcome_name(CandidateOutcome::Failed), "failed");
}

} // namespace plug_scan
