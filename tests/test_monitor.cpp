/*
 * BiometricDeviceMonitor over a scripted BLE transport
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include "../cpp/hrvrng_ble.h"
#include "fakes.h"
#include "test_util.h"

using namespace hrvrng;

static int passed = 0, failed = 0, total = 0;

static MonitorOptions fastOptions() {
    MonitorOptions o;
    o.retryBaseDelaySec = 0.005;
    o.retryMaxDelaySec = 0.02;
    o.pollIntervalSec = 0.005;
    return o;
}

// Accepts every connect but the link is gone by the first poll
class UnstableLinkBle : public fakes::FakeBle {
public:
    bool isConnected(const std::string&) override { return false; }
};

static bool isActive(const BiometricDeviceMonitor& m, const std::string& addr) {
    auto a = m.activeAddresses();
    return std::find(a.begin(), a.end(), addr) != a.end();
}

bool test_scan_filters_and_sorts() {
    fakes::FakeBle ble;
    ble.advertisements = {
        {"Polar H10 A1", "AA:01", -70},
        {"", "AA:02", -20},
        {"Soundbar", "AA:03", -30},
        {"TICKR X 55", "AA:04", -45},
        {"HRM-Pro:123", "AA:05", -60},
    };
    BiometricDeviceMonitor mon(ble, fastOptions());
    std::vector<DeviceInfo> found = mon.scan();
    TEST_ASSERT(found.size() == 3, "only known straps expected");
    TEST_ASSERT(found[0].address == "AA:04" && found[1].address == "AA:05" && found[2].address == "AA:01",
                "sorted by signal strength");
    return true;
}

bool test_notifications_become_samples() {
    fakes::FakeBle ble;
    BiometricDeviceMonitor mon(ble, fastOptions());
    TEST_ASSERT(mon.connect({"AA:10"}) == 1, "one monitor expected");
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("AA:10"); }), "never subscribed");
    TEST_ASSERT(waitUntil([&] { return mon.status("AA:10") == ConnectionStatus::Connected; }), "status connected");
    TEST_ASSERT(waitUntil([&] { return mon.attempts("AA:10") == 0; }), "attempts reset once the link is stable");

    for (int i = 0; i < 12; ++i) TEST_ASSERT(ble.emit("AA:10", fakes::hrPayload(75, 800.0)), "emit failed");
    std::vector<HrvSample> s = mon.getRecentSamples();
    TEST_ASSERT(s.size() == 12, "one sample per notification");
    TEST_ASSERT(s[0].heartRateBpm == 75 && s[0].deviceId == "AA:10", "sample fields");
    TEST_ASSERT(s[0].coherence == 0.0f, "insufficient RR data at first");
    TEST_ASSERT(s[11].coherence == 1.0f, "steady rhythm gives full coherence");
    TEST_ASSERT(!s[11].isError(), "regular sample is not an error");
    TEST_ASSERT(mon.rrBuffer("AA:10").size() == 12, "RR buffer filled");
    TEST_ASSERT(mon.getRecentSamples().empty(), "queue drained");

    mon.disconnect("AA:10");
    TEST_ASSERT(!isActive(mon, "AA:10"), "device still active after disconnect");
    TEST_ASSERT(mon.status("AA:10") == ConnectionStatus::Disconnected, "status after disconnect");
    return true;
}

bool test_rr_buffer_bounded() {
    fakes::FakeBle ble;
    MonitorOptions o = fastOptions();
    o.rrCapacity = 20;
    BiometricDeviceMonitor mon(ble, o);
    mon.connect({"AA:11"});
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("AA:11"); }), "never subscribed");
    for (int i = 0; i < 50; ++i) ble.emit("AA:11", fakes::hrPayload(60, 1000.0));
    TEST_ASSERT(mon.rrBuffer("AA:11").size() == 20, "RR buffer must stay bounded");
    return true;
}

bool test_malformed_payload_dropped() {
    fakes::FakeBle ble;
    BiometricDeviceMonitor mon(ble, fastOptions());
    mon.connect({"AA:12"});
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("AA:12"); }), "never subscribed");
    ble.emit("AA:12", {0x01});
    ble.emit("AA:12", {0x01, 0x40});
    ble.emit("AA:12", {0x00, 0x48});
    std::vector<HrvSample> s = mon.getRecentSamples();
    TEST_ASSERT(s.size() == 1 && s[0].heartRateBpm == 72, "only the valid payload survives");
    TEST_ASSERT(isActive(mon, "AA:12"), "parse errors must not drop the device");
    return true;
}

bool test_exhausted_retries_emit_one_error() {
    fakes::FakeBle ble;
    ble.unreachable.insert("BB:01");
    MonitorOptions o = fastOptions();
    o.maxRetries = 3;
    BiometricDeviceMonitor mon(ble, o);
    mon.connect({"BB:01"});
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "BB:01"); }), "device never retired");

    std::vector<HrvSample> s = mon.getRecentSamples();
    TEST_ASSERT(s.size() == 1, "exactly one synthetic sample");
    TEST_ASSERT(s[0].isError() && s[0].deviceId == "BB:01", "error sample for the device");
    TEST_ASSERT(s[0].coherence == 0.0f && s[0].heartRateBpm == 0, "zero coherence and heart rate");
    TEST_ASSERT(s[0].error->find("HRVRNG_E111") == 0, "device connect failure code");
    TEST_ASSERT(ble.connectCalls("BB:01") == 3, "three attempts");
    TEST_ASSERT(mon.attempts("BB:01") == 3, "attempt counter");
    TEST_ASSERT(mon.status("BB:01") == ConnectionStatus::Failed, "status failed");
    TEST_ASSERT(ble.resets.load() == 0, "regular devices never reset the adapter");

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    TEST_ASSERT(mon.getRecentSamples().empty(), "no further error samples");
    return true;
}

bool test_flaky_device_resets_adapter() {
    fakes::FakeBle ble;
    ble.advertisements = {{"H808S 0042", "CC:01", -50}};
    ble.unreachable.insert("CC:01");
    MonitorOptions o = fastOptions();
    o.maxRetries = 2;
    o.flakyMaxRetries = 5;
    BiometricDeviceMonitor mon(ble, o);
    mon.scan();
    TEST_ASSERT(mon.isFlaky("CC:01"), "H808S straps are flaky");
    mon.connect({"CC:01"});
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "CC:01"); }), "flaky device never retired");
    TEST_ASSERT(ble.connectCalls("CC:01") == 5, "flaky devices get the higher retry limit");
    TEST_ASSERT(ble.resets.load() == 4, "adapter reset between attempts");
    TEST_ASSERT(mon.getRecentSamples().size() == 1, "one error sample");
    return true;
}

bool test_failures_isolated_per_device() {
    fakes::FakeBle ble;
    ble.unreachable.insert("DD:BAD");
    MonitorOptions o = fastOptions();
    o.maxRetries = 2;
    BiometricDeviceMonitor mon(ble, o);
    TEST_ASSERT(mon.connect({"DD:BAD", "DD:OK", "DD:OK"}) == 2, "duplicate addresses start one monitor");
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("DD:OK"); }), "healthy device not subscribed");
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "DD:BAD"); }), "failing device not retired");
    TEST_ASSERT(isActive(mon, "DD:OK"), "healthy device must stay active");
    ble.emit("DD:OK", fakes::hrPayload(64, 940.0));

    std::vector<HrvSample> s = mon.getRecentSamples();
    size_t errors = 0, good = 0;
    for (const auto& x : s) (x.isError() ? errors : good)++;
    TEST_ASSERT(errors == 1 && good == 1, "one error and one regular sample");
    return true;
}

bool test_dropped_link_reconnects() {
    fakes::FakeBle ble;
    BiometricDeviceMonitor mon(ble, fastOptions());
    mon.connect({"EE:01"});
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("EE:01"); }), "never subscribed");
    ble.drop("EE:01");
    TEST_ASSERT(waitUntil([&] { return ble.connectCalls("EE:01") >= 2; }), "no reconnect after link loss");
    TEST_ASSERT(waitUntil([&] { return mon.status("EE:01") == ConnectionStatus::Connected; }), "not reconnected");
    TEST_ASSERT(isActive(mon, "EE:01"), "device stays active across reconnects");
    TEST_ASSERT(mon.getRecentSamples().empty(), "a recovered drop emits no error sample");
    return true;
}

bool test_reconnect_after_failure() {
    fakes::FakeBle ble;
    ble.unreachable.insert("FF:01");
    MonitorOptions o = fastOptions();
    o.maxRetries = 1;
    BiometricDeviceMonitor mon(ble, o);
    mon.connect({"FF:01"});
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "FF:01"); }), "not retired");
    mon.getRecentSamples();

    ble.unreachable.clear();
    TEST_ASSERT(mon.connect({"FF:01"}) == 1, "retired device can be connected again");
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("FF:01"); }), "second connect failed");
    mon.disconnectAll();
    TEST_ASSERT(mon.activeAddresses().empty(), "disconnectAll leaves no active device");
    return true;
}

bool test_unstable_link_exhausts_retries() {
    UnstableLinkBle ble;
    MonitorOptions o = fastOptions();
    o.maxRetries = 3;
    BiometricDeviceMonitor mon(ble, o);
    const auto t0 = std::chrono::steady_clock::now();
    mon.connect({"EE:02"});
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "EE:02"); }), "unstable device never retired");
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    TEST_ASSERT(ble.connectCalls("EE:02") == 3, "lost links count as attempts");
    TEST_ASSERT(elapsed >= 0.014, "backoff applied between reconnects");
    TEST_ASSERT(mon.status("EE:02") == ConnectionStatus::Failed, "status failed");
    std::vector<HrvSample> s = mon.getRecentSamples();
    TEST_ASSERT(s.size() == 1 && s[0].isError(), "exactly one error sample");
    TEST_ASSERT(s[0].error->find("connection lost") != std::string::npos, "error names the lost link");
    return true;
}

bool test_unstable_flaky_link_resets_adapter() {
    UnstableLinkBle ble;
    ble.advertisements = {{"H808S 0007", "EE:03", -40}};
    MonitorOptions o = fastOptions();
    o.maxRetries = 2;
    o.flakyMaxRetries = 4;
    BiometricDeviceMonitor mon(ble, o);
    mon.scan();
    mon.connect({"EE:03"});
    TEST_ASSERT(waitUntil([&] { return !isActive(mon, "EE:03"); }), "flaky device never retired");
    TEST_ASSERT(ble.connectCalls("EE:03") == 4, "flaky retry limit applies to lost links");
    TEST_ASSERT(ble.resets.load() == 3, "adapter reset after each lost link but the last");
    TEST_ASSERT(mon.getRecentSamples().size() == 1, "one error sample");
    return true;
}

bool test_concurrent_disconnects() {
    fakes::FakeBle ble;
    for (int round = 0; round < 20; ++round) {
        BiometricDeviceMonitor mon(ble, fastOptions());
        TEST_ASSERT(mon.connect({"GG:01", "GG:02", "GG:03"}) == 3, "three monitors expected");
        TEST_ASSERT(waitUntil([&] { return ble.subscribed("GG:01") && ble.subscribed("GG:02"); }),
                    "never subscribed");
        std::thread a([&] { mon.disconnect("GG:01"); });
        std::thread b([&] { mon.disconnect("GG:02"); });
        mon.disconnectAll();
        a.join();
        b.join();
        TEST_ASSERT(mon.activeAddresses().empty(), "no device left active");
        TEST_ASSERT(mon.status("GG:01") == ConnectionStatus::Disconnected, "status after disconnect");
    }
    return true;
}

int main() {
    printf("Device Monitor Test Suite\n");
    printf("===================================\n\n");

    RUN_TEST(test_scan_filters_and_sorts);
    RUN_TEST(test_notifications_become_samples);
    RUN_TEST(test_rr_buffer_bounded);
    RUN_TEST(test_malformed_payload_dropped);
    RUN_TEST(test_exhausted_retries_emit_one_error);
    RUN_TEST(test_flaky_device_resets_adapter);
    RUN_TEST(test_failures_isolated_per_device);
    RUN_TEST(test_dropped_link_reconnects);
    RUN_TEST(test_reconnect_after_failure);
    RUN_TEST(test_unstable_link_exhausts_retries);
    RUN_TEST(test_unstable_flaky_link_resets_adapter);
    RUN_TEST(test_concurrent_disconnects);

    TEST_SUMMARY();
    return failed == 0 ? 0 : 1;
}
