/*
 * Experiment session wiring: correlation recording, auto-marking, metadata,
 * export document and options validation
 */

#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "../cpp/hrvrng_options.h"
#include "../cpp/hrvrng_session.h"
#include "fakes.h"
#include "test_util.h"

using namespace hrvrng;

static int passed = 0, failed = 0, total = 0;

static SessionOptions offlineOptions() {
    SessionOptions o;
    o.useSdr = false;
    o.useOnline = false;
    o.collector.cadenceMs = 1;
    o.monitor.retryBaseDelaySec = 0.005;
    o.monitor.retryMaxDelaySec = 0.02;
    o.monitor.pollIntervalSec = 0.005;
    return o;
}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

bool test_recorder_tags_bit_position() {
    HmacDrbg drbg;
    SecureFallbackSource fb;
    BitStreamCollector c(drbg, fb);
    CorrelationRecorder rec(c, 4);

    HrvSample s;
    s.deviceId = "AA:01";
    s.heartRateBpm = 61;
    TEST_ASSERT(rec.record(s).bitIndex == 0, "empty buffer gives index 0");
    c.importBaselineBits({1, 0, 1});
    TEST_ASSERT(rec.record(s).bitIndex == 0, "baseline bits do not move the index");

    HrvSample bad;
    bad.deviceId = "AA:02";
    bad.error = std::string("HRVRNG_E111: peer not reachable");
    TEST_ASSERT(rec.recordAll({s, bad, s}) == 2, "error samples must be skipped");
    TEST_ASSERT(rec.size() == 4, "four snapshots");

    rec.record(s);
    TEST_ASSERT(rec.size() == 4, "recorder stays bounded");
    TEST_ASSERT(rec.recent(2).size() == 2, "recent tail");
    rec.clear();
    TEST_ASSERT(rec.size() == 0, "clear");
    return true;
}

bool test_seed_from_fallback_only() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    TEST_ASSERT(session.chain().spectral() == nullptr, "no SDR source configured");
    TEST_ASSERT(!session.startSpectralStream(), "spectral stream needs a radio");
    TEST_ASSERT(session.seedGenerator(), "fallback seeding must succeed");
    TEST_ASSERT(session.drbg().seeded(), "generator seeded");
    TEST_ASSERT(session.drbg().seedFingerprint().size() == 64, "fingerprint");
    TEST_ASSERT(session.chain().lastSource() == "software", "fallback source name");
    bool threw = false;
    try { session.seedGenerator(0); } catch (const std::invalid_argument&) { threw = true; }
    TEST_ASSERT(threw, "zero seed length rejected");
    return true;
}

bool test_spectral_stream_fills_experiment() {
    fakes::FakeBle ble;
    fakes::FakeRadio::Counters counters;
    std::unique_ptr<IqRadio> radio(new fakes::FakeRadio(counters));
    SessionOptions o = offlineOptions();
    o.useSdr = true;
    o.sdr.samplesPerHash = 256;
    ExperimentSession session(ble, o, std::move(radio));
    TEST_ASSERT(session.startSpectralStream(Mode::Experiment, 16), "spectral stream refused");
    TEST_ASSERT(waitUntil([&] { return session.collector().experimentCount() >= 256; }), "no SDR bits");
    TEST_ASSERT(session.stop(), "stop");
    TEST_ASSERT(session.collector().baselineCount() == 0, "bits land in the experiment buffer");
    TEST_ASSERT(counters.opens.load() > 0, "radio opened");
    return true;
}

bool test_spectral_stream_default_block() {
    fakes::FakeBle ble;
    fakes::FakeRadio::Counters counters;
    std::unique_ptr<IqRadio> radio(new fakes::FakeRadio(counters));
    SessionOptions o = offlineOptions();
    o.useSdr = true;
    o.sdr.samplesPerHash = 256;
    ExperimentSession session(ble, o, std::move(radio));
    TEST_ASSERT(session.startSpectralStream(), "spectral stream refused");
    TEST_ASSERT(waitUntil([&] { return session.collector().experimentCount() >= 2048; }),
                "default block size produced no bits");
    TEST_ASSERT(session.stop(), "stop");
    return true;
}

bool test_spectral_stream_clamps_oversized_block() {
    fakes::FakeBle ble;
    fakes::FakeRadio::Counters counters;
    std::unique_ptr<IqRadio> radio(new fakes::FakeRadio(counters));
    SessionOptions o = offlineOptions();
    o.useSdr = true;
    o.sdr.samplesPerHash = 256;
    o.sdr.maxCycles = 2;
    ExperimentSession session(ble, o, std::move(radio));
    TEST_ASSERT(session.startSpectralStream(Mode::Experiment, 4096), "spectral stream refused");
    TEST_ASSERT(waitUntil([&] { return session.collector().experimentCount() >= 96 * 8; }),
                "oversized block must be clamped, not fail forever");
    TEST_ASSERT(session.stop(), "stop");
    return true;
}

bool test_pump_records_and_auto_marks() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    TEST_ASSERT(session.seedGenerator(), "seed");
    session.monitor().connect({"AA:20"});
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("AA:20"); }), "not subscribed");

    TEST_ASSERT(session.pump().samples.empty(), "nothing to pump yet");
    for (int i = 0; i < 10; ++i) ble.emit("AA:20", fakes::hrPayload(70, 850.0));
    PumpResult low = session.pump();
    TEST_ASSERT(low.samples.size() == 10 && low.deviceCount == 1, "ten samples from one device");
    TEST_NEAR(low.averageCoherence, 0.1, 1e-6, "only the tenth sample is coherent");
    TEST_ASSERT(!low.autoMarked, "idle collector never auto-marks");

    TEST_ASSERT(session.start(Mode::Experiment), "collector start");
    TEST_ASSERT(waitUntil([&] { return session.collector().experimentCount() >= 5; }), "no bits produced");
    for (int i = 0; i < 5; ++i) ble.emit("AA:20", fakes::hrPayload(70, 850.0));
    PumpResult high = session.pump();
    TEST_ASSERT(high.averageCoherence == 1.0, "steady rhythm");
    TEST_ASSERT(high.autoMarked, "coherence above threshold must auto-mark");

    std::vector<Marker> m = session.collector().markers();
    TEST_ASSERT(m.size() == 1 && m[0].kind == EventKind::HighCoherence, "one high-coherence marker");
    TEST_ASSERT(m[0].coherence && m[0].coherence->size() == 5, "marker carries the pumped samples");
    TEST_ASSERT(session.recorder().size() == 15, "all samples recorded");
    TEST_ASSERT(session.recorder().snapshots().back().bitIndex >= 5, "later samples see later bit positions");

    session.collector().setMode(Mode::Baseline);
    for (int i = 0; i < 3; ++i) ble.emit("AA:20", fakes::hrPayload(70, 850.0));
    TEST_ASSERT(!session.pump().autoMarked, "baseline runs are never auto-marked");
    TEST_ASSERT(session.stop(), "stop");
    return true;
}

bool test_pump_separates_failures() {
    fakes::FakeBle ble;
    ble.unreachable.insert("AA:30");
    SessionOptions o = offlineOptions();
    o.monitor.maxRetries = 1;
    ExperimentSession session(ble, o);
    session.monitor().connect({"AA:30"});
    TEST_ASSERT(waitUntil([&] { return session.monitor().activeAddresses().empty(); }), "not retired");
    PumpResult r = session.pump();
    TEST_ASSERT(r.failures.size() == 1 && r.samples.empty(), "failure reported separately");
    TEST_ASSERT(session.recorder().size() == 0, "failures are not recorded");
    return true;
}

bool test_mark_intention_requires_experiment() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    TEST_ASSERT(!session.markIntention(), "idle session refuses intention markers");

    TEST_ASSERT(session.start(Mode::Baseline), "start baseline");
    TEST_ASSERT(!session.markIntention(), "baseline refuses intention markers");
    session.collector().setMode(Mode::Experiment);
    TEST_ASSERT(session.markIntention(std::string("focus")), "experiment accepts markers");

    std::vector<Marker> m = session.collector().markers();
    TEST_ASSERT(m.size() == 1 && m[0].kind == EventKind::Intention, "intention marker");
    TEST_ASSERT(!m[0].coherence, "no biometric snapshot without samples");
    TEST_ASSERT(m[0].meta && *m[0].meta == "focus", "marker metadata");
    TEST_ASSERT(session.stop(), "stop");
    return true;
}

bool test_intention_uses_latest_per_device() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    session.monitor().connect({"AA:41", "AA:42"});
    TEST_ASSERT(waitUntil([&] { return ble.subscribed("AA:41") && ble.subscribed("AA:42"); }), "not subscribed");
    ble.emit("AA:41", fakes::hrPayload(60, 1000.0));
    ble.emit("AA:41", fakes::hrPayload(62, 968.0));
    ble.emit("AA:42", fakes::hrPayload(80, 750.0));
    TEST_ASSERT(session.pump().deviceCount == 2, "two devices");

    TEST_ASSERT(session.start(Mode::Experiment), "start");
    TEST_ASSERT(session.markIntention(), "mark");
    std::vector<Marker> m = session.collector().markers();
    TEST_ASSERT(m.size() == 1 && m[0].coherence && m[0].coherence->size() == 2, "one sample per device");
    for (const auto& s : *m[0].coherence) {
        if (s.deviceId == "AA:41") TEST_ASSERT(s.heartRateBpm == 62, "latest sample of AA:41");
    }
    TEST_ASSERT(session.stop(), "stop");
    return true;
}

bool test_participants() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    session.setSessionInfo("Evening circle", "calm");
    session.addParticipant("AA:51", "Robin");
    session.addParticipant("AA:52", "", "facilitator");
    bool threw = false;
    try { session.addParticipant("AA:53", "Sam", "leader"); } catch (const std::invalid_argument&) { threw = true; }
    TEST_ASSERT(threw, "unknown role must throw");
    threw = false;
    try { session.addParticipant("", "Sam"); } catch (const std::invalid_argument&) { threw = true; }
    TEST_ASSERT(threw, "empty address must throw");

    SessionMetadata md = session.metadata();
    TEST_ASSERT(md.sessionName == "Evening circle" && md.intention == "calm", "session info");
    TEST_ASSERT(md.participants.size() == 2, "two participants");
    TEST_ASSERT(md.participants["AA:52"].name == "AA:52", "name defaults to the address");
    TEST_ASSERT(md.participants["AA:52"].role == "facilitator", "role kept");
    TEST_ASSERT(md.startedAt > 0.0, "start time recorded");
    return true;
}

bool test_export_document() {
    fakes::FakeBle ble;
    ExperimentSession session(ble, offlineOptions());
    session.setSessionInfo("Quote \"test\"", "line\nbreak");
    session.addParticipant("AA:61", "Kim", "observer");
    TEST_ASSERT(session.seedGenerator(), "seed");
    session.collector().importBaselineBits({0, 1, 0, 1});
    TEST_ASSERT(session.start(Mode::Experiment), "start");
    TEST_ASSERT(waitUntil([&] { return session.collector().experimentCount() >= 3; }), "no bits");
    TEST_ASSERT(session.markIntention(), "mark");
    TEST_ASSERT(session.stop(), "stop");

    SessionExport e = session.exportSnapshot();
    TEST_ASSERT(e.baselineCount == 4 && e.experimentCount >= 3, "counts");
    TEST_ASSERT(e.experimentBits.empty() && !e.comparison, "no bits, no comparison below threshold");
    TEST_ASSERT(e.seedFingerprint == session.drbg().seedFingerprint(), "fingerprint carried");

    std::string json = toJson(e);
    TEST_ASSERT(json.front() == '{' && json.back() == '}', "object");
    TEST_ASSERT(contains(json, "\"name\":\"Quote \\\"test\\\"\""), "quotes escaped");
    TEST_ASSERT(contains(json, "\"intention\":\"line\\nbreak\""), "newline escaped");
    TEST_ASSERT(contains(json, "{\"address\":\"AA:61\",\"name\":\"Kim\",\"role\":\"observer\"}"), "participant");
    TEST_ASSERT(contains(json, "\"mode\":\"experiment\""), "mode");
    TEST_ASSERT(contains(json, "\"baselineComparison\":null"), "comparison null");
    TEST_ASSERT(contains(json, "\"entropySource\":\"software\""), "entropy source");
    TEST_ASSERT(contains(json, "\"event\":\"intention\""), "marker kind");
    TEST_ASSERT(contains(json, "\"baselineCount\":4"), "baseline count");
    TEST_ASSERT(!contains(json, "\"experimentBits\""), "bits omitted by default");

    std::string withBits = toJson(session.exportSnapshot(true));
    TEST_ASSERT(contains(withBits, "\"baselineBits\":[0,1,0,1]"), "raw baseline bits");
    return true;
}

bool test_sample_json() {
    HrvSample s;
    s.timestamp = 12.5;
    s.deviceId = "AA:71";
    s.heartRateBpm = 64;
    s.rrIntervalsMs = {937.5f};
    s.coherence = 0.5f;
    TEST_ASSERT(toJson(s) == "{\"timestamp\":12.5,\"device\":\"AA:71\",\"hr\":64,\"rrIntervalsMs\":[937.5],"
                             "\"coherence\":0.5,\"rmssdMs\":0}", "sample JSON");
    s.error = std::string("HRVRNG_E111: gone");
    TEST_ASSERT(contains(toJson(s), "\"error\":\"HRVRNG_E111: gone\""), "error field");
    TEST_ASSERT(jsonQuote(std::string("\x01")) == "\"\\u0001\"", "control characters");
    return true;
}

bool test_option_validation() {
    const char* code = nullptr;
    std::string msg;
    TEST_ASSERT(validateSessionOptions(SessionOptions{}, &code, &msg), "defaults must validate");
    TEST_ASSERT(code == nullptr && msg.empty(), "success leaves outputs untouched");

    SdrOptions sdr;
    sdr.sampleRate = 1e9;
    TEST_ASSERT(!validateSdrOptions(sdr, &code, &msg) && std::strcmp(code, "HRVRNG_E001") == 0, "sample rate");
    TEST_ASSERT(!msg.empty(), "message set");

    OnlineOptions on;
    on.maxChunk = 2048;
    TEST_ASSERT(!validateOnlineOptions(on, &code, nullptr) && std::strcmp(code, "HRVRNG_E012") == 0, "chunk size");

    CollectorOptions co;
    co.cadenceMs = 0;
    TEST_ASSERT(!validateCollectorOptions(co, &code, nullptr) && std::strcmp(code, "HRVRNG_E022") == 0, "cadence");

    MonitorOptions mo;
    mo.flakyMaxRetries = 1;
    TEST_ASSERT(!validateMonitorOptions(mo, &code, nullptr) && std::strcmp(code, "HRVRNG_E032") == 0, "retry limits");
    mo = MonitorOptions{};
    mo.coherenceK = 0.0;
    TEST_ASSERT(!validateMonitorOptions(mo, &code, nullptr) && std::strcmp(code, "HRVRNG_E035") == 0, "coherence k");

    SessionOptions so;
    so.seedBytes = 8;
    TEST_ASSERT(!validateSessionOptions(so, &code, nullptr) && std::strcmp(code, "HRVRNG_E043") == 0, "seed size");
    so = SessionOptions{};
    so.useSdr = false;
    so.sdr.sampleRate = -1.0;
    TEST_ASSERT(validateSessionOptions(so, &code, nullptr), "unused SDR block is not validated");
    return true;
}

int main() {
    printf("Experiment Session Test Suite\n");
    printf("===================================\n\n");

    RUN_TEST(test_recorder_tags_bit_position);
    RUN_TEST(test_seed_from_fallback_only);
    RUN_TEST(test_spectral_stream_fills_experiment);
    RUN_TEST(test_spectral_stream_default_block);
    RUN_TEST(test_spectral_stream_clamps_oversized_block);
    RUN_TEST(test_pump_records_and_auto_marks);
    RUN_TEST(test_pump_separates_failures);
    RUN_TEST(test_mark_intention_requires_experiment);
    RUN_TEST(test_intention_uses_latest_per_device);
    RUN_TEST(test_participants);
    RUN_TEST(test_export_document);
    RUN_TEST(test_sample_json);
    RUN_TEST(test_option_validation);

    TEST_SUMMARY();
    return failed == 0 ? 0 : 1;
}
