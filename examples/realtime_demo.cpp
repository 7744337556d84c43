// realtime_demo: simulated heart-rate strap feeding a live experiment session,
// prints the session export JSON
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../cpp/hrvrng_options.h"
#include "../cpp/hrvrng_session.h"

static const double kPi = 3.14159265358979323846;

// Emits one notification per beat with a slowly breathing RR rhythm
class SimulatedStrap : public hrvrng::BleTransport {
public:
    explicit SimulatedStrap(double bpm, double variabilityMs) : bpm_(bpm), varMs_(variabilityMs) {}
    ~SimulatedStrap() override { stopAll(); }

    std::vector<hrvrng::DeviceInfo> discover(double) override {
        return { {"Polar H10 5A1B2C", "SIM:00:01", -48}, {"Living room TV", "SIM:00:02", -40} };
    }
    bool connect(const std::string& address, std::string* err) override {
        if (address.rfind("SIM:", 0) != 0) { if (err) *err = "unknown device"; return false; }
        return true;
    }
    bool subscribe(const std::string& address, const std::string&, NotifyHandler handler, std::string*) override {
        std::lock_guard<std::mutex> lock(m_);
        auto& run = running_[address];
        run = std::make_shared<std::atomic<bool>>(true);
        threads_.emplace_back([this, handler, run] {
            double t = 0.0;
            while (run->load()) {
                double rr = 60000.0 / bpm_ + varMs_ * std::sin(2.0 * kPi * 0.1 * t);
                uint16_t raw = static_cast<uint16_t>(std::lround(rr * 1024.0 / 1000.0));
                uint8_t hr = static_cast<uint8_t>(std::lround(60000.0 / rr));
                uint8_t payload[4] = {0x10, hr, static_cast<uint8_t>(raw & 0xFF), static_cast<uint8_t>(raw >> 8)};
                handler(payload, sizeof(payload));
                t += rr / 1000.0;
                // accelerated clock
                std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int>(rr / 10.0)));
            }
        });
        return true;
    }
    bool isConnected(const std::string& address) override {
        std::lock_guard<std::mutex> lock(m_);
        auto it = running_.find(address);
        return it != running_.end() && it->second->load();
    }
    void disconnect(const std::string& address) override {
        std::lock_guard<std::mutex> lock(m_);
        auto it = running_.find(address);
        if (it != running_.end()) it->second->store(false);
    }
    bool resetAdapter(std::string*) override { return true; }

    void stopAll() {
        std::vector<std::thread> ts;
        {
            std::lock_guard<std::mutex> lock(m_);
            for (auto& kv : running_) kv.second->store(false);
            ts.swap(threads_);
        }
        for (auto& t : ts) t.join();
    }

private:
    double bpm_;
    double varMs_;
    std::mutex m_;
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> running_;
    std::vector<std::thread> threads_;
};

int main(int argc, char** argv) {
    double seconds = 3.0;
    double bpm = 66.0;
    double variability = 8.0;
    int cadenceMs = 2;
    bool online = false;
    bool includeBits = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--seconds" || a == "-s") && i + 1 < argc) { seconds = std::atof(argv[++i]); }
        else if (a == "--bpm" && i + 1 < argc) { bpm = std::atof(argv[++i]); }
        else if (a == "--variability" && i + 1 < argc) { variability = std::atof(argv[++i]); }
        else if (a == "--cadence" && i + 1 < argc) { cadenceMs = std::atoi(argv[++i]); }
        else if (a == "--online") { online = true; }
        else if (a == "--bits") { includeBits = true; }
    }

    hrvrng::SessionOptions opt;
    opt.useSdr = false;
    opt.useOnline = online;
    opt.collector.cadenceMs = cadenceMs;
    opt.monitor.pollIntervalSec = 0.1;
    const char* code = nullptr;
    std::string msg;
    if (!hrvrng::validateSessionOptions(opt, &code, &msg)) {
        std::cerr << code << ": " << msg << "\n";
        return 2;
    }

    SimulatedStrap strap(bpm, variability);
    hrvrng::ExperimentSession session(strap, opt);
    session.setSessionInfo("demo", "steady breathing");
    if (!session.seedGenerator()) return 1;

    std::vector<std::string> addrs;
    for (const auto& d : session.monitor().scan(1.0)) {
        session.addParticipant(d.address, d.name);
        addrs.push_back(d.address);
    }
    session.monitor().connect(addrs);

    auto phase = [&](hrvrng::Mode mode, double secs) {
        if (!session.start(mode)) return false;
        auto end = std::chrono::steady_clock::now() + std::chrono::duration<double>(secs);
        while (std::chrono::steady_clock::now() < end) {
            hrvrng::PumpResult p = session.pump();
            if (!p.samples.empty()) {
                std::cerr << hrvrng::modeName(mode) << " coherence=" << p.averageCoherence
                          << " devices=" << p.deviceCount << (p.autoMarked ? " [marked]" : "") << "\n";
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
        return true;
    };
    if (!phase(hrvrng::Mode::Baseline, seconds) || !phase(hrvrng::Mode::Experiment, seconds)) {
        std::cerr << "collector failed to start\n";
        return 1;
    }
    if (!session.markIntention(std::string("end of run"))) std::cerr << "intention marker refused\n";
    if (!session.stop()) std::cerr << "collector did not stop in time\n";
    session.monitor().disconnectAll();
    strap.stopAll();

    std::cout << hrvrng::toJson(session.exportSnapshot(includeBits)) << std::endl;
    return 0;
}
