// Minimal concurrency smoke: continuous block ingestion in one thread, stats and markers in another
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include "../cpp/hrvrng_drbg.h"
#include "../cpp/hrvrng_entropy.h"
#include "../cpp/hrvrng_stream.h"

int main() {
    hrvrng::SecureFallbackSource fallback;
    hrvrng::HmacDrbg drbg;
    drbg.seed(fallback.bytes(48));

    hrvrng::CollectorOptions opt;
    opt.capacity = 20000;
    opt.providerRetryMs = 20;
    hrvrng::BitStreamCollector collector(drbg, fallback, opt);

    std::atomic<int> blocks{0};
    const bool started = collector.startContinuousSource([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        // every tenth block fails to exercise the retry path
        if (++blocks % 10 == 0) {
            return hrvrng::ByteResult::failure(hrvrng::ErrorKind::SourceUnavailable, "simulated dropout");
        }
        return hrvrng::ByteResult::success(drbg.generate(64));
    }, hrvrng::Mode::Experiment);
    if (!started) {
        std::cerr << "collector refused to start\n";
        return 1;
    }

    std::atomic<bool> stop{false};
    std::thread marker([&] {
        while (!stop.load()) {
            collector.markEvent(hrvrng::EventKind::User);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto start = std::chrono::steady_clock::now();
    int polls = 0;
    while (polls < 40) {
        hrvrng::SessionStats s = collector.getStats();
        std::cout << "poll count=" << s.count << " mean=" << s.mean << " z=" << s.zScore
                  << " markers=" << s.markerCount << "\n";
        ++polls;
        if (polls == 20) collector.setMode(hrvrng::Mode::Baseline);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (std::chrono::steady_clock::now() - start > std::chrono::seconds(10)) break;
    }
    stop = true; marker.join();
    bool joined = collector.stop();

    auto cmp = collector.getBaselineComparison();
    if (cmp) std::cout << "effect=" << cmp->effectPercent << "%\n";
    std::cout << "joined=" << (joined ? "yes" : "no") << " experiment=" << collector.experimentCount()
              << " baseline=" << collector.baselineCount() << "\n";
    return joined ? 0 : 1;
}
