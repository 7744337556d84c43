// entropy_dump: fetch bytes through the source chain and print them as hex
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "../cpp/hrvrng_drbg.h"
#include "../cpp/hrvrng_entropy.h"
#include "../cpp/hrvrng_options.h"
#include "../cpp/hrvrng_sdr.h"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-n BYTES] [--no-sdr] [--offline] [--drbg] [--verbose]\n";
}

int main(int argc, char** argv) {
    long n = 32;
    bool useSdr = true;
    bool online = true;
    bool drbg = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-n" || a == "--bytes") && i + 1 < argc) { n = std::atol(argv[++i]); }
        else if (a == "--no-sdr") { useSdr = false; }
        else if (a == "--offline") { online = false; }
        else if (a == "--drbg") { drbg = true; }
        else if (a == "--verbose" || a == "-v") { verbose = true; }
        else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
        else { usage(argv[0]); return 2; }
    }
    if (n < 0 || n > (1L << 20)) {
        std::cerr << "byte count must be in [0, 1048576]\n";
        return 2;
    }

    hrvrng::SdrOptions sdrOpt;
    hrvrng::OnlineOptions onlineOpt;
    const char* code = nullptr;
    std::string msg;
    if ((useSdr && !hrvrng::validateSdrOptions(sdrOpt, &code, &msg))
        || (online && !hrvrng::validateOnlineOptions(onlineOpt, &code, &msg))) {
        std::cerr << code << ": " << msg << "\n";
        return 2;
    }

    hrvrng::SecureFallbackSource fallback;
    std::unique_ptr<hrvrng::EntropySource> spectral;
    std::unique_ptr<hrvrng::EntropySource> remote;
    if (useSdr) {
        spectral.reset(new hrvrng::SpectralEntropyExtractor(
            std::unique_ptr<hrvrng::IqRadio>(new hrvrng::RtlSdrRadio()), sdrOpt));
    }
    if (online) remote.reset(new hrvrng::OnlineEntropyFetcher(onlineOpt));
    hrvrng::EntropySourceChain chain(std::move(spectral), std::move(remote), fallback);

    std::vector<uint8_t> out;
    if (drbg) {
        hrvrng::HmacDrbg gen;
        if (!gen.seedFromSource(chain, 48)) {
            std::cerr << "seeding failed\n";
            return 1;
        }
        out = gen.generate(static_cast<size_t>(n));
        if (verbose) std::cerr << "seed fingerprint: " << gen.seedFingerprint() << "\n";
    } else {
        hrvrng::ByteResult r = chain.fetch(static_cast<size_t>(n));
        if (!r.ok()) {
            std::cerr << hrvrng::errorCode(r.error) << ": " << r.message << "\n";
            return 1;
        }
        out = std::move(r.bytes);
    }
    if (verbose) std::cerr << "source: " << chain.lastSource() << "\n";
    std::cout << hrvrng::toHex(out.data(), out.size()) << std::endl;
    return 0;
}
