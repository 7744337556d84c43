#include "hrvrng_options.h"

#include <cmath>

namespace hrvrng {

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static inline bool fail(const char** err_code, std::string* err_msg, const char* code, const char* msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

bool validateSdrOptions(const SdrOptions& opt, const char** err_code, std::string* err_msg) {
    // RTL2832U usable rates
    if (!isFinite(opt.sampleRate) || opt.sampleRate < 225001.0 || opt.sampleRate > 3.2e6) {
        return fail(err_code, err_msg, "HRVRNG_E001", "Invalid SDR sample rate (225001-3200000)");
    }
    if (!isFinite(opt.centerFreq) || opt.centerFreq < 24e6 || opt.centerFreq > 1766e6) {
        return fail(err_code, err_msg, "HRVRNG_E002", "Invalid SDR center frequency (24-1766 MHz)");
    }
    if (opt.deviceIndex < 0) {
        return fail(err_code, err_msg, "HRVRNG_E003", "Invalid SDR device index");
    }
    if (opt.samplesPerHash < 256 || opt.samplesPerHash > (size_t(1) << 24) || opt.maxCycles < 1) {
        return fail(err_code, err_msg, "HRVRNG_E004", "Invalid block size or cycle limit");
    }
    if (opt.failureThreshold < 1 || !isFinite(opt.backoffBaseSec) || !isFinite(opt.backoffMaxSec)
        || opt.backoffBaseSec <= 0.0 || opt.backoffMaxSec < opt.backoffBaseSec) {
        return fail(err_code, err_msg, "HRVRNG_E005", "Invalid failure backoff (threshold>=1, 0<base<=max)");
    }
    return true;
}

bool validateOnlineOptions(const OnlineOptions& opt, const char** err_code, std::string* err_msg) {
    if (opt.host.empty() || opt.port.empty() || opt.path.empty() || opt.path[0] != '/') {
        return fail(err_code, err_msg, "HRVRNG_E011", "Invalid QRNG endpoint");
    }
    // the API rejects longer requests
    if (opt.maxChunk < 1 || opt.maxChunk > 1024) {
        return fail(err_code, err_msg, "HRVRNG_E012", "Invalid chunk size (1-1024)");
    }
    if (!isFinite(opt.timeoutSec) || opt.timeoutSec <= 0.0 || opt.chunkDelayMs < 0) {
        return fail(err_code, err_msg, "HRVRNG_E013", "Invalid timeout or chunk delay");
    }
    return true;
}

bool validateCollectorOptions(const CollectorOptions& opt, const char** err_code, std::string* err_msg) {
    if (opt.capacity < 1) {
        return fail(err_code, err_msg, "HRVRNG_E021", "Invalid buffer capacity");
    }
    if (opt.cadenceMs < 1 || opt.cadenceMs > 60000) {
        return fail(err_code, err_msg, "HRVRNG_E022", "Invalid cadence (1-60000 ms)");
    }
    if (!isFinite(opt.stopTimeoutSec) || opt.stopTimeoutSec <= 0.0 || opt.providerRetryMs < 1) {
        return fail(err_code, err_msg, "HRVRNG_E023", "Invalid stop timeout or provider retry");
    }
    if (opt.statsWindow < 1 || opt.minStatsBits < 2 || opt.minComparisonBits < 1) {
        return fail(err_code, err_msg, "HRVRNG_E024", "Invalid statistics window or thresholds");
    }
    return true;
}

bool validateMonitorOptions(const MonitorOptions& opt, const char** err_code, std::string* err_msg) {
    if (!isFinite(opt.scanTimeoutSec) || opt.scanTimeoutSec <= 0.0) {
        return fail(err_code, err_msg, "HRVRNG_E031", "Invalid scan timeout");
    }
    if (opt.maxRetries < 1 || opt.flakyMaxRetries < opt.maxRetries) {
        return fail(err_code, err_msg, "HRVRNG_E032", "Invalid retry limits (1<=max<=flakyMax)");
    }
    if (!isFinite(opt.retryBaseDelaySec) || !isFinite(opt.retryMaxDelaySec) || opt.retryBaseDelaySec < 0.0
        || opt.retryMaxDelaySec < opt.retryBaseDelaySec || !isFinite(opt.pollIntervalSec) || opt.pollIntervalSec <= 0.0) {
        return fail(err_code, err_msg, "HRVRNG_E033", "Invalid retry delay or poll interval");
    }
    if (opt.rrCapacity < 2 || opt.outputCapacity < 1) {
        return fail(err_code, err_msg, "HRVRNG_E034", "Invalid RR or output capacity");
    }
    if (!isFinite(opt.coherenceK) || opt.coherenceK <= 0.0 || opt.coherenceMinSamples < 2
        || opt.coherenceMinSamples > opt.rrCapacity) {
        return fail(err_code, err_msg, "HRVRNG_E035", "Invalid coherence parameters");
    }
    return true;
}

bool validateSessionOptions(const SessionOptions& opt, const char** err_code, std::string* err_msg) {
    if (!validateCollectorOptions(opt.collector, err_code, err_msg)) return false;
    if (!validateMonitorOptions(opt.monitor, err_code, err_msg)) return false;
    if (opt.useSdr && !validateSdrOptions(opt.sdr, err_code, err_msg)) return false;
    if (opt.useOnline && !validateOnlineOptions(opt.online, err_code, err_msg)) return false;
    if (opt.hrvSnapshotCapacity < 1) {
        return fail(err_code, err_msg, "HRVRNG_E041", "Invalid snapshot capacity");
    }
    if (!isFinite(opt.autoMarkThreshold) || opt.autoMarkThreshold < 0.0 || opt.autoMarkThreshold > 1.0) {
        return fail(err_code, err_msg, "HRVRNG_E042", "Invalid auto-mark threshold (0-1)");
    }
    if (opt.seedBytes < 16 || opt.seedBytes > 4096) {
        return fail(err_code, err_msg, "HRVRNG_E043", "Invalid seed size (16-4096 bytes)");
    }
    return true;
}

} // namespace hrvrng
