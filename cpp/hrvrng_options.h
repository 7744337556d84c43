// Central options validation
#pragma once

#include <string>
#include "hrvrng_core.h"

namespace hrvrng {

// Each returns false if options are invalid. On failure, sets err_code (stable
// HRVRNG_E0xx code) and err_msg (short reason); on success both are untouched.
// Validation only, no mutation.
bool validateSdrOptions(const SdrOptions& opt, const char** err_code, std::string* err_msg);
bool validateOnlineOptions(const OnlineOptions& opt, const char** err_code, std::string* err_msg);
bool validateCollectorOptions(const CollectorOptions& opt, const char** err_code, std::string* err_msg);
bool validateMonitorOptions(const MonitorOptions& opt, const char** err_code, std::string* err_msg);
// Also validates the nested option blocks that are in use
bool validateSessionOptions(const SessionOptions& opt, const char** err_code, std::string* err_msg);

} // namespace hrvrng
