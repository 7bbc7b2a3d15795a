#pragma once

#include "Errors.h"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace mtfcast {

struct CliOptions {
    std::string config_path;
    // "--key value" pairs applied on top of the config file, in order.
    std::vector<std::pair<std::string, std::string>> overrides;
    bool dump_config = false;
    bool verbose = false;
    bool show_help = false;
};

// Parses the arguments after the program name. Returns false with *error set on a
// malformed command line.
bool ParseCliArguments(const std::vector<std::string>& args, CliOptions* options, std::string* error = nullptr);

// Process exit code for an engine error:
// 2 config/timeframe, 3 store, 4 range, 5 input bars, 6 leakage, 7 fold execution.
int ExitCodeFor(ErrorCode code);

// Body of mtfcast_backtest. The summary goes to `out`, usage text to `err`.
// Returns the process exit code; 0 only when at least one fold succeeded.
int RunBacktestCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace mtfcast
