#pragma once

#include "RunConfig.h"

#include <string>

namespace mtfcast {

// Text form of a RunConfig: "key=value" lines grouped under [RUN], [BARS],
// [WALKFORWARD] and [STORE]. Keys are matched case-insensitively with '_', '-' and
// spaces ignored, so "train_window", "Train Window" and "trainwindow" are the same key.
// Durations accept the timeframe notation ("90m", "12h", "30d"); timestamps are ISO-8601.
class RunConfigSerializer {
public:
    static std::string Serialize(const RunConfig& config);

    // Parses on top of the values already in *config.
    static bool Deserialize(const std::string& text, RunConfig* config, std::string* error = nullptr);

    // Assigns one setting, as used for command-line overrides.
    static bool ApplySetting(const std::string& key, const std::string& value,
                             RunConfig* config, std::string* error = nullptr);

    // Reads and parses a file without validating it. Throws ConfigError.
    static RunConfig LoadFile(const std::string& path);

    static bool LooksLikeSerializedConfig(const std::string& text);
};

} // namespace mtfcast
