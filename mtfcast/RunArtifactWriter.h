#pragma once

#include "BacktestPipeline.h"

#include <filesystem>
#include <string>
#include <vector>

namespace mtfcast {

// JSON document with the run's config summary, fold table, metric rows and predictions.
// N/A metric values are written as null.
std::string RunArtifactToJson(const PipelineResult& result);

// One line per prediction of a successful fold:
// fold,timestamp_ms,target_timestamp_ms,predicted,actual,previous_actual
std::string PredictionsToCsv(const std::vector<simulation::PredictionRecord>& predictions);

bool WriteRunArtifact(const PipelineResult& result,
                      const std::filesystem::path& path,
                      std::string* error = nullptr);

bool WritePredictionsCsv(const PipelineResult& result,
                         const std::filesystem::path& path,
                         std::string* error = nullptr);

} // namespace mtfcast
