#include "BacktestCli.h"

#include "BacktestPipeline.h"
#include "RunArtifactWriter.h"
#include "RunConfigSerializer.h"
#include "SimpleLogger.h"

#include <iomanip>
#include <ostream>

namespace mtfcast {
namespace {

void PrintUsage(std::ostream& err) {
    err << "Usage: mtfcast_backtest --config <file> [--<key> <value> ...] [--verbose] [--dump-config]\n"
        << "  Any config key may be overridden, e.g. --symbol EURUSD --max_parallel_folds 4\n";
}

void PrintSummary(const PipelineResult& result, std::ostream& out) {
    const auto& run = result.run;
    out << "Run " << (result.config.run_name.empty() ? result.config.symbol : result.config.run_name)
        << ": " << run.foldResults.size() << " folds ("
        << run.CountWithStatus(simulation::FoldStatus::Ok) << " ok, "
        << run.CountWithStatus(simulation::FoldStatus::Failed) << " failed, "
        << run.CountWithStatus(simulation::FoldStatus::Cancelled) << " cancelled)\n";

    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(6);
    for (const auto& metric : result.metrics) {
        if (!metric.IsAggregate()) {
            continue;
        }
        out << "  " << std::left << std::setw(22) << metric.metric_name;
        if (metric.value) {
            out << *metric.value << "\n";
        } else {
            out << "N/A\n";
        }
    }
    out.flags(flags);
    out.precision(precision);

    for (const auto& fold : run.foldResults) {
        if (!fold.Succeeded()) {
            out << "  fold " << fold.fold.fold_index << " " << simulation::FoldStatusName(fold.status)
                << ": " << fold.failure_reason << "\n";
        }
    }
}

} // namespace

bool ParseCliArguments(const std::vector<std::string>& args, CliOptions* options, std::string* error) {
    CliOptions parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            parsed.verbose = true;
            continue;
        }
        if (arg == "--dump-config") {
            parsed.dump_config = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            if (error) *error = "unexpected argument '" + arg + "'";
            return false;
        }
        if (i + 1 >= args.size()) {
            if (error) *error = "missing value for '" + arg + "'";
            return false;
        }
        std::string key = arg.substr(2);
        std::string value = args[++i];
        if (key == "config") {
            parsed.config_path = value;
        } else {
            parsed.overrides.emplace_back(key, value);
        }
    }
    *options = std::move(parsed);
    return true;
}

int ExitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigError: return 2;
        case ErrorCode::InvalidTimeframe: return 2;
        case ErrorCode::StoreQueryFailure: return 3;
        case ErrorCode::InsufficientRange: return 4;
        case ErrorCode::UnsortedInput: return 5;
        case ErrorCode::MalformedBar: return 5;
        case ErrorCode::LeakageViolation: return 6;
        case ErrorCode::FoldExecutionFailure: return 7;
    }
    return 1;
}

int RunBacktestCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    CliOptions options;
    std::string parseError;
    if (!ParseCliArguments(args, &options, &parseError)) {
        err << "mtfcast_backtest: " << parseError << "\n";
        PrintUsage(err);
        return ExitCodeFor(ErrorCode::ConfigError);
    }
    if (options.show_help) {
        PrintUsage(err);
        return 0;
    }
    if (options.verbose) {
        SimpleLogger::SetMinLevel(LogLevel::Debug);
    }

    try {
        RunConfig config;
        if (!options.config_path.empty()) {
            config = RunConfigSerializer::LoadFile(options.config_path);
        }
        for (const auto& [key, value] : options.overrides) {
            std::string error;
            if (!RunConfigSerializer::ApplySetting(key, value, &config, &error)) {
                throw ConfigError("--" + key + ": " + error);
            }
        }
        ValidateRunConfig(config);

        if (options.dump_config) {
            out << RunConfigSerializer::Serialize(config);
            return 0;
        }

        BacktestPipeline pipeline(config);
        pipeline.SetProgressCallback([](int current, int total) {
            SimpleLogger::Info("Folds finished: " + std::to_string(current) + "/" + std::to_string(total));
        });

        PipelineResult result = pipeline.Execute();
        PrintSummary(result, out);

        std::string error;
        if (!config.output_path.empty()) {
            if (!WriteRunArtifact(result, config.output_path, &error)) {
                SimpleLogger::Error(error);
                return 1;
            }
            SimpleLogger::Info("Wrote " + config.output_path);
        }
        if (!config.predictions_csv_path.empty()) {
            if (!WritePredictionsCsv(result, config.predictions_csv_path, &error)) {
                SimpleLogger::Error(error);
                return 1;
            }
            SimpleLogger::Info("Wrote " + config.predictions_csv_path);
        }
        if (result.run.CountWithStatus(simulation::FoldStatus::Ok) == 0) {
            SimpleLogger::Error("No fold completed successfully");
            return ExitCodeFor(ErrorCode::FoldExecutionFailure);
        }
        return 0;
    } catch (const Error& e) {
        SimpleLogger::Error(e.what());
        return ExitCodeFor(e.code());
    } catch (const std::exception& e) {
        SimpleLogger::Error(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}

} // namespace mtfcast
