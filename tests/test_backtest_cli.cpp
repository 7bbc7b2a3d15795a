#include "BacktestCli.h"
#include "SimpleLogger.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

using namespace mtfcast;
using mtfcast::testing::kDay0;

namespace {

// "YYYYMMDD HHMMSS;open;high;low;close;volume" for a Histdata generic ASCII file.
std::string HistdataRow(int64_t start_ms, double close) {
    const std::string iso = FormatIsoMillis(start_ms);
    std::ostringstream row;
    row << iso.substr(0, 4) << iso.substr(5, 2) << iso.substr(8, 2) << ' '
        << iso.substr(11, 2) << iso.substr(14, 2) << iso.substr(17, 2) << ';'
        << close << ';' << close + 0.01 << ';' << close - 0.01 << ';' << close << ";5";
    return row.str();
}

class BacktestCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = std::filesystem::temp_directory_path()
              / ("mtfcast_cli_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(m_dir / "data");
        SimpleLogger::SetCallback([this](LogLevel level, const std::string& message) {
            if (level >= LogLevel::Error) {
                std::lock_guard<std::mutex> lock(m_errorsMutex);
                m_errors.push_back(message);
            }
        });
    }

    void TearDown() override {
        SimpleLogger::ClearCallback();
        SimpleLogger::SetMinLevel(LogLevel::Info);
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    // One bar per minute over [start_ms, end_ms) with a slowly rising close.
    void WriteMinutes(const std::string& name, int64_t start_ms, int64_t end_ms) {
        std::ofstream out(m_dir / "data" / name);
        int i = 0;
        for (int64_t ts = start_ms; ts < end_ms; ts += kMinuteMs, ++i) {
            out << HistdataRow(ts, 100.0 + 0.001 * i) << "\n";
        }
    }

    void WriteLines(const std::string& name, const std::vector<std::string>& lines) {
        std::ofstream out(m_dir / "data" / name);
        for (const auto& line : lines) {
            out << line << "\n";
        }
    }

    // A complete run over the Histdata directory; extra arguments are appended.
    std::vector<std::string> Args(std::vector<std::string> extra = {}) const {
        std::vector<std::string> args = {
            "--symbol", "EURUSD",
            "--store", "histdata",
            "--histdata_directory", (m_dir / "data").string(),
            "--retry_attempts", "1",
            "--timeframes", "5m,1h",
            "--model", "naive",
            "--range_start", "2024-01-01T00:00:00Z",
            "--range_end", "2024-01-04T00:00:00Z",
            "--train_window", "1d",
            "--eval_window", "12h",
            "--step", "12h",
        };
        args.insert(args.end(), extra.begin(), extra.end());
        return args;
    }

    int Run(const std::vector<std::string>& args) {
        m_out.str("");
        m_err.str("");
        return RunBacktestCli(args, m_out, m_err);
    }

    std::filesystem::path m_dir;
    std::ostringstream m_out;
    std::ostringstream m_err;
    std::mutex m_errorsMutex;
    std::vector<std::string> m_errors;
};

} // namespace

TEST(CliArgumentsTest, SplitsConfigOverridesAndFlags) {
    CliOptions options;
    std::string error;
    ASSERT_TRUE(ParseCliArguments({"--config", "run.cfg", "--symbol", "GBPUSD", "-v",
                                   "--max_parallel_folds", "4", "--dump-config"},
                                  &options, &error)) << error;
    EXPECT_EQ(options.config_path, "run.cfg");
    ASSERT_EQ(options.overrides.size(), 2u);
    EXPECT_EQ(options.overrides[0], (std::pair<std::string, std::string>{"symbol", "GBPUSD"}));
    EXPECT_EQ(options.overrides[1], (std::pair<std::string, std::string>{"max_parallel_folds", "4"}));
    EXPECT_TRUE(options.verbose);
    EXPECT_TRUE(options.dump_config);
    EXPECT_FALSE(options.show_help);

    EXPECT_FALSE(ParseCliArguments({"--symbol"}, &options, &error));
    EXPECT_EQ(error, "missing value for '--symbol'");
    EXPECT_FALSE(ParseCliArguments({"run.cfg"}, &options, &error));
    EXPECT_EQ(error, "unexpected argument 'run.cfg'");
    EXPECT_FALSE(ParseCliArguments({"--", "x"}, &options, &error));
}

TEST(CliArgumentsTest, ExitCodesByErrorKind) {
    EXPECT_EQ(ExitCodeFor(ErrorCode::ConfigError), 2);
    EXPECT_EQ(ExitCodeFor(ErrorCode::InvalidTimeframe), 2);
    EXPECT_EQ(ExitCodeFor(ErrorCode::StoreQueryFailure), 3);
    EXPECT_EQ(ExitCodeFor(ErrorCode::InsufficientRange), 4);
    EXPECT_EQ(ExitCodeFor(ErrorCode::UnsortedInput), 5);
    EXPECT_EQ(ExitCodeFor(ErrorCode::MalformedBar), 5);
    EXPECT_EQ(ExitCodeFor(ErrorCode::LeakageViolation), 6);
    EXPECT_EQ(ExitCodeFor(ErrorCode::FoldExecutionFailure), 7);
}

TEST_F(BacktestCliTest, HelpAndBadArguments) {
    EXPECT_EQ(Run({"--help"}), 0);
    EXPECT_NE(m_err.str().find("Usage: mtfcast_backtest"), std::string::npos);

    EXPECT_EQ(Run({"--symbol"}), 2);
    EXPECT_NE(m_err.str().find("missing value for '--symbol'"), std::string::npos);
}

TEST_F(BacktestCliTest, ConfigProblemsExitWithTwo) {
    EXPECT_EQ(Run(Args({"--learning_rate", "0.1"})), 2);
    ASSERT_FALSE(m_errors.empty());
    EXPECT_NE(m_errors.back().find("Unknown setting 'learning_rate'"), std::string::npos);

    EXPECT_EQ(Run(Args({"--symbol", ""})), 2);
    EXPECT_EQ(Run(Args({"--timeframes", "5m,7s"})), 2);
    EXPECT_EQ(Run({"--config", (m_dir / "missing.cfg").string()}), 2);
    EXPECT_EQ(Run(Args({"--model", "xgboost"})), 2);
}

TEST_F(BacktestCliTest, DumpConfigPrintsMergedSettings) {
    std::ofstream(m_dir / "run.cfg") << "[RUN]\nsymbol=GBPUSD\nmodel=linear\n";
    std::vector<std::string> args = Args({"--dump-config"});
    args.insert(args.begin(), {"--config", (m_dir / "run.cfg").string()});

    EXPECT_EQ(Run(args), 0);
    const std::string dumped = m_out.str();
    // Command-line values win over the file.
    EXPECT_NE(dumped.find("symbol=EURUSD"), std::string::npos);
    EXPECT_NE(dumped.find("model=naive"), std::string::npos);
    EXPECT_NE(dumped.find("kind=histdata"), std::string::npos);
    EXPECT_NE(dumped.find("timeframes=5m,1h"), std::string::npos);
}

TEST_F(BacktestCliTest, SuccessfulRunWritesArtifacts) {
    WriteMinutes("DAT_ASCII_EURUSD_M1_202401.csv", kDay0, kDay0 + 3 * kDayMs);
    const auto json = m_dir / "out" / "run.json";
    const auto csv = m_dir / "out" / "predictions.csv";

    EXPECT_EQ(Run(Args({"--output", json.string(), "--predictions_csv", csv.string()})), 0);
    EXPECT_NE(m_out.str().find("4 folds (4 ok, 0 failed, 0 cancelled)"), std::string::npos) << m_out.str();
    EXPECT_NE(m_out.str().find("directional_accuracy"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(json));
    EXPECT_TRUE(std::filesystem::exists(csv));
    EXPECT_TRUE(m_errors.empty());
}

TEST_F(BacktestCliTest, StoreFailureExitsWithThree) {
    WriteLines("DAT_ASCII_EURUSD_M1_a.csv", {HistdataRow(kDay0, 100.0)});
    WriteLines("DAT_ASCII_EURUSD_M1_b.csv", {HistdataRow(kDay0, 100.0)});
    EXPECT_EQ(Run(Args()), 3);
}

TEST_F(BacktestCliTest, NoDataExitsWithFour) {
    EXPECT_EQ(Run(Args()), 4);
    // A layout that needs more than the range fails the same way.
    WriteMinutes("DAT_ASCII_EURUSD_M1_202401.csv", kDay0, kDay0 + 3 * kDayMs);
    EXPECT_EQ(Run(Args({"--train_window", "5d"})), 4);
}

TEST_F(BacktestCliTest, MalformedBarExitsWithFive) {
    WriteLines("DAT_ASCII_EURUSD_M1_202401.csv", {
        HistdataRow(kDay0, 100.0),
        // high below low
        "20240101 000100;100.0;99.0;101.0;100.0;5",
    });
    EXPECT_EQ(Run(Args()), 5);
}

TEST_F(BacktestCliTest, NoSuccessfulFoldExitsWithSeven) {
    // Only the last day has bars, so neither fold has training rows.
    WriteMinutes("DAT_ASCII_EURUSD_M1_202401.csv", kDay0 + 2 * kDayMs, kDay0 + 3 * kDayMs);
    EXPECT_EQ(Run(Args({"--eval_window", "1d", "--step", "1d"})), 7);
    EXPECT_NE(m_out.str().find("2 folds (0 ok, 2 failed, 0 cancelled)"), std::string::npos) << m_out.str();
    EXPECT_NE(m_out.str().find("no training rows"), std::string::npos);
}
