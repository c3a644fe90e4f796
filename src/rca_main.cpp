#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "detector_config.h"
#include "errors.h"
#include "input/log_parser.h"
#include "input/metric_parser.h"
#include "metrics.h"
#include "obs/logging.h"
#include "pipeline.h"
#include "report/report_builder.h"

using namespace logrca;

namespace {

void PrintUsage() {
    std::cerr << "Usage: logrca --logs <file> [--metrics <file|dir>]... [--config <json>]\n"
              << "              [--output aiops_report.json] [--seed N] [--trees N]\n"
              << "              [--max_samples N] [--contamination X] [--threads N] [--verbose]"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    std::string logs_path;
    std::vector<std::string> metric_paths;
    std::string config_path;
    std::string output_path = "aiops_report.json";
    bool verbose = false;

    // Command-line overrides, applied on top of the config file.
    std::string seed_arg, trees_arg, max_samples_arg, contamination_arg, threads_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--logs" && i + 1 < argc) {
            logs_path = argv[++i];
        } else if (arg == "--metrics" && i + 1 < argc) {
            metric_paths.push_back(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed_arg = argv[++i];
        } else if (arg == "--trees" && i + 1 < argc) {
            trees_arg = argv[++i];
        } else if (arg == "--max_samples" && i + 1 < argc) {
            max_samples_arg = argv[++i];
        } else if (arg == "--contamination" && i + 1 < argc) {
            contamination_arg = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            threads_arg = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            PrintUsage();
            return 2;
        }
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    if (logs_path.empty()) {
        std::cerr << "Missing --logs." << std::endl;
        PrintUsage();
        return 2;
    }

    RcaConfig config;
    try {
        if (!config_path.empty()) {
            config = LoadConfigFile(config_path);
        }
        if (!seed_arg.empty()) config.forest.seed = std::stoull(seed_arg);
        if (!trees_arg.empty()) config.forest.n_trees = std::stoi(trees_arg);
        if (!max_samples_arg.empty()) config.forest.max_samples = std::stoul(max_samples_arg);
        if (!contamination_arg.empty()) config.detection.contamination = std::stod(contamination_arg);
        if (!threads_arg.empty()) config.forest.n_threads = std::stoi(threads_arg);
    } catch (const std::exception& e) {
        obs::LogEvent(obs::LogLevel::Error, "config_error", "cli",
                      {{"error_code", obs::kErrConfigInvalid}, {"error", e.what()}});
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    auto errors = ValidateConfig(config);
    if (!errors.empty()) {
        for (const auto& err : errors) {
            obs::LogEvent(obs::LogLevel::Error, "config_error", "cli",
                          {{"error_code", obs::kErrConfigInvalid}, {"field", err.field}, {"error", err.message}});
            std::cerr << "Invalid configuration: " << err.field << ": " << err.message << std::endl;
        }
        return 2;
    }

    spdlog::info("logrca starting: logs={} metric_sources={} trees={} contamination={} seed={}",
                 logs_path, metric_paths.size(), config.forest.n_trees,
                 config.detection.contamination, config.forest.seed);

    try {
        auto logs = input::ParseLogFile(logs_path);

        std::vector<MetricSample> samples;
        for (const auto& p : metric_paths) {
            auto parsed = input::ParseMetricPath(p);
            samples.insert(samples.end(), parsed.begin(), parsed.end());
        }

        auto result = RunAnalysis(logs, samples, config);
        report::WriteReportJson(result, output_path);

        std::cout << "Anomalies: " << result.summary.anomaly_count
                  << " Traces: " << result.anomalies.size()
                  << " Report: " << output_path << std::endl;
        spdlog::debug("Run metrics: {}", metrics::MetricsRegistry::Instance().ToJson().dump());
    } catch (const RcaError& e) {
        std::cerr << "Analysis failed [" << e.code() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
