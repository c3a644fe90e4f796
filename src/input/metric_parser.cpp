#include "input/metric_parser.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "time_resolution.h"

namespace logrca::input {

namespace fs = std::filesystem;

namespace {

constexpr const char* kServiceHeader = "# SERVICE=";
constexpr const char* kMetricHeader = "## METRIC:";
constexpr const char* kPromqlHeader = "## PROMQL:";

auto StartsWith(const std::string& s, const char* prefix) -> bool {
    return s.rfind(prefix, 0) == 0;
}

auto Trim(const std::string& s) -> std::string {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

auto ParseValue(const std::string& text) -> std::optional<double> {
    try {
        size_t consumed = 0;
        double v = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto ReadLines(const fs::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    if (!in.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "metric_read_error", "metric_parser",
                      {{"path", path.string()}, {"error_code", obs::kErrInputReadFailed}});
        throw std::runtime_error("Failed to open metric file: " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

auto ParseMetricLines(const std::vector<std::string>& lines) -> std::vector<MetricSample> {
    static const std::regex service_label(R"re(service="([^"]+)")re");

    std::vector<MetricSample> samples;
    std::string service;
    std::optional<MetricName> metric;
    size_t skipped = 0;

    for (const auto& raw : lines) {
        auto line = Trim(raw);
        if (line.empty()) continue;

        if (StartsWith(line, kServiceHeader)) {
            service = Trim(line.substr(std::string(kServiceHeader).size()));
            continue;
        }
        if (StartsWith(line, kMetricHeader)) {
            auto name = Trim(line.substr(std::string(kMetricHeader).size()));
            metric = ParseMetricName(name);
            if (!metric.has_value()) {
                spdlog::debug("Skipping unknown metric section '{}'", name);
            }
            continue;
        }
        if (StartsWith(line, kPromqlHeader)) {
            std::smatch m;
            if (std::regex_search(line, m, service_label)) {
                service = m[1].str();
            }
            continue;
        }
        if (line[0] == '#' || !metric.has_value() || service.empty()) {
            continue;
        }

        auto tab = line.find('\t');
        if (tab == std::string::npos || line.find('\t', tab + 1) != std::string::npos) {
            spdlog::debug("Skipping malformed metric line '{}'", line);
            skipped++;
            continue;
        }
        auto ts = ParseIsoTime(Trim(line.substr(0, tab)));
        auto value = ParseValue(Trim(line.substr(tab + 1)));
        if (!ts.has_value() || !value.has_value()) {
            spdlog::debug("Skipping malformed metric line '{}'", line);
            skipped++;
            continue;
        }
        samples.push_back({*ts, service, *metric, *value});
    }

    if (skipped > 0) {
        obs::EmitCounter("metric_lines_skipped_total", static_cast<long>(skipped), "lines", "metric_parser");
    }
    return samples;
}

auto ParseMetricPath(const std::string& path) -> std::vector<MetricSample> {
    std::error_code ec;
    fs::path root(path);
    if (!fs::exists(root, ec)) {
        obs::LogEvent(obs::LogLevel::Error, "metric_read_error", "metric_parser",
                      {{"path", path}, {"error_code", obs::kErrInputReadFailed}});
        throw std::runtime_error("Metric path does not exist: " + path);
    }

    std::vector<fs::path> files;
    if (fs::is_directory(root, ec)) {
        for (const auto& entry : fs::directory_iterator(root)) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
    } else {
        files.push_back(root);
    }

    std::vector<MetricSample> samples;
    for (const auto& f : files) {
        auto parsed = ParseMetricLines(ReadLines(f));
        spdlog::debug("Parsed {} metric samples from {}", parsed.size(), f.string());
        samples.insert(samples.end(), parsed.begin(), parsed.end());
    }

    obs::LogEvent(obs::LogLevel::Info, "metrics_parsed", "metric_parser",
                  {{"path", path}, {"files", files.size()}, {"samples", samples.size()}});
    obs::EmitCounter("metric_samples_parsed_total", static_cast<long>(samples.size()), "samples", "metric_parser");
    return samples;
}

} // namespace logrca::input
