#include "input/log_parser.h"

#include <algorithm>
#include <cctype>
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

namespace {

// Sleuth headers are short; only this much of a line is searched for the
// "<class> : " separator.
constexpr size_t kMaxHeaderLength = 1024;

// Matches the header up to and including the separator colon. The message
// after it is never run through the regex.
const std::regex& HeaderPattern() {
    static const std::regex pattern(
        R"((\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d+)Z\s([A-Z]+)\s\[([^,]+),([^,]+),([^\]]+)\]\s.*?([a-zA-Z0-9_.]+)\s*:$)");
    return pattern;
}

auto Trim(const std::string& s) -> std::string {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

auto MatchRecord(const std::string& line) -> std::optional<LogEvent> {
    std::smatch m;
    std::string header;
    size_t message_start = std::string::npos;
    auto limit = std::min(line.size(), kMaxHeaderLength);
    for (size_t pos = line.find(':'); pos != std::string::npos && pos + 1 < limit; pos = line.find(':', pos + 1)) {
        if (!std::isspace(static_cast<unsigned char>(line[pos + 1]))) continue;
        header = line.substr(0, pos + 1);
        if (std::regex_search(header, m, HeaderPattern())) {
            message_start = pos + 2;
            break;
        }
    }
    if (message_start == std::string::npos) {
        return std::nullopt;
    }
    auto ts = ParseIsoTime(m[1].str() + "Z");
    if (!ts.has_value()) {
        spdlog::debug("Unparseable log timestamp '{}', treating line as continuation", m[1].str());
        return std::nullopt;
    }
    LogEvent e;
    e.timestamp = *ts;
    e.level = ParseLevel(m[2].str());
    e.service = m[3].str();
    e.trace_id = m[4].str();
    e.span_id = m[5].str();
    e.class_name = m[6].str();
    e.message = line.substr(message_start);
    return e;
}

} // namespace

auto ParseLogLines(const std::vector<std::string>& lines) -> std::vector<LogEvent> {
    std::vector<LogEvent> events;
    std::optional<LogEvent> current;
    size_t continuations = 0;

    for (const auto& raw : lines) {
        auto line = Trim(raw);
        if (line.empty()) continue;

        auto record = MatchRecord(line);
        if (record.has_value()) {
            if (current.has_value()) {
                events.push_back(std::move(*current));
            }
            current = std::move(record);
        } else if (current.has_value()) {
            current->message += " | " + line;
            continuations++;
        }
    }
    if (current.has_value()) {
        events.push_back(std::move(*current));
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const LogEvent& a, const LogEvent& b) { return a.timestamp < b.timestamp; });

    obs::LogEvent(obs::LogLevel::Info, "logs_parsed", "log_parser",
                  {{"lines", lines.size()}, {"records", events.size()}, {"continuations", continuations}});
    obs::EmitCounter("log_records_parsed_total", static_cast<long>(events.size()), "records", "log_parser");
    return events;
}

auto ParseLogFile(const std::string& path) -> std::vector<LogEvent> {
    std::ifstream in(path);
    if (!in.is_open()) {
        obs::LogEvent(obs::LogLevel::Error, "log_read_error", "log_parser",
                      {{"path", path}, {"error_code", obs::kErrInputReadFailed}});
        throw std::runtime_error("Failed to open log file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return ParseLogLines(lines);
}

} // namespace logrca::input
