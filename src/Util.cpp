#include "autocrate/Util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

#include <utf8proc.h>

namespace autocrate {

namespace {
const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

std::string LogEntry::toJsonl() const {
    return fmt::format(R"({{"level":"{}","message":"{}","source":"{}","timestamp_ms":{}}})",
                       levelName(level), Util::escapeJson(message), Util::escapeJson(source), timestamp_ms);
}

int64_t Util::roundHalfEven(double value) noexcept {
    // 2^63 is exact as a double; anything at or beyond it saturates
    constexpr double LIMIT = 9223372036854775808.0;
    if (std::isnan(value)) {
        return 0;
    }
    if (value >= LIMIT) {
        return std::numeric_limits<int64_t>::max();
    }
    if (value < -LIMIT) {
        return std::numeric_limits<int64_t>::min();
    }
    // nearbyint honours the default FE_TONEAREST mode
    return static_cast<int64_t>(std::nearbyint(value));
}

std::string Util::trim(std::string_view text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && isSpace(text[start])) {
        ++start;
    }
    while (end > start && isSpace(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(start, end - start));
}

std::vector<std::string> Util::split(std::string_view text, std::string_view delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.emplace_back(text);
        return parts;
    }
    size_t start = 0;
    while (true) {
        const size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return parts;
}

bool Util::isDigits(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string Util::foldCase(std::string_view text) {
    utf8proc_uint8_t* folded = nullptr;
    const utf8proc_ssize_t length = utf8proc_map(
        reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
        static_cast<utf8proc_ssize_t>(text.size()),
        &folded,
        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD));

    if (length < 0 || folded == nullptr) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::string result(reinterpret_cast<const char*>(folded), static_cast<size_t>(length));
    std::free(folded);
    return result;
}

bool Util::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return foldCase(haystack).find(foldCase(needle)) != std::string::npos;
}

bool Util::equalsIgnoreCase(std::string_view a, std::string_view b) {
    return foldCase(a) == foldCase(b);
}

std::string Util::escapeJson(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

int64_t Util::currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

LogEntry Util::createLogEntry(LogLevel level, const std::string& message, int64_t timestamp_ms,
                              const std::source_location& loc) {
    return LogEntry{
        level,
        message,
        fmt::format("{}:{}", loc.file_name(), loc.line()),
        timestamp_ms
    };
}

void Util::report(std::vector<LogEntry>& sink, LogLevel level,
                  std::string_view component, const std::string& message) {
    std::cerr << component << ": " << message << std::endl;
    sink.push_back(LogEntry{level, message, std::string(component), currentTimeMillis()});
}

} // namespace autocrate
