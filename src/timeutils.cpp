#include "timeutils.hpp"
#include "errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <ctime>

// ─────────────────────────────────────
static std::tm ToLocalTm(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        spdlog::error("localtime_r failed for {}", static_cast<long long>(t));
    }
    return local;
}

// ─────────────────────────────────────
bool LooksLikeDuration(const std::string &token) {
    return !token.empty() && std::isdigit(static_cast<unsigned char>(token.front()));
}

// ─────────────────────────────────────
std::chrono::seconds ParseDuration(const std::string &token) {
    if (token.empty()) {
        throw DurationParseError("empty duration");
    }

    size_t pos = 0;
    long long value = 0;
    while (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
        value = value * 10 + (token[pos] - '0');
        if (value > MAX_DURATION_SECONDS) {
            throw DurationParseError("duration too large: '" + token + "' (max 24h)");
        }
        ++pos;
    }

    if (pos == 0) {
        throw DurationParseError("duration must start with a number: '" + token + "'");
    }

    long long unit = 60;
    if (pos < token.size()) {
        if (pos + 1 != token.size()) {
            throw DurationParseError("invalid duration '" + token + "' (use e.g. 90s, 45m, 1h)");
        }
        switch (std::tolower(static_cast<unsigned char>(token[pos]))) {
        case 's':
            unit = 1;
            break;
        case 'm':
            unit = 60;
            break;
        case 'h':
            unit = 3600;
            break;
        default:
            throw DurationParseError("invalid duration unit in '" + token + "'");
        }
    }

    if (value == 0) {
        throw DurationParseError("duration must be greater than zero: '" + token + "'");
    }

    if (value * unit > MAX_DURATION_SECONDS) {
        throw DurationParseError("duration too large: '" + token + "' (max 24h)");
    }
    return std::chrono::seconds(value * unit);
}

// ─────────────────────────────────────
std::string FormatClock(std::chrono::seconds value) {
    long long total = value.count();
    if (total < 0) {
        total = 0;
    }
    return fmt::format("{:02}:{:02}", total / 60, total % 60);
}

// ─────────────────────────────────────
std::string LocalDate(std::chrono::system_clock::time_point tp) {
    const std::tm local = ToLocalTm(tp);
    char buf[16];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local) == 0) {
        return "";
    }
    return buf;
}

// ─────────────────────────────────────
int LocalHour(std::chrono::system_clock::time_point tp) {
    return ToLocalTm(tp).tm_hour;
}
