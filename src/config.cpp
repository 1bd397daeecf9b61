#include "config.hpp"
#include "errors.hpp"
#include "timeutils.hpp"

#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Config::Config(const std::filesystem::path &path) : m_Path(path) {
    m_Document = DefaultDocument();
    Load();
    Apply();
}

// ─────────────────────────────────────
std::filesystem::path Config::DefaultPath() {
    const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path baseDir;
    if (xdgConfigHome && *xdgConfigHome) {
        baseDir = xdgConfigHome;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            throw ConfigError("HOME environment variable not set");
        }
        baseDir = std::filesystem::path(home) / ".config";
    }
    return baseDir / "hyprpomo" / "config.json";
}

// ─────────────────────────────────────
nlohmann::json Config::DefaultDocument() {
    return {
        {"times", {{"work", "25m"}, {"short_break", "5m"}, {"long_break", "15m"}}},
        {"colors",
         {{"work", "cyan"}, {"break", "magenta"}, {"pause", "yellow"}, {"dim", "bright_black"}}},
        {"game_balance",
         {{"xp_per_minute", 10}, {"overtime_multiplier", 2.0}, {"break_skip_xp_per_min", 5}}},
        {"sounds",
         {{"enabled", true},
          {"work", "/usr/share/sounds/freedesktop/stereo/complete.oga"},
          {"break", "/usr/share/sounds/freedesktop/stereo/service-login.oga"}}},
    };
}

// ─────────────────────────────────────
void Config::Load() {
    std::error_code ec;
    std::filesystem::create_directories(m_Path.parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create config directory {}: {}", m_Path.parent_path().string(),
                      ec.message());
        throw ConfigError("cannot create " + m_Path.parent_path().string() + ": " + ec.message());
    }

    if (!std::filesystem::exists(m_Path, ec)) {
        spdlog::info("No config at {}, writing defaults", m_Path.string());
        WriteDefaults();
        return;
    }

    std::ifstream file(m_Path);
    if (!file.is_open()) {
        spdlog::warn("Cannot read config {}, using defaults", m_Path.string());
        return;
    }

    nlohmann::json user;
    try {
        user = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Error loading config {}: {}. Using defaults.", m_Path.string(), e.what());
        return;
    }

    m_Document = m_JsonParse.MergeObjects(m_Document, user);
    spdlog::debug("Config loaded from {}", m_Path.string());
}

// ─────────────────────────────────────
bool Config::WriteDefaults() {
    std::ofstream file(m_Path, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::warn("Cannot write default config to {}", m_Path.string());
        return false;
    }
    file << m_Document.dump(4) << "\n";
    if (!file.good()) {
        spdlog::warn("Writing default config to {} failed", m_Path.string());
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::chrono::seconds Config::ReadDuration(const nlohmann::json &times, const std::string &key,
                                          std::chrono::seconds fallback) {
    // Integers are minutes, like bare digit tokens.
    if (times.contains(key) && times.at(key).is_number_integer()) {
        const int minutes = times.at(key).get<int>();
        if (minutes > 0) {
            return std::chrono::minutes(minutes);
        }
        spdlog::warn("Config: times.{} must be positive, using {}", key, FormatClock(fallback));
        return fallback;
    }

    const std::string token = m_JsonParse.GetString(times, key, "");
    if (token.empty()) {
        return fallback;
    }
    try {
        return ParseDuration(token);
    } catch (const DurationParseError &e) {
        spdlog::warn("Config: times.{}: {}; using default", key, e.what());
        return fallback;
    }
}

// ─────────────────────────────────────
void Config::Apply() {
    const SessionTimes defaults;
    const nlohmann::json times = m_JsonParse.GetObject(m_Document, "times");
    m_Times.work = ReadDuration(times, "work", defaults.work);
    m_Times.shortBreak = ReadDuration(times, "short_break", defaults.shortBreak);
    m_Times.longBreak = ReadDuration(times, "long_break", defaults.longBreak);

    const GameBalance base;
    const nlohmann::json balance = m_JsonParse.GetObject(m_Document, "game_balance");
    m_Balance.xpPerMinute = m_JsonParse.GetInt(balance, "xp_per_minute", base.xpPerMinute);
    m_Balance.overtimeMultiplier =
        m_JsonParse.GetDouble(balance, "overtime_multiplier", base.overtimeMultiplier);
    m_Balance.breakSkipXpPerMin =
        m_JsonParse.GetInt(balance, "break_skip_xp_per_min", base.breakSkipXpPerMin);

    if (m_Balance.xpPerMinute < 0) {
        spdlog::warn("Config: xp_per_minute must not be negative, using {}", base.xpPerMinute);
        m_Balance.xpPerMinute = base.xpPerMinute;
    }
    if (m_Balance.overtimeMultiplier < 0.0) {
        spdlog::warn("Config: overtime_multiplier must not be negative, using {}",
                     base.overtimeMultiplier);
        m_Balance.overtimeMultiplier = base.overtimeMultiplier;
    }
    if (m_Balance.breakSkipXpPerMin < 0) {
        spdlog::warn("Config: break_skip_xp_per_min must not be negative, using {}",
                     base.breakSkipXpPerMin);
        m_Balance.breakSkipXpPerMin = base.breakSkipXpPerMin;
    }

    spdlog::debug("Config: work={}, short_break={}, long_break={}, xp/min={}, flow x{}, skip xp/min={}",
                  FormatClock(m_Times.work), FormatClock(m_Times.shortBreak),
                  FormatClock(m_Times.longBreak), m_Balance.xpPerMinute,
                  m_Balance.overtimeMultiplier, m_Balance.breakSkipXpPerMin);
}
