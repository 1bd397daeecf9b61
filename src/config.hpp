#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "json.hpp"
#include "xp.hpp"

struct SessionTimes {
    std::chrono::seconds work{25 * 60};
    std::chrono::seconds shortBreak{5 * 60};
    std::chrono::seconds longBreak{15 * 60};
};

class Config {
  public:
    // Throws ConfigError when the config directory cannot be created.
    explicit Config(const std::filesystem::path &path);

    // $XDG_CONFIG_HOME/hyprpomo/config.json or ~/.config/hyprpomo/config.json
    static std::filesystem::path DefaultPath();
    static nlohmann::json DefaultDocument();

    const SessionTimes &Times() const {
        return m_Times;
    }
    const GameBalance &Balance() const {
        return m_Balance;
    }
    const nlohmann::json &Document() const {
        return m_Document;
    }
    const std::filesystem::path &Path() const {
        return m_Path;
    }

  private:
    void Load();
    bool WriteDefaults();
    void Apply();
    std::chrono::seconds ReadDuration(const nlohmann::json &times, const std::string &key,
                                      std::chrono::seconds fallback);

  private:
    std::filesystem::path m_Path;
    nlohmann::json m_Document;
    SessionTimes m_Times;
    GameBalance m_Balance;
    JsonParse m_JsonParse;
};
