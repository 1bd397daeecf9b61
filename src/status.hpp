#pragma once

#include <filesystem>
#include <string>

#include "common.hpp"

// Writes a one-line session status for bars that poll a file (waybar custom module).
class StatusPublisher {
  public:
    StatusPublisher();
    explicit StatusPublisher(const std::filesystem::path &path);

    static std::filesystem::path DefaultPath();
    static std::string Format(const SessionSnapshot &snapshot);

    void Publish(const SessionSnapshot &snapshot);
    void Clear();

  private:
    void Write(const std::string &line);

  private:
    std::filesystem::path m_Path;
    std::string m_LastLine;
    bool m_WriteFailed = false;
};
