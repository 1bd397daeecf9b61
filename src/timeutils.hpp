#pragma once

#include <chrono>
#include <string>

#define MAX_DURATION_SECONDS (24 * 60 * 60)

// True when the token is meant as a duration (starts with a digit).
bool LooksLikeDuration(const std::string &token);

// Parses "90s", "45m", "1h" or bare minutes ("25"), at most 24h. Throws DurationParseError.
std::chrono::seconds ParseDuration(const std::string &token);

// "MM:SS", minutes are not wrapped at 60.
std::string FormatClock(std::chrono::seconds value);

// Local calendar date as YYYY-MM-DD.
std::string LocalDate(std::chrono::system_clock::time_point tp);

// Local hour of day [0, 23].
int LocalHour(std::chrono::system_clock::time_point tp);
