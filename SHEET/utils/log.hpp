#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sheet::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Accepts error, warn/warning, info and debug in any case.
std::optional<Level> parse_level(std::string_view text);
const char* level_name(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
