#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

sheet::log::Level& global_level() {
    static sheet::log::Level lvl = sheet::log::Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_flag_set(const char* value) {
    return value && (*value == '1' || *value == 'y' || *value == 'Y' || *value == 't' || *value == 'T');
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    const char* requested = std::getenv("SHEET_LOG_LEVEL");
    const auto parsed = requested ? sheet::log::parse_level(requested) : std::nullopt;
    if (parsed) {
        global_level() = *parsed;
    }

    const char* file = std::getenv("SHEET_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (env_flag_set(std::getenv("SHEET_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
    if (requested && !parsed) {
        std::cerr << "[WARN] unknown SHEET_LOG_LEVEL '" << requested << "'; using info.\n";
    }
}

void log_line_impl(sheet::log::Level level, const std::string& message) {
    init_from_env_once();
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream stamp;
    stamp.setf(std::ios::fixed);
    stamp << std::setprecision(3) << secs;
    const std::string line = std::string("[") + sheet::log::level_name(level) + "] +" + stamp.str() + "s: " + message + '\n';

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& os = (level == sheet::log::Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace sheet::log {

std::optional<Level> parse_level(std::string_view text) {
    std::string lower(text);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    return global_level();
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) <= static_cast<int>(level());
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
