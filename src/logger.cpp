#include "logger.hpp"

#include <iostream>

namespace refyne {

namespace {

const char* levelName(StderrLogger::Level level) {
    switch (level) {
        case StderrLogger::Level::Debug: return "DEBUG";
        case StderrLogger::Level::Info:  return "INFO";
        case StderrLogger::Level::Warn:  return "WARN";
        case StderrLogger::Level::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

StderrLogger::StderrLogger(Level minLevel)
    : mMinLevel(minLevel) {}

void StderrLogger::debug(const std::string& message, const nlohmann::json& fields) {
    write(Level::Debug, message, fields);
}

void StderrLogger::info(const std::string& message, const nlohmann::json& fields) {
    write(Level::Info, message, fields);
}

void StderrLogger::warn(const std::string& message, const nlohmann::json& fields) {
    write(Level::Warn, message, fields);
}

void StderrLogger::error(const std::string& message, const nlohmann::json& fields) {
    write(Level::Error, message, fields);
}

void StderrLogger::write(Level level, const std::string& message,
                         const nlohmann::json& fields) {
    if (level < mMinLevel) return;

    // Lines from concurrent calls must not interleave.
    std::lock_guard<std::mutex> lock(mMutex);
    std::cerr << "[refyne] " << levelName(level) << " " << message;
    if (!fields.is_null() && !fields.empty()) {
        std::cerr << " " << fields.dump();
    }
    std::cerr << "\n";
}

} // namespace refyne
