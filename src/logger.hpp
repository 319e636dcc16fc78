#pragma once

#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace refyne {

/// Sink for SDK diagnostics. Implement this to route messages into an
/// application's own logging backend.
/// @param fields  A JSON object of structured context, or null.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void debug(const std::string& message,
                       const nlohmann::json& fields = nullptr) = 0;
    virtual void info(const std::string& message,
                      const nlohmann::json& fields = nullptr) = 0;
    virtual void warn(const std::string& message,
                      const nlohmann::json& fields = nullptr) = 0;
    virtual void error(const std::string& message,
                       const nlohmann::json& fields = nullptr) = 0;
};

/// Default logger: discards everything.
class NullLogger : public Logger {
public:
    void debug(const std::string&, const nlohmann::json& = nullptr) override {}
    void info(const std::string&, const nlohmann::json& = nullptr) override {}
    void warn(const std::string&, const nlohmann::json& = nullptr) override {}
    void error(const std::string&, const nlohmann::json& = nullptr) override {}
};

/// Writes "[refyne] LEVEL message {fields}" lines to std::cerr.
class StderrLogger : public Logger {
public:
    enum class Level { Debug = 0, Info, Warn, Error };

    explicit StderrLogger(Level minLevel = Level::Info);

    void debug(const std::string& message, const nlohmann::json& fields = nullptr) override;
    void info(const std::string& message, const nlohmann::json& fields = nullptr) override;
    void warn(const std::string& message, const nlohmann::json& fields = nullptr) override;
    void error(const std::string& message, const nlohmann::json& fields = nullptr) override;

private:
    void write(Level level, const std::string& message,
               const nlohmann::json& fields);

    Level      mMinLevel;
    std::mutex mMutex;
};

} // namespace refyne
