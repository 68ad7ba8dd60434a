#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace peerdrop {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "peerdrop";
constexpr const char* SESSION_LOGGER = "session";
constexpr const char* SIGNALING_LOGGER = "signaling";
constexpr const char* TRANSFER_LOGGER = "transfer";
constexpr const char* CONFIG_LOGGER = "config";

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;              // empty = no file sink
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{3};
};

// Build the shared sinks. Loggers created before init() are rebuilt on the
// new sinks; a second init() replaces the first.
void init(const LogConfig& config = LogConfig{});

// PEERDROP_LOG_LEVEL and PEERDROP_LOG_FILE override the given values
void apply_env(LogConfig& config);

// Named logger on the shared sinks, created on first use
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

void set_level(Level level);
bool is_level_enabled(Level level);

// "warning" and "err" are accepted; nullopt for anything else
std::optional<Level> parse_level(std::string_view level);
const char* level_name(Level level);

void shutdown();

// ============================================================================
// Logger - per-component handle, cheap to keep in a function-local static
// ============================================================================
class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        write(Level::Error, fmt, std::forward<Args>(args)...);
    }

    const std::string& name() const { return name_; }

private:
    template<typename... Args>
    void write(Level level, fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(level)) {
            get(name_)->log(to_spdlog(level), fmt, std::forward<Args>(args)...);
        }
    }

    static spdlog::level::level_enum to_spdlog(Level level);

    std::string name_;
};

#define LOG_DEBUG(...) ::peerdrop::log::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) ::peerdrop::log::get()->info(__VA_ARGS__)
#define LOG_WARN(...) ::peerdrop::log::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::peerdrop::log::get()->error(__VA_ARGS__)

} // namespace log
} // namespace peerdrop
