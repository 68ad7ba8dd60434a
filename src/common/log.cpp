#include "common/log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <mutex>
#include <vector>

namespace peerdrop::log {

namespace {

struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>, std::less<>> loggers;
    bool initialized = false;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

std::atomic<Level> g_level{Level::Info};

spdlog::level::level_enum spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

// Caller holds the registry mutex
void build_sinks(Registry& reg) {
    reg.sinks.clear();

    if (reg.config.console) {
        reg.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!reg.config.file_path.empty()) {
        try {
            reg.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                reg.config.file_path, reg.config.max_file_size, reg.config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Fall back to console only
            reg.config.file_path.clear();
            std::fprintf(stderr, "Cannot open log file: %s\n", e.what());
        }
    }

    for (auto& sink : reg.sinks) {
        sink->set_pattern(reg.config.pattern);
    }
}

// Caller holds the registry mutex
std::shared_ptr<spdlog::logger> make_logger(Registry& reg, const std::string& name) {
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(spdlog_level(reg.config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum Logger::to_spdlog(Level level) {
    return spdlog_level(level);
}

std::optional<Level> parse_level(std::string_view level) {
    if (level == "trace") return Level::Trace;
    if (level == "debug") return Level::Debug;
    if (level == "info") return Level::Info;
    if (level == "warn" || level == "warning") return Level::Warn;
    if (level == "error" || level == "err") return Level::Error;
    if (level == "off") return Level::Off;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
        default: return "info";
    }
}

void init(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);

    reg.config = config;
    g_level.store(config.level, std::memory_order_relaxed);
    build_sinks(reg);

    for (auto& [name, logger] : reg.loggers) {
        logger = make_logger(reg, name);
    }
    if (!reg.loggers.contains(MAIN_LOGGER)) {
        reg.loggers.emplace(MAIN_LOGGER, make_logger(reg, MAIN_LOGGER));
    }
    reg.initialized = true;
}

void apply_env(LogConfig& config) {
    if (const char* level = std::getenv("PEERDROP_LOG_LEVEL")) {
        if (auto parsed = parse_level(level)) {
            config.level = *parsed;
        }
    }

    if (const char* file = std::getenv("PEERDROP_LOG_FILE")) {
        config.file_path = file;
    }
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);

    if (!reg.initialized) {
        build_sinks(reg);
        reg.initialized = true;
    }

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }
    return reg.loggers.emplace(name, make_logger(reg, name)).first->second;
}

void set_level(Level level) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);

    reg.config.level = level;
    g_level.store(level, std::memory_order_relaxed);
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(spdlog_level(level));
    }
}

bool is_level_enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

void shutdown() {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    reg.loggers.clear();
    reg.sinks.clear();
    reg.initialized = false;
    spdlog::shutdown();
}

} // namespace peerdrop::log
