#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

uint64_t juint(const json::object& obj, std::string_view key, uint64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_uint64()) return it->value().as_uint64();
        if (it->value().is_int64() && it->value().as_int64() >= 0)
            return static_cast<uint64_t>(it->value().as_int64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

const json::array* jarray(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_array())
        return &it->value().as_array();
    return nullptr;
}

}  // anonymous namespace

namespace peerdrop {

namespace {
const log::Logger& logger() {
    static const log::Logger instance(log::CONFIG_LOGGER);
    return instance;
}
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        default: return "Unknown configuration error";
    }
}

std::expected<void, ConfigError> PeerDropConfig::validate() const {
    if (relay.url.rfind("ws://", 0) != 0 && relay.url.rfind("wss://", 0) != 0) {
        logger().error("relay.url must start with ws:// or wss://, got '{}'", relay.url);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (session.event_queue_capacity == 0 || session.outbound_queue_capacity == 0) {
        logger().error("session queue capacities must be positive");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (transfer.bind_address.empty()) {
        logger().error("transfer.bind_address must not be empty");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    // Tickets carry the address list with u16 counts and lengths
    if (transfer.advertise_addresses.size() > 0xFFFF) {
        logger().error("transfer.advertise lists {} addresses, at most 65535 allowed",
                       transfer.advertise_addresses.size());
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    for (const auto& addr : transfer.advertise_addresses) {
        if (addr.empty() || addr.size() > 0xFFFF) {
            logger().error("transfer.advertise entry must be 1..65535 bytes, got {}", addr.size());
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }
    if (!log::parse_level(log_level)) {
        logger().error("log.level '{}' is not a known level", log_level);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

std::expected<PeerDropConfig, ConfigError> PeerDropConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<PeerDropConfig, ConfigError> PeerDropConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            logger().error("Config root must be a JSON object");
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        PeerDropConfig config;

        // relay section
        if (auto* relay = jsection(root, "relay")) {
            config.relay.url = jstr(*relay, "url", config.relay.url);
            config.relay.ssl_verify = jbool(*relay, "ssl_verify", config.relay.ssl_verify);
            config.relay.ssl_ca_file = jstr(*relay, "ssl_ca_file", config.relay.ssl_ca_file);
        }

        // transfer section
        if (auto* transfer = jsection(root, "transfer")) {
            config.transfer.bind_address = jstr(*transfer, "bind", config.transfer.bind_address);
            auto port = juint(*transfer, "port", config.transfer.port);
            if (port > 0xFFFF) {
                logger().error("transfer.port out of range: {}", port);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.transfer.port = static_cast<uint16_t>(port);
            if (auto* addrs = jarray(*transfer, "advertise")) {
                for (const auto& item : *addrs) {
                    if (item.is_string())
                        config.transfer.advertise_addresses.emplace_back(item.as_string());
                }
            }
            config.transfer.download_dir = jstr(*transfer, "download_dir", config.transfer.download_dir);
            config.transfer.max_blob_size = juint(*transfer, "max_blob_size", config.transfer.max_blob_size);
        }

        // session section
        if (auto* session = jsection(root, "session")) {
            config.session.nickname = jstr(*session, "nickname", config.session.nickname);
            config.session.event_queue_capacity = static_cast<size_t>(
                juint(*session, "event_queue_capacity", config.session.event_queue_capacity));
            config.session.outbound_queue_capacity = static_cast<size_t>(
                juint(*session, "outbound_queue_capacity", config.session.outbound_queue_capacity));
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
        }

        if (auto valid = config.validate(); !valid) {
            return std::unexpected(valid.error());
        }
        return config;

    } catch (const boost::system::system_error& e) {
        logger().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        logger().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

} // namespace peerdrop
