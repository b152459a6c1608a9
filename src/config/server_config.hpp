#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

namespace parley {

struct ConversationConfig {
    ConversationId id = 0;
    std::vector<UserId> members;
};

struct ServerConfig {
    std::string listen = "0.0.0.0:8080";
    int threads = 0;           // drogon I/O threads (0 = all cores)
    int workers = 0;           // TBB arena concurrency (0 = all cores)
    int ping_interval = DEFAULT_PING_INTERVAL;   // seconds, 0 = off
    size_t mailbox_capacity = DEFAULT_MAILBOX_CAPACITY;
    bool require_membership = true;
    Logger::Level log_level = Logger::kInfo;
    std::string pid_file;
    std::vector<ConversationConfig> conversations;

    // Resolved from listen by validate_server_config()
    std::string host;
    uint16_t port = 0;
};

// Parse "host:port". Returns false if malformed or port out of range.
bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port);

// Merge a JSON document into config. Keys that are absent keep their value.
bool parse_server_config(const std::string& json_text, ServerConfig& config,
                         std::string& error_msg);

// Read and parse a JSON configuration file.
bool load_server_config(const std::string& path, ServerConfig& config,
                        std::string& error_msg);

// Apply -listen, -threads, -workers, -ping_interval, -mailbox_capacity,
// -pid and -v on top of config.
bool apply_cli_overrides(const CliParser& cli, ServerConfig& config,
                         std::string& error_msg);

// Range checks; resolves host and port.
bool validate_server_config(ServerConfig& config, std::string& error_msg);

} // namespace parley
