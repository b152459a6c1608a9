#include "config/server_config.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

#include <json/json.h>

#include "core/version.hpp"
#include "util/common_init.hpp"

namespace parley {

bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    host = addr.substr(0, colon);
    std::string port_str = addr.substr(colon + 1);
    if (host.empty() || port_str.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;
    port = static_cast<uint16_t>(val);
    return true;
}

static bool read_int(const Json::Value& root, const char* key, int& out,
                     std::string& error_msg) {
    if (!root.isMember(key)) return true;
    const Json::Value& v = root[key];
    if (!v.isInt()) {
        error_msg = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = v.asInt();
    return true;
}

static bool read_string(const Json::Value& root, const char* key,
                        std::string& out, std::string& error_msg) {
    if (!root.isMember(key)) return true;
    const Json::Value& v = root[key];
    if (!v.isString()) {
        error_msg = std::string("'") + key + "' must be a string";
        return false;
    }
    out = v.asString();
    return true;
}

static bool read_conversations(const Json::Value& arr, ServerConfig& config,
                               std::string& error_msg) {
    if (!arr.isArray()) {
        error_msg = "'conversations' must be an array";
        return false;
    }

    std::vector<ConversationConfig> result;
    for (Json::ArrayIndex i = 0; i < arr.size(); i++) {
        const Json::Value& c = arr[i];
        std::string where = "conversations[" + std::to_string(i) + "]";
        if (!c.isObject() || !c.isMember("id") || !c["id"].isUInt64()) {
            error_msg = where + ": 'id' must be an unsigned integer";
            return false;
        }

        ConversationConfig conv;
        conv.id = c["id"].asUInt64();

        const Json::Value& members = c["members"];
        if (!members.isNull()) {
            if (!members.isArray()) {
                error_msg = where + ": 'members' must be an array";
                return false;
            }
            for (const auto& m : members) {
                if (!m.isUInt64()) {
                    error_msg = where + ": member ids must be unsigned integers";
                    return false;
                }
                conv.members.push_back(m.asUInt64());
            }
        }
        result.push_back(std::move(conv));
    }

    config.conversations = std::move(result);
    return true;
}

bool parse_server_config(const std::string& json_text, ServerConfig& config,
                         std::string& error_msg) {
    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());

    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(json_text.c_str(), json_text.c_str() + json_text.size(),
                       &root, &parse_errors)) {
        error_msg = "Failed to parse configuration: " + parse_errors;
        return false;
    }
    if (!root.isObject()) {
        error_msg = "Configuration must be a JSON object";
        return false;
    }

    if (!read_string(root, "listen", config.listen, error_msg)) return false;
    if (!read_int(root, "threads", config.threads, error_msg)) return false;
    if (!read_int(root, "workers", config.workers, error_msg)) return false;
    if (!read_int(root, "ping_interval", config.ping_interval, error_msg)) return false;
    if (!read_string(root, "pid", config.pid_file, error_msg)) return false;

    if (root.isMember("mailbox_capacity")) {
        const Json::Value& v = root["mailbox_capacity"];
        if (!v.isUInt64()) {
            error_msg = "'mailbox_capacity' must be an unsigned integer";
            return false;
        }
        config.mailbox_capacity = static_cast<size_t>(v.asUInt64());
    }

    if (root.isMember("require_membership")) {
        const Json::Value& v = root["require_membership"];
        if (!v.isBool()) {
            error_msg = "'require_membership' must be true or false";
            return false;
        }
        config.require_membership = v.asBool();
    }

    std::string level;
    if (!read_string(root, "log_level", level, error_msg)) return false;
    if (!level.empty() && !Logger::parse_level(level, config.log_level)) {
        error_msg = "unknown log_level '" + level + "'";
        return false;
    }

    if (root.isMember("conversations")) {
        if (!read_conversations(root["conversations"], config, error_msg)) return false;
    }
    return true;
}

bool load_server_config(const std::string& path, ServerConfig& config,
                        std::string& error_msg) {
    std::ifstream in(path);
    if (!in) {
        error_msg = "Cannot open configuration file " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!parse_server_config(ss.str(), config, error_msg)) {
        error_msg = path + ": " + error_msg;
        return false;
    }
    return true;
}

bool apply_cli_overrides(const CliParser& cli, ServerConfig& config,
                         std::string& error_msg) {
    if (cli.has("-listen")) config.listen = cli.get_string("-listen");
    if (cli.has("-pid")) config.pid_file = cli.get_string("-pid");

    struct IntOption {
        const char* key;
        int* target;
    };
    const IntOption int_options[] = {
        {"-threads", &config.threads},
        {"-workers", &config.workers},
        {"-ping_interval", &config.ping_interval},
    };
    for (const auto& opt : int_options) {
        if (!cli.parse_int(opt.key, *opt.target)) {
            error_msg = std::string(opt.key) + " must be an integer";
            return false;
        }
    }

    if (cli.has("-mailbox_capacity")) {
        int capacity = 0;
        if (!cli.parse_int("-mailbox_capacity", capacity) || capacity <= 0) {
            error_msg = "-mailbox_capacity must be a positive integer";
            return false;
        }
        config.mailbox_capacity = static_cast<size_t>(capacity);
    }

    if (verbose_requested(cli)) config.log_level = Logger::kDebug;
    return true;
}

bool validate_server_config(ServerConfig& config, std::string& error_msg) {
    if (!parse_host_port(config.listen, config.host, config.port)) {
        error_msg = "invalid listen address '" + config.listen +
                    "' (expected host:port)";
        return false;
    }
    if (config.threads < 0) {
        error_msg = "threads must be >= 0";
        return false;
    }
    if (config.workers < 0) {
        error_msg = "workers must be >= 0";
        return false;
    }
    if (config.ping_interval < 0) {
        error_msg = "ping_interval must be >= 0";
        return false;
    }
    if (config.mailbox_capacity == 0) {
        error_msg = "mailbox_capacity must be > 0";
        return false;
    }
    return true;
}

} // namespace parley
