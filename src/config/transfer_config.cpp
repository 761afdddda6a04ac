#include "rft/config/transfer_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace rft::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
Result<void> read_field(const json& document, const char* key, T& out) {
    const auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        return Err<void>(ErrorKind::InvalidConfig,
                         std::string("Invalid value for '") + key + "': " + e.what());
    }
    return Ok();
}

Result<void> read_path(const json& document, const char* key, fs::path& out) {
    std::string value = out.string();
    auto result = read_field(document, key, value);
    if (result.is_error()) {
        return result;
    }
    out = fs::path(value);
    return Ok();
}

} // namespace

fs::path TransferConfig::effective_local_temp_dir() const {
    if (!local_temp_dir.empty()) {
        return local_temp_dir;
    }
    return fs::temp_directory_path();
}

std::string TransferConfig::remote_upload_dir() const {
    return remote_join(remote_temp_dir, upload_dir_name);
}

std::string TransferConfig::remote_join(const std::string& root, const std::string& name) const {
    std::string base = root;
    while (!base.empty() && (base.back() == '\\' || base.back() == '/')) {
        base.pop_back();
    }
    if (base.empty()) {
        return name;
    }
    return base + remote_path_separator + name;
}

Result<TransferConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<TransferConfig>(ErrorKind::InvalidConfig, "Configuration must be a JSON object");
    }

    TransferConfig config;
    for (auto result : {read_field(document, "max_command_length", config.max_command_length),
                        read_field(document, "remote_temp_dir", config.remote_temp_dir),
                        read_field(document, "remote_cmd_temp_dir", config.remote_cmd_temp_dir),
                        read_field(document, "upload_dir_name", config.upload_dir_name),
                        read_field(document, "remote_path_separator", config.remote_path_separator),
                        read_path(document, "local_temp_dir", config.local_temp_dir),
                        read_path(document, "script_prelude_dir", config.script_prelude_dir),
                        read_field(document, "log_level", config.log_level)}) {
        if (result.is_error()) {
            return Err<TransferConfig>(result.error());
        }
    }

    if (config.max_command_length == 0) {
        return Err<TransferConfig>(ErrorKind::InvalidConfig, "max_command_length must be > 0");
    }
    if (config.remote_path_separator.empty()) {
        return Err<TransferConfig>(ErrorKind::InvalidConfig, "remote_path_separator must not be empty");
    }
    return Ok(config);
}

Result<TransferConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(ErrorKind::InvalidConfig,
                                   std::string("Failed to open config file: ") + path.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<TransferConfig>(ErrorKind::InvalidConfig,
                                   std::string("Failed to parse config file ") + path.string() + ": " + e.what());
    }

    auto result = config_from_json(document);
    if (result.is_ok()) {
        spdlog::debug("Loaded transfer config from {}", path.string());
    }
    return result;
}

json config_to_json(const TransferConfig& config) {
    json j;
    j["max_command_length"] = config.max_command_length;
    j["remote_temp_dir"] = config.remote_temp_dir;
    j["remote_cmd_temp_dir"] = config.remote_cmd_temp_dir;
    j["upload_dir_name"] = config.upload_dir_name;
    j["remote_path_separator"] = config.remote_path_separator;
    j["local_temp_dir"] = config.local_temp_dir.string();
    j["script_prelude_dir"] = config.script_prelude_dir.string();
    j["log_level"] = config.log_level;
    return j;
}

Result<void> configure_logging(const TransferConfig& config) {
    const auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off; only accept that for an explicit "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        return Err<void>(ErrorKind::InvalidConfig, "Unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);
    return Ok();
}

} // namespace rft::config
