#include "vidup/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace vidup {

using json = nlohmann::json;

namespace {

Result<json> parse_object(const std::string& text) {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<json>(std::string("Invalid JSON in configuration"));
    }
    if (!parsed.is_object()) {
        return Err<json>(std::string("Configuration must be a JSON object"));
    }
    return Ok(std::move(parsed));
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>("Failed to open configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

Result<uint16_t> read_port(const json& j, uint16_t fallback) {
    if (!j.contains("port")) {
        return Ok(fallback);
    }
    const auto& value = j["port"];
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() > 65535) {
        return Err<uint16_t>(std::string("port must be an integer in [0, 65535]"));
    }
    return Ok(static_cast<uint16_t>(value.get<std::uint64_t>()));
}

} // namespace

Result<ClientConfig> parse_client_config(const std::string& text) {
    auto parsed = parse_object(text);
    if (parsed.is_error()) {
        return Err<ClientConfig>(parsed.error());
    }
    const json& j = parsed.value();

    ClientConfig config;
    auto port = read_port(j, config.port);
    if (port.is_error()) {
        return Err<ClientConfig>(port.error());
    }
    config.port = port.value();

    try {
        config.host = j.value("host", config.host);
        config.base_path = j.value("base_path", config.base_path);
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.resumable_threshold = j.value("resumable_threshold", config.resumable_threshold);
        config.request_timeout = std::chrono::seconds(
            j.value("request_timeout_seconds", static_cast<std::int64_t>(config.request_timeout.count())));
        config.journal_dir = j.value("journal_dir", config.journal_dir);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(std::string("Invalid client configuration: ") + e.what());
    }

    if (config.port == 0) {
        return Err<ClientConfig>(std::string("Client port must be non-zero"));
    }
    if (config.chunk_size == 0) {
        return Err<ClientConfig>(std::string("chunk_size must be positive"));
    }
    if (config.host.empty()) {
        return Err<ClientConfig>(std::string("host must not be empty"));
    }
    if (config.request_timeout.count() <= 0) {
        return Err<ClientConfig>(std::string("request_timeout_seconds must be positive"));
    }
    return Ok(std::move(config));
}

Result<ServerConfig> parse_server_config(const std::string& text) {
    auto parsed = parse_object(text);
    if (parsed.is_error()) {
        return Err<ServerConfig>(parsed.error());
    }
    const json& j = parsed.value();

    ServerConfig config;
    auto port = read_port(j, config.port);
    if (port.is_error()) {
        return Err<ServerConfig>(port.error());
    }
    config.port = port.value();

    try {
        config.data_root = j.value("data_root", config.data_root.string());
        config.max_upload_bytes = j.value("max_upload_bytes", config.max_upload_bytes);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ServerConfig>(std::string("Invalid server configuration: ") + e.what());
    }

    if (config.data_root.empty()) {
        return Err<ServerConfig>(std::string("data_root must not be empty"));
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_client_config(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (text.is_error()) {
        return Err<ClientConfig>(text.error());
    }
    return parse_client_config(text.value());
}

Result<ServerConfig> load_server_config(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (text.is_error()) {
        return Err<ServerConfig>(text.error());
    }
    return parse_server_config(text.value());
}

} // namespace vidup
