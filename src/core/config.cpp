#include "lanshare/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace lanshare {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring setting '{}': {}", key, e.what());
    }
}

} // namespace

Settings default_settings() {
    return Settings{};
}

std::string settings_to_json(const Settings& settings) {
    json j;
    j["default_port"] = settings.default_port;
    j["bind_address"] = settings.bind_address;
    j["listing_timeout_seconds"] = settings.listing_timeout_seconds;
    j["download_timeout_seconds"] = settings.download_timeout_seconds;
    j["archive_timeout_seconds"] = settings.archive_timeout_seconds;
    j["worker_threads"] = settings.worker_threads;
    j["accept_queue_limit"] = settings.accept_queue_limit;
    j["index_cache_ttl_seconds"] = settings.index_cache_ttl_seconds;
    j["index_cache_capacity"] = settings.index_cache_capacity;
    j["use_compression"] = settings.use_compression;
    j["compression_level"] = settings.compression_level;
    j["mmap_threshold_bytes"] = settings.mmap_threshold_bytes;
    j["resume_downloads"] = settings.resume_downloads;
    j["verify_integrity"] = settings.verify_integrity;
    j["max_retries"] = settings.max_retries;
    j["max_parallel_downloads"] = settings.max_parallel_downloads;
    j["batch_size"] = settings.batch_size;
    j["log_level"] = settings.log_level;
    return j.dump(2);
}

Result<Settings> settings_from_json(const std::string& text) {
    auto object = json::parse(text, nullptr, false);
    if (object.is_discarded() || !object.is_object()) {
        return Err<Settings>(std::string("Settings must be a JSON object"));
    }

    Settings settings;
    read_key(object, "default_port", settings.default_port);
    read_key(object, "bind_address", settings.bind_address);
    read_key(object, "listing_timeout_seconds", settings.listing_timeout_seconds);
    read_key(object, "download_timeout_seconds", settings.download_timeout_seconds);
    read_key(object, "archive_timeout_seconds", settings.archive_timeout_seconds);
    read_key(object, "worker_threads", settings.worker_threads);
    read_key(object, "accept_queue_limit", settings.accept_queue_limit);
    read_key(object, "index_cache_ttl_seconds", settings.index_cache_ttl_seconds);
    read_key(object, "index_cache_capacity", settings.index_cache_capacity);
    read_key(object, "use_compression", settings.use_compression);
    read_key(object, "compression_level", settings.compression_level);
    read_key(object, "mmap_threshold_bytes", settings.mmap_threshold_bytes);
    read_key(object, "resume_downloads", settings.resume_downloads);
    read_key(object, "verify_integrity", settings.verify_integrity);
    read_key(object, "max_retries", settings.max_retries);
    read_key(object, "max_parallel_downloads", settings.max_parallel_downloads);
    read_key(object, "batch_size", settings.batch_size);
    read_key(object, "log_level", settings.log_level);

    if (settings.compression_level < 0 || settings.compression_level > 9) {
        spdlog::warn("compression_level {} out of range, using 6", settings.compression_level);
        settings.compression_level = 6;
    }
    if (settings.batch_size == 0) {
        settings.batch_size = 50;
    }
    if (settings.index_cache_capacity == 0) {
        settings.index_cache_capacity = 1;
    }
    return Ok(settings);
}

Result<Settings> load_settings(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Settings>(std::string("Failed to open settings file: ") + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return settings_from_json(buffer.str());
}

Result<void> save_settings(const Settings& settings, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(std::string("Failed to create settings directory: ") + ec.message());
        }
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(std::string("Failed to write settings file: ") + path.string());
    }
    output << settings_to_json(settings);
    if (!output) {
        return Err<void>(std::string("Failed to write settings file: ") + path.string());
    }
    return Ok();
}

void configure_logging(const Settings& settings) {
    spdlog::set_level(spdlog::level::from_str(settings.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace lanshare
