#pragma once

/**
 * @file config.hpp
 * @brief Application settings shared by the share server and download client
 *
 * Settings are stored as a flat JSON object. Missing keys keep their defaults,
 * so an old config file keeps working after new options are added.
 *
 * EXAMPLE:
 * auto settings = lanshare::load_settings("lanshare.json").value_or(lanshare::default_settings());
 * auto server_options = lanshare::server::make_server_options(settings, "/srv/share");
 */

#include "lanshare/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lanshare {

struct Settings {
    // Network
    std::uint16_t default_port = 8000;
    std::string bind_address = "0.0.0.0";
    std::uint32_t listing_timeout_seconds = 15;
    std::uint32_t download_timeout_seconds = 60;
    std::uint32_t archive_timeout_seconds = 180;

    // Server
    std::uint32_t worker_threads = 0;          // 0 = min(32, cpu + 4)
    std::uint32_t accept_queue_limit = 100;
    std::uint32_t index_cache_ttl_seconds = 120;
    std::uint32_t index_cache_capacity = 5;
    bool use_compression = true;
    int compression_level = 6;
    std::uint64_t mmap_threshold_bytes = 50ull * 1024 * 1024;

    // Client
    bool resume_downloads = true;
    bool verify_integrity = true;
    std::uint32_t max_retries = 3;
    std::uint32_t max_parallel_downloads = 8;
    std::uint32_t batch_size = 50;

    std::string log_level = "info";
};

Settings default_settings();

/**
 * @brief Load settings from a JSON file
 *
 * Unknown keys are ignored and missing keys keep their defaults.
 * Returns an error when the file cannot be read or is not a JSON object.
 */
Result<Settings> load_settings(const std::filesystem::path& path);

Result<void> save_settings(const Settings& settings, const std::filesystem::path& path);

std::string settings_to_json(const Settings& settings);
Result<Settings> settings_from_json(const std::string& text);

/**
 * @brief Apply Settings::log_level and the project log pattern to spdlog
 */
void configure_logging(const Settings& settings);

} // namespace lanshare
