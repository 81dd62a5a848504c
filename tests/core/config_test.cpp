#include "lanshare/client/share_client.hpp"
#include "lanshare/core/config.hpp"
#include "lanshare/server/share_server.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using lanshare::Settings;
using lanshare::testing::TempDir;

TEST(SettingsTest, DefaultsMatchDocumentedValues) {
    const Settings settings = lanshare::default_settings();
    EXPECT_EQ(settings.default_port, 8000);
    EXPECT_EQ(settings.listing_timeout_seconds, 15u);
    EXPECT_EQ(settings.download_timeout_seconds, 60u);
    EXPECT_EQ(settings.archive_timeout_seconds, 180u);
    EXPECT_EQ(settings.max_retries, 3u);
    EXPECT_EQ(settings.batch_size, 50u);
    EXPECT_EQ(settings.index_cache_capacity, 5u);
    EXPECT_TRUE(settings.resume_downloads);
}

TEST(SettingsTest, MissingKeysKeepDefaults) {
    auto parsed = lanshare::settings_from_json(R"({"default_port": 9100, "use_compression": false})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().default_port, 9100);
    EXPECT_FALSE(parsed.value().use_compression);
    EXPECT_EQ(parsed.value().max_retries, 3u);
}

TEST(SettingsTest, WrongTypesAreIgnored) {
    auto parsed = lanshare::settings_from_json(R"({"default_port": "eighty", "compression_level": 42})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().default_port, 8000);
    EXPECT_EQ(parsed.value().compression_level, 6);
}

TEST(SettingsTest, RejectsNonObjects) {
    EXPECT_TRUE(lanshare::settings_from_json("[1, 2, 3]").is_error());
    EXPECT_TRUE(lanshare::settings_from_json("{ not json").is_error());
}

TEST(SettingsTest, SaveThenLoad) {
    TempDir dir("lanshare_config");
    Settings settings;
    settings.default_port = 8123;
    settings.log_level = "debug";
    settings.max_parallel_downloads = 3;

    const auto path = dir / "nested/settings.json";
    ASSERT_TRUE(lanshare::save_settings(settings, path).is_ok());

    auto loaded = lanshare::load_settings(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().default_port, 8123);
    EXPECT_EQ(loaded.value().log_level, "debug");
    EXPECT_EQ(loaded.value().max_parallel_downloads, 3u);
}

TEST(SettingsTest, LoadMissingFileFails) {
    TempDir dir("lanshare_config");
    EXPECT_TRUE(lanshare::load_settings(dir / "absent.json").is_error());
}

TEST(SettingsTest, ConvertsToServerAndClientOptions) {
    Settings settings;
    settings.default_port = 9000;
    settings.index_cache_ttl_seconds = 30;
    settings.max_retries = 5;
    settings.max_parallel_downloads = 2;
    settings.resume_downloads = false;

    const auto server = lanshare::server::make_server_options(settings, "/srv/share");
    EXPECT_EQ(server.port, 9000);
    EXPECT_EQ(server.root, std::filesystem::path("/srv/share"));
    EXPECT_EQ(server.service.indexer.ttl, std::chrono::seconds(30));
    EXPECT_EQ(server.http.queue_limit, 100u);

    const auto client = lanshare::client::make_client_options(settings);
    EXPECT_EQ(client.listing.timeout, std::chrono::seconds(15));
    EXPECT_EQ(client.download.max_retries, 5u);
    EXPECT_FALSE(client.download.resume);
    EXPECT_EQ(client.batch.max_workers, 2u);
    EXPECT_TRUE(client.batch.file_options.resume);
    EXPECT_EQ(client.batch.file_options.max_retries, 2u);
}
