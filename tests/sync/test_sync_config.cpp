#include <catch2/catch_test_macros.hpp>
#include "sync/sync_config.hpp"

#include <QSettings>

using namespace ladle::sync;
using namespace std::chrono_literals;

namespace {

void clear_sync_settings() {
    QSettings settings;
    settings.remove(QStringLiteral("sync"));
    settings.sync();
}

} // namespace

TEST_CASE("SyncConfig defaults", "[config]") {
    const SyncConfig config;
    REQUIRE(config.retry_base == 120s);
    REQUIRE(config.retry_max == 3600s);
    REQUIRE(config.max_attempts == 10);
    REQUIRE(config.tombstone_retention == std::chrono::days(30));
    REQUIRE(config.not_found_ttl == 300s);
    REQUIRE(config.normalized() == config);
}

TEST_CASE("SyncConfig load applies stored overrides", "[config][settings]") {
    clear_sync_settings();
    REQUIRE(SyncConfig::load() == SyncConfig{});

    SyncConfig custom;
    custom.retry_base = 30s;
    custom.max_attempts = 3;
    custom.tombstone_retention = std::chrono::days(7);
    custom.save();
    REQUIRE(SyncConfig::load() == custom);

    SECTION("Out-of-range values are clamped") {
        QSettings settings;
        settings.setValue(QStringLiteral("sync/retry_base_seconds"), 0);
        settings.setValue(QStringLiteral("sync/retry_max_seconds"), 10);
        settings.setValue(QStringLiteral("sync/max_attempts"), 1000);
        settings.setValue(QStringLiteral("sync/not_found_ttl_seconds"), -5);
        settings.sync();

        const auto loaded = SyncConfig::load();
        REQUIRE(loaded.retry_base == 1s);
        REQUIRE(loaded.retry_max == 10s);
        REQUIRE(loaded.max_attempts == 100);
        REQUIRE(loaded.not_found_ttl == 0s);
    }

    SECTION("Garbage falls back to defaults") {
        QSettings settings;
        settings.setValue(QStringLiteral("sync/max_attempts"), QStringLiteral("lots"));
        settings.sync();
        REQUIRE(SyncConfig::load().max_attempts == 10);
    }

    clear_sync_settings();
}

TEST_CASE("Image configs per entity kind", "[config][images]") {
    const auto recipe = ImageConfig::recipe();
    REQUIRE(recipe.directory == QStringLiteral("RecipeImages"));
    REQUIRE(recipe.max_dimension == 2000);
    REQUIRE(recipe.target_bytes == 5'000'000);
    REQUIRE(recipe.ceiling_bytes == 10'000'000);

    const auto collection = ImageConfig::collection();
    REQUIRE(collection.directory == QStringLiteral("CollectionImages"));
    REQUIRE(collection.max_dimension == 1200);
    REQUIRE(collection.target_bytes == 2'000'000);

    const auto profile = ImageConfig::profile();
    REQUIRE(profile.directory == QStringLiteral("ProfileImages"));
    REQUIRE(profile.max_dimension == 800);
    REQUIRE(profile.target_bytes == 1'000'000);
}

TEST_CASE("Data paths honour environment overrides", "[config][paths]") {
    qputenv("LADLE_DATA_DIR", "/tmp/ladle-data");
    qunsetenv("LADLE_DB_PATH");
    REQUIRE(data_directory() == QStringLiteral("/tmp/ladle-data"));
    REQUIRE(database_path() == QStringLiteral("/tmp/ladle-data/ladle.db"));

    qputenv("LADLE_DB_PATH", "/tmp/elsewhere.db");
    REQUIRE(database_path() == QStringLiteral("/tmp/elsewhere.db"));

    qunsetenv("LADLE_DB_PATH");
    qunsetenv("LADLE_DATA_DIR");
}
