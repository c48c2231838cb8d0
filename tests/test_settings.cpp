#include <catch2/catch_test_macros.hpp>

#include "h2wire/http2/settings.hpp"

#include <array>

using namespace h2wire;
using namespace h2wire::http2;

TEST_CASE("Settings defaults", "[http2][settings]") {
    Settings settings;

    REQUIRE(settings.max_concurrent_streams == 100);
    REQUIRE(settings.initial_window_size == 65535);
    REQUIRE(settings.enable_push);
    REQUIRE(settings.header_table_size == 4096);
    REQUIRE(settings.max_frame_size == 16384);
}

TEST_CASE("Settings apply", "[http2][settings]") {
    Settings settings;

    SECTION("Recognized keys update their field") {
        REQUIRE(settings.apply(0x03, 250));
        REQUIRE(settings.max_concurrent_streams == 250);

        REQUIRE(settings.apply(0x04, 16384));
        REQUIRE(settings.initial_window_size == 16384);

        REQUIRE(settings.apply(0x02, 0));
        REQUIRE_FALSE(settings.enable_push);

        REQUIRE(settings.apply(0x01, 0));
        REQUIRE(settings.header_table_size == 0);

        REQUIRE(settings.apply(0x05, 32768));
        REQUIRE(settings.max_frame_size == 32768);
    }

    SECTION("Unknown keys are ignored") {
        REQUIRE_FALSE(settings.apply(0x06, 1000));
        REQUIRE_FALSE(settings.apply(0xBEEF, 1));

        Settings defaults;
        REQUIRE(settings.max_concurrent_streams == defaults.max_concurrent_streams);
        REQUIRE(settings.initial_window_size == defaults.initial_window_size);
        REQUIRE(settings.enable_push == defaults.enable_push);
        REQUIRE(settings.header_table_size == defaults.header_table_size);
        REQUIRE(settings.max_frame_size == defaults.max_frame_size);
    }

    SECTION("Values are not range checked") {
        REQUIRE(settings.apply(0x04, 0xFFFFFFFF));
        REQUIRE(settings.initial_window_size == 0xFFFFFFFF);
    }

    SECTION("Entries apply in order, later wins") {
        std::array<SettingsEntry, 3> entries = {{
            {0x03, 10},
            {0x99, 7},
            {0x03, 20},
        }};
        settings.apply_all(entries);

        REQUIRE(settings.max_concurrent_streams == 20);
        REQUIRE(settings.initial_window_size == 65535);
    }
}

TEST_CASE("Settings validation", "[http2][settings]") {
    SECTION("ENABLE_PUSH accepts only 0 and 1") {
        REQUIRE(Settings::validate(0x02, 0).has_value());
        REQUIRE(Settings::validate(0x02, 1).has_value());

        auto r = Settings::validate(0x02, 2);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().protocol_error() == ProtocolError::InvalidSettingValue);
    }

    SECTION("INITIAL_WINDOW_SIZE capped at 2^31-1") {
        REQUIRE(Settings::validate(0x04, 0x7FFFFFFF).has_value());
        REQUIRE_FALSE(Settings::validate(0x04, 0x80000000).has_value());
    }

    SECTION("MAX_FRAME_SIZE range") {
        REQUIRE_FALSE(Settings::validate(0x05, 16383).has_value());
        REQUIRE(Settings::validate(0x05, 16384).has_value());
        REQUIRE(Settings::validate(0x05, 16777215).has_value());
        REQUIRE_FALSE(Settings::validate(0x05, 16777216).has_value());
    }

    SECTION("Unknown keys always pass") {
        REQUIRE(Settings::validate(0x1234, 0xFFFFFFFF).has_value());
        REQUIRE(Settings::validate(0x03, 0xFFFFFFFF).has_value());
    }
}
