// xref_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <xref_engine/core/log.hpp>
#include <atomic>
#include <string>
#include <thread>

using namespace xref_core;

// =============================================================================
// Log Level Tests
// =============================================================================

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names round-trip") {
        for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                           spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name yields same logger") {
        auto a = get_logger("xref_test");
        auto b = get_logger("xref_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "xref_test");
    }

    SECTION("subsystem loggers") {
        REQUIRE(index_logger()->name() == "xref_index");
        REQUIRE(resolve_logger()->name() == "xref_resolve");
        REQUIRE(cache_logger()->name() == "xref_cache");
    }

    SECTION("configure applies level") {
        LogConfig config;
        config.level = spdlog::level::warn;
        configure_logging(config);
        REQUIRE(get_logger("xref_test")->level() == spdlog::level::warn);
        REQUIRE(resolve_logger()->level() == spdlog::level::warn);
        configure_logging(LogConfig{});
        REQUIRE(resolve_logger()->level() == spdlog::level::info);
    }
}

TEST_CASE("Logging reconfiguration", "[core][log]") {
    auto held = get_logger("xref_test");
    auto held_sinks = held->sinks().size();
    auto held_level = held->level();

    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::err;
    configure_logging(config);

    SECTION("held loggers keep their sinks") {
        REQUIRE(held->sinks().size() == held_sinks);
        REQUIRE(held->level() == held_level);
    }

    SECTION("later lookups see the new configuration") {
        auto fresh = get_logger("xref_test");
        REQUIRE(fresh != held);
        REQUIRE(fresh->sinks().empty());
        REQUIRE(fresh->level() == spdlog::level::err);
        REQUIRE(spdlog::get("xref_test") == fresh);
    }

    SECTION("reconfiguring while another thread logs") {
        std::atomic<bool> done{false};
        std::thread writer([&done]() {
            while (!done.load()) {
                cache_logger()->error("writer tick");
            }
        });
        for (int i = 0; i < 20; ++i) {
            config.level = (i % 2 == 0) ? spdlog::level::err : spdlog::level::critical;
            configure_logging(config);
        }
        done = true;
        writer.join();
        REQUIRE(cache_logger()->sinks().empty());
    }

    configure_logging(LogConfig{});
}

TEST_CASE("LogScope timing", "[core][log]") {
    LogScope scope("timed", "xref_test");
    REQUIRE(scope.elapsed_us() >= 0);
}
