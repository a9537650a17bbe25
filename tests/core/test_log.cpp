// marshal_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <marshal/core/log.hpp>

using namespace marshal_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("critical") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("module loggers are distinct and reused") {
        auto core = core_logger();
        auto convert = convert_logger();
        REQUIRE(core != nullptr);
        REQUIRE(convert != nullptr);
        REQUIRE(core->name() == "marshal_core");
        REQUIRE(convert->name() == "marshal_convert");
        REQUIRE(model_logger()->name() == "marshal_model");
        REQUIRE(core_logger() == core);
    }

    SECTION("global level applies to every logger") {
        set_global_log_level(spdlog::level::err);
        REQUIRE(get_global_log_level() == spdlog::level::err);
        REQUIRE(convert_logger()->level() == spdlog::level::err);

        set_logger_level("marshal_convert", spdlog::level::debug);
        REQUIRE(convert_logger()->level() == spdlog::level::debug);

        set_global_log_level(spdlog::level::info);
    }
}

TEST_CASE("Log level names", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
}

TEST_CASE("LogScope and structured logging do not throw", "[core][log]") {
    REQUIRE_NOTHROW([] {
        MARSHAL_LOG_SCOPE("test_scope");
        log_structured(spdlog::level::info, "marshal_core", "converted",
            {{"type", "Vector3"}, {"path", "spawn.position"}});
    }());
    flush_all_loggers();
}
