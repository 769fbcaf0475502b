#include <jsondelta/utilities/logging.h>

#include <spdlog/sinks/ostream_sink.h>

#include <jsondelta/delta/diff.hpp>
#include <jsondelta/utilities/testing.h>

using namespace jsondelta;

TEST_CASE("logger registration", "[utilities][logging]")
{
    auto logger = get_logger();
    REQUIRE(logger);
    REQUIRE(logger->name() == "jsondelta");
    REQUIRE(spdlog::get("jsondelta") == logger);
    REQUIRE(get_logger() == logger);
}

TEST_CASE("logging config", "[utilities][logging]")
{
    auto logger = get_logger();
    auto original_level = logger->level();

    delta_config config;
    config.log_level = "debug";
    initialize_logging(config);
    REQUIRE(logger->level() == spdlog::level::debug);

    // Leaving the level out leaves the logger alone.
    initialize_logging(delta_config());
    REQUIRE(logger->level() == spdlog::level::debug);

    // The delta operations themselves don't touch the logger's level.
    delta_config trace_config;
    trace_config.log_level = "trace";
    auto document = value{{"a", 1}};
    auto delta = compute_value_delta(document, value{{"a", 2}}, trace_config);
    apply_value_delta(document, delta, trace_config);
    REQUIRE(logger->level() == spdlog::level::debug);

    logger->set_level(original_level);
}

TEST_CASE("tolerated changes are logged", "[utilities][logging]")
{
    auto logger = get_logger();
    auto original_level = logger->level();
    std::ostringstream output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    logger->sinks().push_back(sink);
    logger->set_level(spdlog::level::warn);

    delta_config config;
    config.mode = application_mode::PERMISSIVE;
    apply_value_delta(
        value{{"a", 1}}, {{"z", make_remove_change(2)}}, config);

    logger->sinks().pop_back();
    logger->set_level(original_level);

    REQUIRE(output.str().find("tolerating remove at 'z'") != string::npos);
}
