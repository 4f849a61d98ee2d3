#include "sonogram-core/lib-sonogram.hpp"

#include "spdlog/sinks/ostream_sink.h"

#include <sstream>

using namespace sonogram;

#include "doctest.h"

TEST_CASE("visualizer_config defaults")
{
    const visualizer_config c;
    REQUIRE(c.window_size == 800);
    REQUIRE(c.analysis_sample_rate == 11025);
    REQUIRE(c.history_rows == 80);
    REQUIRE(c.channel_capacity == 128);
    REQUIRE(c.start_mode == visualization_mode::kaleidoscope);
    REQUIRE(c.fallback_source.empty());
    REQUIRE(c.window_width == 1240);
    REQUIRE(c.window_height == 1024);
    REQUIRE_NOTHROW(validate(c));

    REQUIRE(c.pipeline_elements == pipeline_description().elements);
}

TEST_CASE("visualizer_config json overrides keep missing keys at their defaults")
{
    const visualizer_config c = parse_visualizer_config(R"({
        "window_size": 1024,
        "history_rows": 120,
        "start_mode": "waterfall",
        "fallback_source": "resources/demo.mp3",
        "log_level": "debug"
    })");

    REQUIRE(c.window_size == 1024);
    REQUIRE(c.history_rows == 120);
    REQUIRE(c.start_mode == visualization_mode::waterfall);
    REQUIRE(c.fallback_source == "resources/demo.mp3");
    REQUIRE(c.log_level == "debug");

    REQUIRE(c.analysis_sample_rate == 11025);
    REQUIRE(c.channel_capacity == 128);
}

TEST_CASE("visualizer_config round trips through json")
{
    visualizer_config c;
    c.channel_capacity = 16;
    c.start_mode = visualization_mode::waterfall;
    c.pipeline_elements = { "filesrc", "appsink" };

    const json j = c;
    const visualizer_config r = parse_visualizer_config(j.dump());
    REQUIRE(r.channel_capacity == 16);
    REQUIRE(r.start_mode == visualization_mode::waterfall);
    REQUIRE(r.pipeline_elements.size() == 2);
}

TEST_CASE("visualizer_config rejects invalid values")
{
    REQUIRE_THROWS_AS(parse_visualizer_config("{ not json"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config("[1, 2]"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "window_size": 801 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "window_size": "big" })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "channel_capacity": 0 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "history_rows": 0 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "start_mode": "spiral" })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "log_level": "loud" })"), std::invalid_argument);
}

TEST_CASE("visualizer_config rejects negative and fractional integers")
{
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "history_rows": -1 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "window_size": -2 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "channel_capacity": 2.7 })"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_visualizer_config(R"({ "window_width": 640.5 })"), std::invalid_argument);

    // Whole numbers are still accepted for both signed and unsigned fields
    const visualizer_config c = parse_visualizer_config(R"({ "history_rows": 40, "window_width": 640 })");
    REQUIRE(c.history_rows == 40);
    REQUIRE(c.window_width == 640);
}

TEST_CASE("load_visualizer_config with no path yields defaults")
{
    const visualizer_config c = load_visualizer_config("");
    REQUIRE(c.window_size == 800);
    REQUIRE_THROWS(load_visualizer_config("does/not/exist.json"));
}

TEST_CASE("command line parsing")
{
    SUBCASE("short options")
    {
        const launch_options o = parse_command_line({ "-f", "song.mp3", "-m", "-c", "viewer.json" });
        REQUIRE(o.file == "song.mp3");
        REQUIRE(o.full_screen);
        REQUIRE(o.config_path == "viewer.json");
        REQUIRE_FALSE(o.help);
    }

    SUBCASE("long options")
    {
        const launch_options o = parse_command_line({ "--file", "a b.flac", "--full" });
        REQUIRE(o.file == "a b.flac");
        REQUIRE(o.full_screen);
        REQUIRE(o.config_path.empty());
    }

    SUBCASE("equals form")
    {
        const launch_options o = parse_command_line({ "--file=x.wav", "--config=c.json" });
        REQUIRE(o.file == "x.wav");
        REQUIRE(o.config_path == "c.json");
    }

    SUBCASE("no arguments leaves the file empty")
    {
        const launch_options o = parse_command_line(std::vector<std::string>{});
        REQUIRE(o.file.empty());
        REQUIRE_FALSE(o.full_screen);
    }

    SUBCASE("errors")
    {
        REQUIRE_THROWS_AS(parse_command_line({ "-f" }), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_command_line({ "--config" }), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_command_line({ "--volume", "11" }), std::invalid_argument);
    }

    REQUIRE(usage("sonogram-viewer").find("--file") != std::string::npos);
}

TEST_CASE("log levels parse by name")
{
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(parse_log_level("verbose"), std::invalid_argument);
}

TEST_CASE("log sinks can be replaced")
{
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sonogram::log::get()->replace_sink(sink);
    sonogram::log::get()->set_level(spdlog::level::info);

    sonogram::log::get()->app_log->info("hello from the app");
    sonogram::log::get()->app_log->flush();
    REQUIRE(captured.str().find("hello from the app") != std::string::npos);
    REQUIRE(captured.str().find("sonogram-app") != std::string::npos);

    sonogram::log::get()->replace_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}
