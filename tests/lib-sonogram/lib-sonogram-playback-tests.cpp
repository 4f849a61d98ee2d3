#include "sonogram-core/lib-sonogram.hpp"

#include <memory>

using namespace sonogram;

#include "doctest.h"

// Scripted stand-in for the decode engine. Shared state outlives each pipeline so
// tests can inspect what the controller did after it released the instance.
struct fake_pipeline_log
{
    int created{ 0 };
    int destroyed{ 0 };
    int plays{ 0 };
    int pauses{ 0 };
    int stops{ 0 };
    std::string last_source;

    bool fail_create{ false };
    bool fail_play{ false };
    bool fail_pause{ false };
    bool fail_stop{ false };
    bool finished{ false };
};

struct fake_pipeline final : public audio_pipeline
{
    std::shared_ptr<fake_pipeline_log> script;
    std::string path;

    fake_pipeline(std::shared_ptr<fake_pipeline_log> script, const std::string & path) : script(script), path(path) { script->created++; }
    ~fake_pipeline() { script->destroyed++; }

    void play() override { script->plays++; if (script->fail_play) throw pipeline_state_error("play refused"); }
    void pause() override { script->pauses++; if (script->fail_pause) throw pipeline_state_error("pause refused"); }
    void stop() override { script->stops++; if (script->fail_stop) throw pipeline_state_error("stop refused"); }
    bool is_finished() const override { return script->finished; }
    const std::string & source() const override { return path; }
};

static pipeline_factory make_fake_factory(std::shared_ptr<fake_pipeline_log> script)
{
    return [script](const std::string & source) -> std::unique_ptr<audio_pipeline>
    {
        script->last_source = source;
        if (script->fail_create) throw missing_decoder_element("mp3dec");
        return std::unique_ptr<audio_pipeline>(new fake_pipeline(script, source));
    };
}

static void require_consistent(const playback_controller & c)
{
    REQUIRE((c.state() == playback_state::stopped) == !c.has_pipeline());
}

TEST_CASE("playback_controller happy path")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");

    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(c.mode() == visualization_mode::kaleidoscope);
    require_consistent(c);

    c.play();
    REQUIRE(c.state() == playback_state::playing);
    REQUIRE(script->created == 1);
    REQUIRE(script->last_source == "song.mp3");
    require_consistent(c);

    // Play while playing is a no-op
    c.play();
    REQUIRE(script->created == 1);
    REQUIRE(script->plays == 1);

    c.pause();
    REQUIRE(c.state() == playback_state::paused);
    require_consistent(c);

    // Pause while paused is a no-op
    c.pause();
    REQUIRE(script->pauses == 1);

    // Resume uses the same instance
    c.play();
    REQUIRE(c.state() == playback_state::playing);
    REQUIRE(script->created == 1);
    REQUIRE(script->plays == 2);

    c.stop();
    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->stops == 1);
    REQUIRE(script->destroyed == 1);
    require_consistent(c);

    // Stop while stopped is a no-op
    c.stop();
    REQUIRE(script->stops == 1);

    // Play from stopped builds a fresh pipeline
    c.play();
    REQUIRE(script->created == 2);
    REQUIRE(c.last_error().empty());
}

TEST_CASE("playback_controller pause and stop from stopped do nothing")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.pause();
    c.stop();
    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->created == 0);
}

TEST_CASE("playback_controller construction failure leaves it stopped")
{
    auto script = std::make_shared<fake_pipeline_log>();
    script->fail_create = true;
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE_FALSE(c.has_pipeline());
    REQUIRE(c.last_error().find("missing element mp3dec") != std::string::npos);
}

TEST_CASE("playback_controller play failure drops the pipeline")
{
    auto script = std::make_shared<fake_pipeline_log>();
    script->fail_play = true;
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->created == 1);
    REQUIRE(script->destroyed == 1);
    REQUIRE_FALSE(c.last_error().empty());
    require_consistent(c);
}

TEST_CASE("playback_controller resume failure drops the pipeline")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    c.pause();
    script->fail_play = true;
    c.play();

    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->destroyed == 1);
    require_consistent(c);
}

TEST_CASE("playback_controller pause failure drops the pipeline")
{
    auto script = std::make_shared<fake_pipeline_log>();
    script->fail_pause = true;
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    c.pause();

    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->destroyed == 1);
    REQUIRE_FALSE(c.last_error().empty());
}

TEST_CASE("playback_controller stop failure still ends stopped")
{
    auto script = std::make_shared<fake_pipeline_log>();
    script->fail_stop = true;
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    c.stop();

    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->destroyed == 1);
    REQUIRE(c.last_error().find("stop refused") != std::string::npos);
}

TEST_CASE("playback_controller releases the pipeline at end of stream")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.play();
    c.poll();
    REQUIRE(c.state() == playback_state::playing);

    script->finished = true;
    c.poll();
    REQUIRE(c.state() == playback_state::stopped);
    REQUIRE(script->stops == 1);
    REQUIRE(script->destroyed == 1);
}

TEST_CASE("playback_controller falls back when no source is set")
{
    auto script = std::make_shared<fake_pipeline_log>();

    SUBCASE("fallback source")
    {
        playback_controller c(make_fake_factory(script), "", "resources/default.mp3");
        c.play();
        REQUIRE(c.state() == playback_state::playing);
        REQUIRE(script->last_source == "resources/default.mp3");
    }

    SUBCASE("nothing to play")
    {
        playback_controller c(make_fake_factory(script), "");
        c.play();
        REQUIRE(c.state() == playback_state::stopped);
        REQUIRE(script->created == 0);
        REQUIRE_FALSE(c.last_error().empty());
    }

    SUBCASE("set_source applies on the next play from stopped")
    {
        playback_controller c(make_fake_factory(script), "a.mp3");
        c.play();
        c.set_source("b.flac");
        c.stop();
        c.play();
        REQUIRE(script->last_source == "b.flac");
    }
}

TEST_CASE("playback_controller mode and quit are independent of playback")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");

    c.set_mode(visualization_mode::waterfall);
    REQUIRE(c.mode() == visualization_mode::waterfall);
    REQUIRE(c.state() == playback_state::stopped);

    c.play();
    c.set_mode(visualization_mode::kaleidoscope);
    REQUIRE(c.state() == playback_state::playing);

    REQUIRE_FALSE(c.quit_requested());
    c.request_quit();
    REQUIRE(c.quit_requested());
    REQUIRE(c.state() == playback_state::playing);
}

TEST_CASE("playback_controller destructor stops a live pipeline")
{
    auto script = std::make_shared<fake_pipeline_log>();
    {
        playback_controller c(make_fake_factory(script), "song.mp3");
        c.play();
    }
    REQUIRE(script->stops == 1);
    REQUIRE(script->destroyed == 1);
}

TEST_CASE("input_dispatcher key table")
{
    input_dispatcher d;

    REQUIRE(d.translate('Q') == input_command::quit);
    REQUIRE(d.translate('A') == input_command::stop);
    REQUIRE(d.translate('S') == input_command::play);
    REQUIRE(d.translate('D') == input_command::pause);
    REQUIRE(d.translate('K') == input_command::show_kaleidoscope);
    REQUIRE(d.translate('W') == input_command::show_waterfall);
    REQUIRE(d.translate('0') == input_command::bin_selection_mirrored);
    REQUIRE(d.translate('1') == input_command::scroll_newest_at_bottom);
    REQUIRE(d.translate('Z') == input_command::none);
    REQUIRE(d.translate(' ') == input_command::none);

    d.set_shift(true);
    REQUIRE(d.translate('0') == input_command::bin_selection_as_emitted);
    REQUIRE(d.translate('1') == input_command::scroll_newest_at_top);
    REQUIRE(d.translate('Q') == input_command::quit);
    REQUIRE(d.translate('S') == input_command::play);

    d.set_shift(false);
    REQUIRE(d.translate('0') == input_command::bin_selection_mirrored);
}

TEST_CASE("input_dispatcher apply drives the controller and render options")
{
    auto script = std::make_shared<fake_pipeline_log>();
    playback_controller c(make_fake_factory(script), "song.mp3");
    render_options options;
    input_dispatcher d;

    REQUIRE(input_dispatcher::apply(d.translate('S'), c, options));
    REQUIRE(c.state() == playback_state::playing);

    REQUIRE(input_dispatcher::apply(d.translate('D'), c, options));
    REQUIRE(c.state() == playback_state::paused);

    REQUIRE(input_dispatcher::apply(d.translate('A'), c, options));
    REQUIRE(c.state() == playback_state::stopped);

    REQUIRE(input_dispatcher::apply(d.translate('W'), c, options));
    REQUIRE(c.mode() == visualization_mode::waterfall);

    REQUIRE(input_dispatcher::apply(d.translate('0'), c, options));
    REQUIRE(options.bins == bin_selection::mirrored);
    REQUIRE(input_dispatcher::apply(d.translate('1'), c, options));
    REQUIRE(options.scroll == scroll_direction::newest_at_bottom);

    d.set_shift(true);
    REQUIRE(input_dispatcher::apply(d.translate('0'), c, options));
    REQUIRE(options.bins == bin_selection::as_emitted);
    REQUIRE(input_dispatcher::apply(d.translate('1'), c, options));
    REQUIRE(options.scroll == scroll_direction::newest_at_top);

    REQUIRE_FALSE(input_dispatcher::apply(d.translate('X'), c, options));

    REQUIRE(input_dispatcher::apply(d.translate('Q'), c, options));
    REQUIRE(c.quit_requested());
}

TEST_CASE("decoder_for_source picks a decoder from the extension")
{
    REQUIRE(decoder_for_source("music/track.mp3") == "mp3dec");
    REQUIRE(decoder_for_source("TRACK.MP3") == "mp3dec");
    REQUIRE(decoder_for_source("a.flac") == "flacdec");
    REQUIRE(decoder_for_source("a.wav") == "wavdec");
    REQUIRE(decoder_for_source("a.ogg") == "decodebin");
    REQUIRE(decoder_for_source("no_extension") == "decodebin");
}

TEST_CASE("resolve_pipeline_elements orders the graph and reports missing elements")
{
    const pipeline_description desc{};
    const decode_element_registry full = { "filesrc", "mp3dec", "tee", "queue", "audioconvert", "audioresample", "autoaudiosink", "appsink" };

    const std::vector<std::string> graph = resolve_pipeline_elements(desc, "song.mp3", full);
    REQUIRE(graph.size() == desc.elements.size() + 1);
    REQUIRE(graph[0] == "filesrc");
    REQUIRE(graph[1] == "mp3dec");
    REQUIRE(graph.back() == "appsink");

    SUBCASE("missing decoder")
    {
        try
        {
            resolve_pipeline_elements(desc, "song.flac", full);
            FAIL("expected missing_decoder_element");
        }
        catch (const missing_decoder_element & e)
        {
            REQUIRE(e.element() == "flacdec");
        }
    }

    SUBCASE("missing sink")
    {
        decode_element_registry partial = full;
        partial.remove("autoaudiosink");
        REQUIRE_THROWS_AS(resolve_pipeline_elements(desc, "song.mp3", partial), missing_decoder_element);
    }
}

TEST_CASE("decode_pipeline reports a missing element before touching the device")
{
    spectral_frame_channel channel(4);
    decode_element_registry registry = decode_element_registry::host();
    registry.remove("audioresample");

    std::unique_ptr<sample_sink> analyzer(new spectral_analyzer(channel, analysis_params()));
    REQUIRE_THROWS_AS(decode_pipeline("song.mp3", std::move(analyzer), pipeline_description(), registry), missing_decoder_element);
}

TEST_CASE("decode_pipeline reports a source that cannot be opened")
{
    spectral_frame_channel channel(4);
    std::unique_ptr<sample_sink> analyzer(new spectral_analyzer(channel, analysis_params()));
    REQUIRE_THROWS_AS(decode_pipeline("does/not/exist.wav", std::move(analyzer)), source_open_error);
}

TEST_CASE("host registry lists the graph elements")
{
    const decode_element_registry host = decode_element_registry::host();
    for (const std::string & name : pipeline_description().elements) REQUIRE(host.contains(name));
    REQUIRE(host.contains("decodebin"));
    REQUIRE_FALSE(host.contains("vorbisdec"));
}
