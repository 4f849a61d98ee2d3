#include "sonogram-core/playback/playback-controller.hpp"
#include "sonogram-core/util/logging.hpp"

#include <stdexcept>

using namespace sonogram;

const char * sonogram::to_string(playback_state s)
{
    switch (s)
    {
        case playback_state::stopped: return "stopped";
        case playback_state::playing: return "playing";
        case playback_state::paused:  return "paused";
    }
    return "unknown";
}

const char * sonogram::to_string(visualization_mode m)
{
    switch (m)
    {
        case visualization_mode::waterfall:    return "waterfall";
        case visualization_mode::kaleidoscope: return "kaleidoscope";
    }
    return "unknown";
}

playback_controller::playback_controller(pipeline_factory factory, const std::string & source, const std::string & fallback_source)
    : factory(std::move(factory)), source(source), fallback_source(fallback_source)
{
    if (!this->factory) throw std::invalid_argument("playback_controller requires a pipeline factory");
}

playback_controller::~playback_controller()
{
    stop();
}

void playback_controller::fail(const std::string & what, const std::exception & e)
{
    error = what + ": " + e.what();
    sonogram::log::get()->app_log->error("{}", error);
}

void playback_controller::release_pipeline()
{
    pipeline.reset();
    current_state = playback_state::stopped;
}

void playback_controller::play()
{
    if (current_state == playback_state::playing) return;

    if (current_state == playback_state::paused)
    {
        try
        {
            pipeline->play();
            current_state = playback_state::playing;
            sonogram::log::get()->app_log->info("resumed {}", pipeline->source());
        }
        catch (const std::exception & e)
        {
            fail("resume failed", e);
            release_pipeline();
        }
        return;
    }

    const std::string & path = source.empty() ? fallback_source : source;
    if (path.empty())
    {
        error = "no source to play";
        sonogram::log::get()->app_log->warn("{}", error);
        return;
    }

    std::unique_ptr<audio_pipeline> candidate;
    try
    {
        candidate = factory(path);
        if (!candidate) throw std::runtime_error("pipeline factory returned nothing");
        candidate->play();
    }
    catch (const std::exception & e)
    {
        fail("could not play " + path, e);
        candidate.reset();
        return;
    }

    pipeline = std::move(candidate);
    current_state = playback_state::playing;
    sonogram::log::get()->app_log->info("playing {}", path);
}

void playback_controller::pause()
{
    if (current_state != playback_state::playing) return;

    try
    {
        pipeline->pause();
        current_state = playback_state::paused;
        sonogram::log::get()->app_log->info("paused");
    }
    catch (const std::exception & e)
    {
        fail("pause failed", e);
        release_pipeline();
    }
}

void playback_controller::stop()
{
    if (current_state == playback_state::stopped) return;

    try
    {
        pipeline->stop();
    }
    catch (const std::exception & e)
    {
        fail("stop failed", e);
    }

    release_pipeline();
    sonogram::log::get()->app_log->info("stopped");
}

void playback_controller::poll()
{
    if (!pipeline || !pipeline->is_finished()) return;

    sonogram::log::get()->app_log->info("end of stream: {}", pipeline->source());
    stop();
}
