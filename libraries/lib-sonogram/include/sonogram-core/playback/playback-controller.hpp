#pragma once

#ifndef sonogram_playback_controller_hpp
#define sonogram_playback_controller_hpp

#include "sonogram-core/playback/audio-pipeline.hpp"
#include "sonogram-core/util/util.hpp"

#include <exception>
#include <memory>
#include <string>

namespace sonogram
{
    enum class playback_state
    {
        stopped,
        playing,
        paused
    };

    enum class visualization_mode
    {
        waterfall,
        kaleidoscope
    };

    const char * to_string(playback_state s);
    const char * to_string(visualization_mode m);

    // Owns at most one pipeline. A pipeline exists iff the state is not stopped.
    // Every pipeline failure is caught here, logged, and leaves the controller in
    // the stopped state; callers never see an exception from play/pause/stop.
    class playback_controller : public non_copyable
    {
        pipeline_factory factory;
        std::unique_ptr<audio_pipeline> pipeline;

        std::string source;
        std::string fallback_source;
        std::string error;

        playback_state current_state{ playback_state::stopped };
        visualization_mode current_mode{ visualization_mode::kaleidoscope };
        bool quit{ false };

        void fail(const std::string & what, const std::exception & e);
        void release_pipeline();

    public:

        playback_controller(pipeline_factory factory, const std::string & source, const std::string & fallback_source = {});
        ~playback_controller();

        void play();
        void pause();
        void stop();

        // Call once per render tick. Stops and releases a pipeline that reached end of stream.
        void poll();

        void set_mode(visualization_mode m) { current_mode = m; }
        visualization_mode mode() const { return current_mode; }

        playback_state state() const { return current_state; }
        bool has_pipeline() const { return pipeline != nullptr; }

        void request_quit() { quit = true; }
        bool quit_requested() const { return quit; }

        // Takes effect on the next play() from stopped
        void set_source(const std::string & path) { source = path; }
        const std::string & get_source() const { return source; }

        // Empty when no failure has been recorded
        const std::string & last_error() const { return error; }
    };

} // end namespace sonogram

#endif // end sonogram_playback_controller_hpp
