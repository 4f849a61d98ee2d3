#pragma once

#ifndef sonogram_input_dispatcher_hpp
#define sonogram_input_dispatcher_hpp

#include "sonogram-core/analysis/render-options.hpp"
#include "sonogram-core/playback/playback-controller.hpp"

namespace sonogram
{
    enum class input_command
    {
        none,
        quit,
        stop,
        play,
        pause,
        show_kaleidoscope,
        show_waterfall,
        bin_selection_as_emitted,
        bin_selection_mirrored,
        scroll_newest_at_top,
        scroll_newest_at_bottom
    };

    const char * to_string(input_command c);

    // Maps a key press to a command. Key codes are GLFW's printable codes, which
    // match ASCII capitals and digits, so this header does not need GLFW.
    class input_dispatcher
    {
        bool shift{ false };

    public:

        void set_shift(bool down) { shift = down; }
        bool shift_down() const { return shift; }

        input_command translate(int key) const;

        // Executes `cmd`; returns false for input_command::none
        static bool apply(input_command cmd, playback_controller & controller, render_options & options);
    };

} // end namespace sonogram

#endif // end sonogram_input_dispatcher_hpp
