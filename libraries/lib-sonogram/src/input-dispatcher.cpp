#include "sonogram-core/playback/input-dispatcher.hpp"

using namespace sonogram;

const char * sonogram::to_string(input_command c)
{
    switch (c)
    {
        case input_command::none:                     return "none";
        case input_command::quit:                     return "quit";
        case input_command::stop:                     return "stop";
        case input_command::play:                     return "play";
        case input_command::pause:                    return "pause";
        case input_command::show_kaleidoscope:        return "show_kaleidoscope";
        case input_command::show_waterfall:           return "show_waterfall";
        case input_command::bin_selection_as_emitted: return "bin_selection_as_emitted";
        case input_command::bin_selection_mirrored:   return "bin_selection_mirrored";
        case input_command::scroll_newest_at_top:     return "scroll_newest_at_top";
        case input_command::scroll_newest_at_bottom:  return "scroll_newest_at_bottom";
    }
    return "unknown";
}

input_command input_dispatcher::translate(int key) const
{
    switch (key)
    {
        case 'Q': return input_command::quit;
        case 'A': return input_command::stop;
        case 'S': return input_command::play;
        case 'D': return input_command::pause;
        case 'K': return input_command::show_kaleidoscope;
        case 'W': return input_command::show_waterfall;
        case '0': return shift ? input_command::bin_selection_as_emitted : input_command::bin_selection_mirrored;
        case '1': return shift ? input_command::scroll_newest_at_top : input_command::scroll_newest_at_bottom;
        default:  return input_command::none;
    }
}

bool input_dispatcher::apply(input_command cmd, playback_controller & controller, render_options & options)
{
    switch (cmd)
    {
        case input_command::quit:                     controller.request_quit(); return true;
        case input_command::stop:                     controller.stop(); return true;
        case input_command::play:                     controller.play(); return true;
        case input_command::pause:                    controller.pause(); return true;
        case input_command::show_kaleidoscope:        controller.set_mode(visualization_mode::kaleidoscope); return true;
        case input_command::show_waterfall:           controller.set_mode(visualization_mode::waterfall); return true;
        case input_command::bin_selection_as_emitted: options.bins = bin_selection::as_emitted; return true;
        case input_command::bin_selection_mirrored:   options.bins = bin_selection::mirrored; return true;
        case input_command::scroll_newest_at_top:     options.scroll = scroll_direction::newest_at_top; return true;
        case input_command::scroll_newest_at_bottom:  options.scroll = scroll_direction::newest_at_bottom; return true;
        case input_command::none:                     return false;
    }
    return false;
}
