#pragma once

#ifndef sonogram_render_options_hpp
#define sonogram_render_options_hpp

#include <cstdint>

namespace sonogram
{
    // Column order of the presented image. `as_emitted` keeps the analyzer's order
    // (highest frequency on the left); `mirrored` reverses it.
    enum class bin_selection : uint32_t
    {
        as_emitted,
        mirrored
    };

    enum class scroll_direction : uint32_t
    {
        newest_at_top,
        newest_at_bottom
    };

    // Handed to the waterfall snapshot and renderer every frame
    struct render_options
    {
        bin_selection bins = bin_selection::as_emitted;
        scroll_direction scroll = scroll_direction::newest_at_top;
    };

    inline const char * to_string(bin_selection b) { return b == bin_selection::as_emitted ? "as_emitted" : "mirrored"; }
    inline const char * to_string(scroll_direction d) { return d == scroll_direction::newest_at_top ? "newest_at_top" : "newest_at_bottom"; }

} // end namespace sonogram

#endif // end sonogram_render_options_hpp
