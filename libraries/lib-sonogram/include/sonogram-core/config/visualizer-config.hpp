#pragma once

#ifndef sonogram_visualizer_config_hpp
#define sonogram_visualizer_config_hpp

#include "sonogram-core/playback/playback-controller.hpp"

#include "nlohmann/json.hpp"

#include <string>
#include <vector>

namespace sonogram
{
    using json = nlohmann::json;

    struct visualizer_config
    {
        uint32_t window_size = 800;             // samples per spectral frame
        uint32_t analysis_sample_rate = 11025;
        uint32_t history_rows = 80;             // waterfall rows
        uint32_t channel_capacity = 128;        // spectral frames buffered between threads
        std::string fallback_source;            // played when no --file is given to play()
        visualization_mode start_mode = visualization_mode::kaleidoscope;
        std::vector<std::string> pipeline_elements = {
            "filesrc", "tee", "queue", "audioconvert", "audioresample", "autoaudiosink", "appsink"
        };
        int window_width = 1240;
        int window_height = 1024;
        std::string log_level = "info";
    };

    template<class F> void visit_fields(visualizer_config & o, F f)
    {
        f("window_size", o.window_size);
        f("analysis_sample_rate", o.analysis_sample_rate);
        f("history_rows", o.history_rows);
        f("channel_capacity", o.channel_capacity);
        f("fallback_source", o.fallback_source);
        f("pipeline_elements", o.pipeline_elements);
        f("window_width", o.window_width);
        f("window_height", o.window_height);
        f("log_level", o.log_level);
    }

    // Keys absent from the document keep their defaults
    void to_json(json & j, const visualizer_config & c);
    void from_json(const json & archive, visualizer_config & c);

    // Throws std::invalid_argument naming the first bad field
    void validate(const visualizer_config & c);

    // Parses, applies and validates. An empty path yields the defaults.
    visualizer_config load_visualizer_config(const std::string & path);
    visualizer_config parse_visualizer_config(const std::string & json_text);

} // end namespace sonogram

#endif // end sonogram_visualizer_config_hpp
