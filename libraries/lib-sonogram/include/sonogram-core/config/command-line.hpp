#pragma once

#ifndef sonogram_command_line_hpp
#define sonogram_command_line_hpp

#include <string>
#include <vector>

namespace sonogram
{
    struct launch_options
    {
        std::string file;           // -f, --file
        bool full_screen = false;   // -m, --full
        std::string config_path;    // -c, --config
        bool help = false;          // -h, --help
    };

    // Throws std::invalid_argument for unknown options or a missing value
    launch_options parse_command_line(const std::vector<std::string> & args);
    launch_options parse_command_line(int argc, char * argv[]);

    std::string usage(const std::string & program);

} // end namespace sonogram

#endif // end sonogram_command_line_hpp
