#include "sonogram-core/config/command-line.hpp"
#include "sonogram-core/util/util.hpp"

#include <stdexcept>

using namespace sonogram;

launch_options sonogram::parse_command_line(const std::vector<std::string> & args)
{
    launch_options opts;

    auto value_of = [&args](size_t & i) -> const std::string &
    {
        if (i + 1 >= args.size()) throw std::invalid_argument("option " + args[i] + " requires a value");
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string & a = args[i];

        if (a == "-f" || a == "--file") opts.file = value_of(i);
        else if (a == "-c" || a == "--config") opts.config_path = value_of(i);
        else if (a == "-m" || a == "--full") opts.full_screen = true;
        else if (a == "-h" || a == "--help") opts.help = true;
        else if (a.compare(0, 7, "--file=") == 0) opts.file = a.substr(7);
        else if (a.compare(0, 9, "--config=") == 0) opts.config_path = a.substr(9);
        else throw std::invalid_argument("unknown option " + a);
    }

    return opts;
}

launch_options sonogram::parse_command_line(int argc, char * argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_command_line(args);
}

std::string sonogram::usage(const std::string & program)
{
    return as_string()
        << "usage: " << program << " -f <audio file> [-m] [-c <config.json>]\n"
        << "  -f, --file <path>     audio file to play and visualize\n"
        << "  -m, --full            borderless full screen on the primary monitor\n"
        << "  -c, --config <path>   json configuration\n"
        << "  -h, --help            show this message\n";
}
