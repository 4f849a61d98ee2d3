#include "sonogram-core/config/visualizer-config.hpp"
#include "sonogram-core/util/file-io.hpp"
#include "sonogram-core/util/logging.hpp"

#include <stdexcept>
#include <type_traits>

using namespace sonogram;

static visualization_mode parse_mode(const std::string & name)
{
    if (name == "waterfall") return visualization_mode::waterfall;
    if (name == "kaleidoscope") return visualization_mode::kaleidoscope;
    throw std::invalid_argument("start_mode must be \"waterfall\" or \"kaleidoscope\", got \"" + name + "\"");
}

void sonogram::to_json(json & j, const visualizer_config & c)
{
    visit_fields(const_cast<visualizer_config &>(c), [&j](const char * name, auto & field)
    {
        j[name] = field;
    });
    j["start_mode"] = to_string(c.start_mode);
}

void sonogram::from_json(const json & archive, visualizer_config & c)
{
    if (!archive.is_object()) throw std::invalid_argument("visualizer config must be a json object");

    visit_fields(c, [&archive](const char * name, auto & field)
    {
        auto it = archive.find(name);
        if (it == archive.end()) return;

        // nlohmann casts negatives and truncates fractions when asked for an integer
        using field_t = std::remove_reference_t<decltype(field)>;
        if constexpr (std::is_integral_v<field_t> && std::is_unsigned_v<field_t>)
        {
            if (!it->is_number_unsigned()) throw std::invalid_argument(std::string("config field ") + name + " must be a non-negative integer");
        }
        else if constexpr (std::is_integral_v<field_t>)
        {
            if (!it->is_number_integer()) throw std::invalid_argument(std::string("config field ") + name + " must be an integer");
        }

        try { field = it->template get<field_t>(); }
        catch (const json::exception & e) { throw std::invalid_argument(std::string("config field ") + name + ": " + e.what()); }
    });

    auto mode = archive.find("start_mode");
    if (mode != archive.end())
    {
        if (!mode->is_string()) throw std::invalid_argument("start_mode must be a string");
        c.start_mode = parse_mode(mode->get<std::string>());
    }
}

void sonogram::validate(const visualizer_config & c)
{
    if (c.window_size < 2 || (c.window_size % 2) != 0) throw std::invalid_argument("window_size must be even and at least 2");
    if (c.analysis_sample_rate == 0) throw std::invalid_argument("analysis_sample_rate must be positive");
    if (c.history_rows == 0) throw std::invalid_argument("history_rows must be positive");
    if (c.channel_capacity == 0) throw std::invalid_argument("channel_capacity must be positive");
    if (c.window_width <= 0 || c.window_height <= 0) throw std::invalid_argument("window dimensions must be positive");
    parse_log_level(c.log_level);
}

visualizer_config sonogram::parse_visualizer_config(const std::string & json_text)
{
    json doc;
    try { doc = json::parse(json_text); }
    catch (const json::parse_error & e) { throw std::invalid_argument(std::string("config is not valid json: ") + e.what()); }

    visualizer_config c = doc.get<visualizer_config>();
    validate(c);
    return c;
}

visualizer_config sonogram::load_visualizer_config(const std::string & path)
{
    if (path.empty()) return {};

    manual_timer t;
    t.start();
    const visualizer_config c = parse_visualizer_config(read_file_text(path));
    t.stop();

    sonogram::log::get()->app_log->info("loaded config {} in {}ms", path, t.get());
    return c;
}
