#pragma once

#ifndef sonogram_errors_hpp
#define sonogram_errors_hpp

#include <stdexcept>
#include <string>

namespace sonogram
{
    // A decode element the pipeline graph requires is not available on this host.
    class missing_decoder_element : public std::runtime_error
    {
        std::string name;
    public:
        explicit missing_decoder_element(const std::string & element)
            : std::runtime_error("missing element " + element), name(element) {}
        const std::string & element() const { return name; }
    };

    // play/pause/stop was rejected by the decode engine.
    class pipeline_state_error : public std::runtime_error
    {
    public:
        explicit pipeline_state_error(const std::string & what) : std::runtime_error(what) {}
    };

    // The source could not be opened or the output device could not be created.
    class source_open_error : public std::runtime_error
    {
    public:
        explicit source_open_error(const std::string & what) : std::runtime_error(what) {}
    };

} // end namespace sonogram

#endif // end sonogram_errors_hpp
