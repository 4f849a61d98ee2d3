#pragma once

#ifndef sonogram_audio_pipeline_hpp
#define sonogram_audio_pipeline_hpp

#include <functional>
#include <memory>
#include <string>

namespace sonogram
{
    // Handle to one decode/analysis pipeline bound to a source. Lifecycle calls
    // come from the render thread and throw pipeline_state_error on failure.
    struct audio_pipeline
    {
        virtual ~audio_pipeline() = default;
        virtual void play() = 0;
        virtual void pause() = 0;
        virtual void stop() = 0;

        // True once the source has been fully decoded
        virtual bool is_finished() const = 0;

        virtual const std::string & source() const = 0;
    };

    // Builds a pipeline for a source path. Throws missing_decoder_element or
    // source_open_error; never returns null.
    typedef std::function<std::unique_ptr<audio_pipeline>(const std::string & source)> pipeline_factory;

} // end namespace sonogram

#endif // end sonogram_audio_pipeline_hpp
