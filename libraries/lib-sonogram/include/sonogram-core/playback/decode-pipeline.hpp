#pragma once

#ifndef sonogram_decode_pipeline_hpp
#define sonogram_decode_pipeline_hpp

#include "sonogram-core/analysis/sample-sink.hpp"
#include "sonogram-core/playback/audio-pipeline.hpp"
#include "sonogram-core/util/util.hpp"

#include <initializer_list>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sonogram
{
    // The decode graph is described by element names (filesrc, mp3dec, audioconvert,
    // tee, appsink ...). The registry lists which of those this host can build.
    class decode_element_registry
    {
        std::set<std::string> elements;

    public:

        decode_element_registry() = default;
        decode_element_registry(std::initializer_list<std::string> names) : elements(names) {}

        // Every element the linked decode engine supports
        static decode_element_registry host();

        void add(const std::string & name) { elements.insert(name); }
        void remove(const std::string & name) { elements.erase(name); }
        bool contains(const std::string & name) const { return elements.count(name) > 0; }
        std::vector<std::string> list() const { return { elements.begin(), elements.end() }; }
    };

    struct pipeline_description
    {
        // Source -> decoder -> tee -> { playback branch, analysis branch }. The decoder
        // is not listed here; it is chosen from the source's extension.
        std::vector<std::string> elements = {
            "filesrc", "tee",
            "queue", "audioconvert", "audioresample", "autoaudiosink",
            "appsink"
        };

        uint32_t output_sample_rate = 44100;
        uint32_t output_channels = 2;
        uint32_t analysis_sample_rate = 11025;  // the analysis tap is always s16 mono
    };

    // "mp3dec", "flacdec", "wavdec", or "decodebin" (probe all decoders) for anything else
    std::string decoder_for_source(const std::string & source);

    // Full element list for `source`, in graph order. Throws missing_decoder_element
    // naming the first element the registry does not provide.
    std::vector<std::string> resolve_pipeline_elements(const pipeline_description & desc, const std::string & source, const decode_element_registry & registry);

    struct decode_pipeline_impl;

    // miniaudio-backed pipeline: the decoder feeds the playback device, and the
    // device callback converts the same frames to s16 mono for the sample sink.
    // Pausing keeps the device running and outputs silence, so pause() never waits
    // on a callback that is blocked delivering to the sink.
    class decode_pipeline final : public audio_pipeline, public non_copyable
    {
        std::unique_ptr<decode_pipeline_impl> impl;
        std::string source_path;

    public:

        decode_pipeline(const std::string & source,
                        std::unique_ptr<sample_sink> sink,
                        const pipeline_description & desc = {},
                        const decode_element_registry & registry = decode_element_registry::host());
        ~decode_pipeline();

        void play() override;
        void pause() override;
        void stop() override;
        bool is_finished() const override;
        const std::string & source() const override { return source_path; }
    };

} // end namespace sonogram

#endif // end sonogram_decode_pipeline_hpp
