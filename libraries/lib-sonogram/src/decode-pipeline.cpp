#include "sonogram-core/playback/decode-pipeline.hpp"
#include "sonogram-core/util/errors.hpp"
#include "sonogram-core/util/logging.hpp"

#include "miniaudio.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>

using namespace sonogram;

decode_element_registry decode_element_registry::host()
{
    decode_element_registry r = { "filesrc", "decodebin", "tee", "queue", "audioconvert", "audioresample", "autoaudiosink", "appsink" };
#if !defined(MA_NO_WAV)
    r.add("wavdec");
#endif
#if !defined(MA_NO_FLAC)
    r.add("flacdec");
#endif
#if !defined(MA_NO_MP3)
    r.add("mp3dec");
#endif
    return r;
}

std::string sonogram::decoder_for_source(const std::string & source)
{
    const size_t dot = source.find_last_of('.');
    if (dot == std::string::npos) return "decodebin";

    std::string ext = source.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "mp3") return "mp3dec";
    if (ext == "flac") return "flacdec";
    if (ext == "wav" || ext == "wave") return "wavdec";
    return "decodebin";
}

std::vector<std::string> sonogram::resolve_pipeline_elements(const pipeline_description & desc, const std::string & source, const decode_element_registry & registry)
{
    std::vector<std::string> resolved;
    resolved.reserve(desc.elements.size() + 1);

    // Decoder sits directly after the source element
    for (const std::string & name : desc.elements)
    {
        resolved.push_back(name);
        if (name == "filesrc") resolved.push_back(decoder_for_source(source));
    }
    if (std::find(desc.elements.begin(), desc.elements.end(), "filesrc") == desc.elements.end())
    {
        resolved.insert(resolved.begin(), decoder_for_source(source));
    }

    for (const std::string & name : resolved)
    {
        if (!registry.contains(name)) throw missing_decoder_element(name);
    }
    return resolved;
}

/////////////////////////////
//   decode_pipeline_impl  //
/////////////////////////////

struct sonogram::decode_pipeline_impl
{
    ma_decoder decoder;
    ma_data_converter converter;
    ma_device device;

    bool decoder_ready = false;
    bool converter_ready = false;
    bool device_ready = false;
    bool device_started = false;

    std::atomic<bool> playing{ false };
    std::atomic<bool> finished{ false };

    std::unique_ptr<sample_sink> sink;
    std::vector<int16_t> analysis_scratch;

    ~decode_pipeline_impl()
    {
        if (sink) sink->cancel();
        if (device_ready) ma_device_uninit(&device);
        if (converter_ready) ma_data_converter_uninit(&converter, nullptr);
        if (decoder_ready) ma_decoder_uninit(&decoder);
    }

    // Converts decoded output frames to the analysis format and pushes them to the sink
    void feed_analysis(const float * frames, ma_uint64 frame_count)
    {
        const ma_uint32 channels = decoder.outputChannels;
        ma_uint64 remaining = frame_count;

        while (remaining > 0)
        {
            ma_uint64 frames_in = remaining;
            ma_uint64 frames_out = analysis_scratch.size();
            if (ma_data_converter_process_pcm_frames(&converter, frames, &frames_in, analysis_scratch.data(), &frames_out) != MA_SUCCESS) return;

            if (frames_out > 0) sink->on_samples(analysis_scratch.data(), static_cast<size_t>(frames_out));
            if (frames_in == 0 && frames_out == 0) return;

            frames += frames_in * channels;
            remaining -= frames_in;
        }
    }
};

static void audio_callback(ma_device * device, void * output, const void * input, ma_uint32 frame_count)
{
    decode_pipeline_impl * impl = static_cast<decode_pipeline_impl *>(device->pUserData);
    float * out = static_cast<float *>(output);
    const ma_uint32 channels = device->playback.channels;

    if (!impl || !impl->playing.load(std::memory_order_acquire) || impl->finished.load(std::memory_order_acquire))
    {
        std::memset(out, 0, frame_count * channels * sizeof(float));
        return;
    }

    ma_uint64 frames_read = 0;
    const ma_result result = ma_decoder_read_pcm_frames(&impl->decoder, out, frame_count, &frames_read);

    if (frames_read < frame_count)
    {
        std::memset(out + frames_read * channels, 0, (frame_count - frames_read) * channels * sizeof(float));
        impl->finished.store(true, std::memory_order_release);
        if (result != MA_SUCCESS && result != MA_AT_END)
        {
            sonogram::log::get()->audio_log->error("decode error: {}", ma_result_description(result));
        }
    }

    if (frames_read > 0) impl->feed_analysis(out, frames_read);

    (void) input;
}

/////////////////////////
//   decode_pipeline   //
/////////////////////////

decode_pipeline::decode_pipeline(const std::string & source, std::unique_ptr<sample_sink> sink, const pipeline_description & desc, const decode_element_registry & registry)
    : impl(new decode_pipeline_impl()), source_path(source)
{
    const std::vector<std::string> elements = resolve_pipeline_elements(desc, source, registry);

    if (!sink) throw std::invalid_argument("decode_pipeline requires a sample sink");
    impl->sink = std::move(sink);
    impl->analysis_scratch.resize(4096);

    const ma_decoder_config decoder_config = ma_decoder_config_init(ma_format_f32, desc.output_channels, desc.output_sample_rate);
    ma_result result = ma_decoder_init_file(source.c_str(), &decoder_config, &impl->decoder);
    if (result != MA_SUCCESS)
    {
        throw source_open_error("could not open " + source + ": " + ma_result_description(result));
    }
    impl->decoder_ready = true;

    const ma_data_converter_config converter_config = ma_data_converter_config_init(
        ma_format_f32, ma_format_s16,
        impl->decoder.outputChannels, 1,
        impl->decoder.outputSampleRate, desc.analysis_sample_rate);
    result = ma_data_converter_init(&converter_config, nullptr, &impl->converter);
    if (result != MA_SUCCESS)
    {
        throw source_open_error(std::string("could not create analysis converter: ") + ma_result_description(result));
    }
    impl->converter_ready = true;

    ma_device_config device_config = ma_device_config_init(ma_device_type_playback);
    device_config.playback.format = ma_format_f32;
    device_config.playback.channels = impl->decoder.outputChannels;
    device_config.sampleRate = impl->decoder.outputSampleRate;
    device_config.dataCallback = audio_callback;
    device_config.pUserData = impl.get();

    result = ma_device_init(nullptr, &device_config, &impl->device);
    if (result != MA_SUCCESS)
    {
        throw source_open_error(std::string("could not open audio output: ") + ma_result_description(result));
    }
    impl->device_ready = true;

    std::string graph;
    for (const std::string & e : elements) graph += (graph.empty() ? "" : " ! ") + e;
    sonogram::log::get()->audio_log->info("pipeline for {}: {} ({} Hz, {} ch, analysis {} Hz)",
        source, graph, impl->decoder.outputSampleRate, impl->decoder.outputChannels, desc.analysis_sample_rate);
}

decode_pipeline::~decode_pipeline() = default;

void decode_pipeline::play()
{
    if (!impl->device_started)
    {
        const ma_result result = ma_device_start(&impl->device);
        if (result != MA_SUCCESS)
        {
            throw pipeline_state_error(std::string("could not start playback: ") + ma_result_description(result));
        }
        impl->device_started = true;
    }
    impl->playing.store(true, std::memory_order_release);
}

void decode_pipeline::pause()
{
    if (!impl->device_started) throw pipeline_state_error("cannot pause a pipeline that was never started");
    impl->playing.store(false, std::memory_order_release);
}

void decode_pipeline::stop()
{
    // Release a callback that may be blocked on a full frame channel before
    // ma_device_stop() waits for it
    impl->playing.store(false, std::memory_order_release);
    impl->sink->cancel();

    if (!impl->device_started) return;
    impl->device_started = false;

    const ma_result result = ma_device_stop(&impl->device);
    if (result != MA_SUCCESS)
    {
        throw pipeline_state_error(std::string("could not stop playback: ") + ma_result_description(result));
    }
}

bool decode_pipeline::is_finished() const
{
    return impl->finished.load(std::memory_order_acquire);
}
