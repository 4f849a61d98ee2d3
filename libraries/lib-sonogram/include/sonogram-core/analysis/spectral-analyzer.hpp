#pragma once

#ifndef sonogram_spectral_analyzer_hpp
#define sonogram_spectral_analyzer_hpp

#include "sonogram-core/analysis/sample-sink.hpp"
#include "sonogram-core/queues/frame-channel.hpp"
#include "sonogram-core/util/util.hpp"

#include "kiss_fftr.h"

#include <atomic>
#include <vector>

namespace sonogram
{
    // W/2 log-normalised magnitudes, nominally [0, ~1]
    typedef std::vector<float> spectral_frame;

    typedef frame_channel<spectral_frame> spectral_frame_channel;

    struct analysis_params
    {
        uint32_t window_size = 800;     // W, samples per spectral frame (even)
        uint32_t sample_rate = 11025;   // rate of the s16 mono tap feeding the analyzer
    };

    // x = 1 + log10(|v| / W), clamped to 0 when negative, otherwise scaled by 1/5
    float normalize_magnitude(double magnitude, uint32_t window_size);

    // Centre frequency in Hz of column `index` of an emitted frame. Columns run from
    // the Nyquist bin (index 0) down to the first non-DC bin (index W/2 - 1).
    double frame_bin_frequency(size_t index, const analysis_params & params);

    class spectral_analyzer final : public sample_sink, public non_copyable
    {
        const uint32_t window_size;
        spectral_frame_channel & channel;

        // Sample window and FFT scratch; touched only by the thread calling ingest()
        std::vector<int16_t> window;
        size_t pos{ 0 };
        kiss_fftr_cfg fft_cfg{ nullptr };
        std::vector<kiss_fft_scalar> fft_input;
        std::vector<kiss_fft_cpx> fft_output;

        std::atomic<bool> cancelled{ false };
        std::atomic<bool> closed{ false };

        std::atomic<uint64_t> emitted{ 0 };
        std::atomic<uint64_t> dropped{ 0 };

        void emit_frame();

    public:

        spectral_analyzer(spectral_frame_channel & channel, const analysis_params & params);
        ~spectral_analyzer();

        void ingest(const int16_t sample);
        void ingest(const int16_t * samples, size_t count);

        void on_samples(const int16_t * samples, size_t count) override { ingest(samples, count); }
        void cancel() override;

        size_t cursor() const { return pos; }
        uint32_t get_window_size() const { return window_size; }
        uint32_t frame_width() const { return window_size / 2; }
        uint64_t frames_emitted() const { return emitted.load(); }
        uint64_t frames_dropped() const { return dropped.load(); }
        bool is_delivering() const { return !closed.load() && !cancelled.load(); }
    };

} // end namespace sonogram

#endif // end sonogram_spectral_analyzer_hpp
