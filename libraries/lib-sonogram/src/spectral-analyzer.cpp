#include "sonogram-core/analysis/spectral-analyzer.hpp"
#include "sonogram-core/util/logging.hpp"

#include <cmath>
#include <stdexcept>

using namespace sonogram;

float sonogram::normalize_magnitude(double magnitude, uint32_t window_size)
{
    // log10(0) is -inf, which falls into the clamp below
    const double x = 1.0 + std::log10(magnitude / static_cast<double>(window_size));
    if (!(x > 0.0)) return 0.0f;
    return static_cast<float>(x / 5.0);
}

double sonogram::frame_bin_frequency(size_t index, const analysis_params & params)
{
    const size_t half = params.window_size / 2;
    const size_t fft_bin = half - index;
    return static_cast<double>(fft_bin) * params.sample_rate / static_cast<double>(params.window_size);
}

spectral_analyzer::spectral_analyzer(spectral_frame_channel & channel, const analysis_params & params)
    : window_size(params.window_size), channel(channel)
{
    if (window_size < 2 || (window_size % 2) != 0)
    {
        throw std::invalid_argument("spectral_analyzer window size must be even and at least 2");
    }

    window.assign(window_size, 0);
    fft_input.resize(window_size);
    fft_output.resize(window_size / 2 + 1);

    fft_cfg = kiss_fftr_alloc(static_cast<int>(window_size), 0, nullptr, nullptr);
    if (!fft_cfg) throw std::runtime_error("kiss_fftr_alloc failed");
}

spectral_analyzer::~spectral_analyzer()
{
    if (fft_cfg) kiss_fftr_free(fft_cfg);
}

void spectral_analyzer::ingest(const int16_t sample)
{
    window[pos] = sample;
    if (++pos == window_size)
    {
        emit_frame();
        pos = 0;
    }
}

void spectral_analyzer::ingest(const int16_t * samples, size_t count)
{
    for (size_t i = 0; i < count; ++i) ingest(samples[i]);
}

void spectral_analyzer::cancel()
{
    cancelled.store(true, std::memory_order_release);
    channel.wake_producer();
}

void spectral_analyzer::emit_frame()
{
    if (closed.load(std::memory_order_relaxed) || cancelled.load(std::memory_order_acquire))
    {
        dropped++;
        return;
    }

    for (uint32_t i = 0; i < window_size; ++i)
    {
        fft_input[i] = static_cast<kiss_fft_scalar>(window[i]);
    }

    kiss_fftr(fft_cfg, fft_input.data(), fft_output.data());

    // The input is real, so |X[j]| == |X[W - j]|. Output indices [W/2, W) are read
    // from the half spectrum kiss_fftr returns, which ends at the Nyquist bin W/2.
    const uint32_t half = window_size / 2;
    spectral_frame frame(half);
    for (uint32_t i = 0; i < half; ++i)
    {
        const kiss_fft_cpx & v = fft_output[half - i];
        const double magnitude = std::hypot(static_cast<double>(v.r), static_cast<double>(v.i));
        frame[i] = normalize_magnitude(magnitude, window_size);
    }

    if (channel.send(std::move(frame), cancelled))
    {
        emitted++;
        return;
    }

    dropped++;

    if (!cancelled.load(std::memory_order_acquire))
    {
        closed.store(true, std::memory_order_relaxed);
        sonogram::log::get()->audio_log->warn("spectral frame channel closed, analysis output stopped after {} frames", emitted.load());
    }
}
