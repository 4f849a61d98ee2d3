#pragma once

#ifndef sonogram_sample_sink_hpp
#define sonogram_sample_sink_hpp

#include <cstddef>
#include <cstdint>

namespace sonogram
{
    // Receives mono s16 PCM pushed from the decode engine's callback thread.
    struct sample_sink
    {
        virtual ~sample_sink() = default;
        virtual void on_samples(const int16_t * samples, size_t count) = 0;

        // Called from the owning thread before the engine is torn down. Must make any
        // in-flight on_samples() return promptly.
        virtual void cancel() {}
    };

} // end namespace sonogram

#endif // end sonogram_sample_sink_hpp
