#pragma once

#ifndef sonogram_waterfall_buffer_hpp
#define sonogram_waterfall_buffer_hpp

#include "sonogram-core/analysis/render-options.hpp"
#include "sonogram-core/analysis/spectral-analyzer.hpp"
#include "sonogram-core/util/image-buffer.hpp"

#include <vector>

namespace sonogram
{
    // Fixed-size scrolling history of spectral frames. Storage is one contiguous
    // rows * bins block allocated in the constructor; push_row() overwrites the
    // oldest row in place. Not thread-safe, owned by the render thread.
    class waterfall_buffer
    {
        size_t num_rows{ 0 };
        size_t num_bins{ 0 };
        std::vector<float> cells;
        size_t newest{ 0 };     // storage row holding the most recent push
        uint64_t num_pushed{ 0 };

        size_t storage_row(size_t age) const { return (newest + num_rows - (age % num_rows)) % num_rows; }

    public:

        waterfall_buffer(size_t rows, size_t bins);

        // Rows longer than bins() are truncated, shorter ones zero-padded
        void push_row(const spectral_frame & frame);

        // Row pushed `age` pushes ago; 0 is the newest. Never-written rows read as zero.
        const float * row(size_t age) const { return cells.data() + storage_row(age) * num_bins; }

        // bins() x rows() single channel snapshot, ready for upload as an R32F texture
        image_buffer<float> render_view(const render_options & options) const;
        void render_view(const render_options & options, image_buffer<float> & out) const;

        void clear();

        size_t rows() const { return num_rows; }
        size_t bins() const { return num_bins; }
        uint64_t pushed() const { return num_pushed; }
    };

} // end namespace sonogram

#endif // end sonogram_waterfall_buffer_hpp
