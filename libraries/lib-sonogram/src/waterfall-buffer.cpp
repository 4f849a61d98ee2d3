#include "sonogram-core/analysis/waterfall-buffer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

using namespace sonogram;

waterfall_buffer::waterfall_buffer(size_t rows, size_t bins) : num_rows(rows), num_bins(bins)
{
    if (rows == 0 || bins == 0) throw std::invalid_argument("waterfall_buffer needs at least one row and one bin");
    cells.assign(num_rows * num_bins, 0.0f);
}

void waterfall_buffer::push_row(const spectral_frame & frame)
{
    newest = (newest + 1) % num_rows;
    float * dst = cells.data() + newest * num_bins;

    const size_t copied = std::min(frame.size(), num_bins);
    if (copied) std::memcpy(dst, frame.data(), copied * sizeof(float));
    std::fill(dst + copied, dst + num_bins, 0.0f);

    num_pushed++;
}

image_buffer<float> waterfall_buffer::render_view(const render_options & options) const
{
    image_buffer<float> view({ static_cast<int>(num_bins), static_cast<int>(num_rows) }, 1);
    render_view(options, view);
    return view;
}

void waterfall_buffer::render_view(const render_options & options, image_buffer<float> & out) const
{
    const int2 dims = out.size();
    if (dims.x != static_cast<int>(num_bins) || dims.y != static_cast<int>(num_rows) || out.num_channels() != 1)
    {
        out = image_buffer<float>({ static_cast<int>(num_bins), static_cast<int>(num_rows) }, 1);
    }

    for (size_t y = 0; y < num_rows; ++y)
    {
        // Image row 0 is the top of the presented texture
        const size_t age = (options.scroll == scroll_direction::newest_at_top) ? y : (num_rows - 1 - y);
        const float * src = row(age);
        float * dst = out.row(static_cast<int>(y));

        if (options.bins == bin_selection::as_emitted)
        {
            std::memcpy(dst, src, num_bins * sizeof(float));
        }
        else
        {
            std::reverse_copy(src, src + num_bins, dst);
        }
    }
}

void waterfall_buffer::clear()
{
    std::fill(cells.begin(), cells.end(), 0.0f);
    newest = 0;
    num_pushed = 0;
}
