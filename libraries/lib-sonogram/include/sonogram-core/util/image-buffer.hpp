#pragma once

#ifndef sonogram_image_buffer_hpp
#define sonogram_image_buffer_hpp

#include "sonogram-core/math/math-core.hpp"

#include <cstring>
#include <memory>
#include <stdexcept>

namespace sonogram
{
    // Row-major, interleaved-channel pixel storage. size().x is the width (columns),
    // size().y the height (rows). Layout matches what glTextureSubImage2D expects.
    template <typename T>
    class image_buffer
    {
        int2 dims{ 0, 0 };
        int channels{ 0 };
        std::unique_ptr<T[]> buffer;

        size_t count() const { return static_cast<size_t>(dims.x) * dims.y * channels; }

    public:

        image_buffer() = default;
        image_buffer(const int2 & size, const int channels) : dims(size), channels(channels)
        {
            if (size.x < 0 || size.y < 0 || channels <= 0) throw std::invalid_argument("invalid image_buffer dimensions");
            buffer.reset(new T[count()]());
        }

        image_buffer(const image_buffer<T> & r) : dims(r.dims), channels(r.channels)
        {
            if (r.buffer)
            {
                buffer.reset(new T[count()]);
                std::memcpy(buffer.get(), r.buffer.get(), count() * sizeof(T));
            }
        }

        image_buffer & operator = (const image_buffer<T> & r)
        {
            if (this == &r) return *this;
            image_buffer<T> copy(r);
            *this = std::move(copy);
            return *this;
        }

        image_buffer(image_buffer<T> && r) = default;
        image_buffer & operator = (image_buffer<T> && r) = default;

        int2 size() const { return dims; }
        size_t size_bytes() const { return count() * sizeof(T); }
        size_t num_pixels() const { return static_cast<size_t>(dims.x) * dims.y; }
        int num_channels() const { return channels; }
        T * data() { return buffer.get(); }
        const T * data() const { return buffer.get(); }
        T & operator()(int y, int x) { return buffer[y * dims.x + x]; }
        T & operator()(int y, int x, int channel) { return buffer[channels * (y * dims.x + x) + channel]; }
        const T operator()(int y, int x) const { return buffer[y * dims.x + x]; }
        const T operator()(int y, int x, int channel) const { return buffer[channels * (y * dims.x + x) + channel]; }
        T * row(int y) { return buffer.get() + static_cast<size_t>(y) * dims.x * channels; }
        const T * row(int y) const { return buffer.get() + static_cast<size_t>(y) * dims.x * channels; }
    };

} // end namespace sonogram

#endif // end sonogram_image_buffer_hpp
