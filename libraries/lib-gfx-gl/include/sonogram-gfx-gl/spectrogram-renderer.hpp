#pragma once

#ifndef sonogram_spectrogram_renderer_hpp
#define sonogram_spectrogram_renderer_hpp

#include "sonogram-gfx-gl/gl-api.hpp"
#include "sonogram-gfx-gl/gl-texture-view.hpp"

#include "sonogram-core/analysis/waterfall-buffer.hpp"
#include "sonogram-core/playback/playback-controller.hpp"

namespace sonogram
{
    struct renderer_params
    {
        int2 target_size = { 1240, 1024 };          // offscreen waterfall image
        float3 clear_color = { 0.0f, 0.0f, 1.0f };
        int32_t kaleidoscope_segments = 8;          // mirrored wedges around the centre
        float kaleidoscope_spin = 0.05f;            // revolutions per second
    };

    // Three passes per frame: the waterfall snapshot is uploaded as R32F, colour-mapped
    // into the offscreen target, then presented directly or through the kaleidoscope remap.
    // Requires a current GL 4.5 context for its whole lifetime.
    class spectrogram_renderer : public non_copyable
    {
        renderer_params params;

        image_buffer<float> snapshot;
        gl_texture_2d history_texture;      // bins x rows, R32F

        gl_texture_2d waterfall_color;      // target_size, RGBA8
        gl_framebuffer waterfall_framebuffer;

        gl_shader waterfall_shader;
        gl_shader kaleidoscope_shader;
        simple_texture_view texture_view;
        gl_vertex_array_object empty_vao;

        void render_waterfall_pass();

    public:

        spectrogram_renderer(size_t rows, size_t bins, const renderer_params & params = {});

        // Snapshot the history with `options` and upload it; once per tick
        void update(const waterfall_buffer & history, const render_options & options);

        // Renders into the default framebuffer at `viewport` pixels
        void draw(visualization_mode mode, const int2 & viewport, float elapsed_s);

        const gl_texture_2d & get_waterfall_texture() const { return waterfall_color; }
    };

} // end namespace sonogram

#endif // end sonogram_spectrogram_renderer_hpp
