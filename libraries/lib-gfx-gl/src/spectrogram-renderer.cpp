#include "sonogram-gfx-gl/spectrogram-renderer.hpp"
#include "sonogram-core/util/logging.hpp"

#include <algorithm>
#include <stdexcept>

using namespace sonogram;

// Image row 0 of the snapshot is the top of the waterfall, so v is flipped on lookup
static const char s_waterfallFrag[] = R"(#version 450
    uniform sampler2D s_history;
    in vec2 v_texcoord;
    out vec4 f_color;

    vec3 heat(float x)
    {
        const vec3 c0 = vec3(0.00, 0.00, 0.05);
        const vec3 c1 = vec3(0.10, 0.05, 0.55);
        const vec3 c2 = vec3(0.80, 0.10, 0.45);
        const vec3 c3 = vec3(1.00, 0.65, 0.05);
        const vec3 c4 = vec3(1.00, 1.00, 0.90);
        float t = clamp(x, 0.0, 1.0) * 4.0;
        if (t < 1.0) return mix(c0, c1, t);
        if (t < 2.0) return mix(c1, c2, t - 1.0);
        if (t < 3.0) return mix(c2, c3, t - 2.0);
        return mix(c3, c4, t - 3.0);
    }

    void main()
    {
        float magnitude = texture(s_history, vec2(v_texcoord.x, 1.0 - v_texcoord.y)).r;
        f_color = vec4(heat(magnitude), 1.0);
    }
)";

// Polar remap: angle folds into mirrored wedges across the frequency axis, radius runs
// from the newest row at the centre out to the oldest
static const char s_kaleidoscopeFrag[] = R"(#version 450
    uniform sampler2D s_waterfall;
    uniform vec2 u_resolution;
    uniform int u_segments;
    uniform float u_rotation;
    in vec2 v_texcoord;
    out vec4 f_color;

    const float TAU = 6.28318530718;

    void main()
    {
        vec2 p = (v_texcoord - 0.5) * 2.0;
        p.x *= u_resolution.x / u_resolution.y;

        float radius = length(p);
        float theta = atan(p.y, p.x) + u_rotation;
        float wedge = TAU / float(u_segments);
        float a = mod(theta, wedge);
        if (mod(floor(theta / wedge), 2.0) == 1.0) a = wedge - a;

        vec2 uv = vec2(a / wedge, 1.0 - clamp(radius, 0.0, 1.0));
        vec3 color = texture(s_waterfall, uv).rgb;
        f_color = vec4(color * smoothstep(1.05, 0.95, radius), 1.0);
    }
)";

spectrogram_renderer::spectrogram_renderer(size_t rows, size_t bins, const renderer_params & params) : params(params)
{
    if (params.kaleidoscope_segments < 1) throw std::invalid_argument("kaleidoscope needs at least one segment");

    snapshot = image_buffer<float>({ static_cast<int>(bins), static_cast<int>(rows) }, 1);

    history_texture.setup(static_cast<int32_t>(bins), static_cast<int32_t>(rows), GL_R32F, GL_RED, GL_FLOAT, nullptr);
    history_texture.set_filter(GL_NEAREST);

    waterfall_color.setup(params.target_size.x, params.target_size.y, GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    waterfall_color.set_wrap(GL_MIRRORED_REPEAT);
    waterfall_framebuffer.attach(GL_COLOR_ATTACHMENT0, waterfall_color);
    waterfall_framebuffer.check_complete();

    waterfall_shader = gl_shader(s_fullscreenVert, s_waterfallFrag);
    kaleidoscope_shader = gl_shader(s_fullscreenVert, s_kaleidoscopeFrag);

    gl_check_error(__FILE__, __LINE__);

    sonogram::log::get()->render_log->info("spectrogram renderer: {}x{} history, {}x{} target",
        bins, rows, params.target_size.x, params.target_size.y);
}

void spectrogram_renderer::update(const waterfall_buffer & history, const render_options & options)
{
    history.render_view(options, snapshot);

    // render_view() reallocates when the history dimensions differ from ours
    const int2 dims = snapshot.size();
    if (dims.x != history_texture.width || dims.y != history_texture.height)
    {
        history_texture = gl_texture_2d();
        history_texture.setup(dims.x, dims.y, GL_R32F, GL_RED, GL_FLOAT, nullptr);
        history_texture.set_filter(GL_NEAREST);
    }

    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    history_texture.upload(GL_RED, GL_FLOAT, snapshot.data());
}

void spectrogram_renderer::render_waterfall_pass()
{
    glBindFramebuffer(GL_FRAMEBUFFER, waterfall_framebuffer);
    glViewport(0, 0, params.target_size.x, params.target_size.y);

    waterfall_shader.bind();
    waterfall_shader.texture("s_history", 0, history_texture, GL_TEXTURE_2D);
    draw_fullscreen_triangle(empty_vao);
    waterfall_shader.unbind();

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void spectrogram_renderer::draw(visualization_mode mode, const int2 & viewport, float elapsed_s)
{
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    render_waterfall_pass();

    glViewport(0, 0, viewport.x, viewport.y);
    glClearColor(params.clear_color.x, params.clear_color.y, params.clear_color.z, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    if (mode == visualization_mode::waterfall)
    {
        texture_view.draw(waterfall_color);
    }
    else
    {
        kaleidoscope_shader.bind();
        kaleidoscope_shader.texture("s_waterfall", 0, waterfall_color, GL_TEXTURE_2D);
        kaleidoscope_shader.uniform("u_resolution", float2(static_cast<float>(viewport.x), static_cast<float>(std::max(viewport.y, 1))));
        kaleidoscope_shader.uniform("u_segments", params.kaleidoscope_segments);
        kaleidoscope_shader.uniform("u_rotation", static_cast<float>(SONOGRAM_TAU * params.kaleidoscope_spin * elapsed_s));
        draw_fullscreen_triangle(empty_vao);
        kaleidoscope_shader.unbind();
    }

    gl_check_error(__FILE__, __LINE__);
}
