#pragma once

#ifndef sonogram_gl_texture_view_hpp
#define sonogram_gl_texture_view_hpp

#include "sonogram-gfx-gl/gl-api.hpp"

namespace sonogram
{
    // Fullscreen triangle generated from gl_VertexID; draw with an empty VAO
    static const char s_fullscreenVert[] = R"(#version 450
    out vec2 v_texcoord;
    void main()
    {
        vec2 p = vec2((gl_VertexID << 1) & 2, gl_VertexID & 2);
        v_texcoord = p;
        gl_Position = vec4(p * 2.0 - 1.0, 0.0, 1.0);
    }
)";

    static const char s_textureFrag[] = R"(#version 450
    uniform sampler2D s_texture;
    in vec2 v_texcoord;
    out vec4 f_color;
    void main()
    {
        f_color = vec4(texture(s_texture, v_texcoord).rgb, 1.0);
    }
)";

    inline void draw_fullscreen_triangle(const gl_vertex_array_object & vao)
    {
        glBindVertexArray(vao);
        glDrawArrays(GL_TRIANGLES, 0, 3);
        glBindVertexArray(0);
    }

    struct simple_texture_view : public non_copyable
    {
        gl_shader shader;
        gl_vertex_array_object empty_vao;

        simple_texture_view() : shader(s_fullscreenVert, s_textureFrag) {}

        void draw(const GLuint tex)
        {
            shader.bind();
            shader.texture("s_texture", 0, tex, GL_TEXTURE_2D);
            draw_fullscreen_triangle(empty_vao);
            shader.unbind();
        }
    };

} // end namespace sonogram

#endif // end sonogram_gl_texture_view_hpp
