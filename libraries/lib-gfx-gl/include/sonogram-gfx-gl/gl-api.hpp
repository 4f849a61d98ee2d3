#pragma once

#ifndef sonogram_gl_api_hpp
#define sonogram_gl_api_hpp

#include "sonogram-core/math/math-core.hpp"
#include "sonogram-core/util/util.hpp"

#define GL_GLEXT_PROTOTYPES
#define GLFW_INCLUDE_GLEXT
#include <GLFW/glfw3.h>

#include <string>
#include <unordered_map>

namespace sonogram
{
    // Logs and clears every pending GL error. Returns false if any were found.
    bool gl_check_error(const char * file, int32_t line);

    ///////////////////
    //   gl_handle   //
    ///////////////////

    // Move-only owner of one GL object name, created lazily on first use (DSA style)
    template<typename factory_t>
    class gl_handle : public non_copyable
    {
        mutable GLuint handle{ 0 };

    public:

        gl_handle() = default;
        gl_handle(gl_handle && r) noexcept : handle(r.handle) { r.handle = 0; }
        gl_handle & operator = (gl_handle && r) noexcept
        {
            if (this != &r)
            {
                if (handle) factory_t::destroy(handle);
                handle = r.handle;
                r.handle = 0;
            }
            return *this;
        }
        ~gl_handle() { if (handle) factory_t::destroy(handle); }

        operator GLuint () const { if (!handle) factory_t::create(handle); return handle; }
        GLuint id() const { return *this; }
        bool is_created() const { return handle != 0; }
    };

    struct gl_texture_factory { static void create(GLuint & x) { glCreateTextures(GL_TEXTURE_2D, 1, &x); } static void destroy(GLuint x) { glDeleteTextures(1, &x); } };
    struct gl_framebuffer_factory { static void create(GLuint & x) { glCreateFramebuffers(1, &x); } static void destroy(GLuint x) { glDeleteFramebuffers(1, &x); } };
    struct gl_vertex_array_factory { static void create(GLuint & x) { glCreateVertexArrays(1, &x); } static void destroy(GLuint x) { glDeleteVertexArrays(1, &x); } };

    typedef gl_handle<gl_vertex_array_factory> gl_vertex_array_object;

    ///////////////////////
    //   gl_texture_2d   //
    ///////////////////////

    struct gl_texture_2d : public gl_handle<gl_texture_factory>
    {
        int32_t width{ 0 };
        int32_t height{ 0 };

        gl_texture_2d() = default;
        gl_texture_2d(gl_texture_2d && r) = default;
        gl_texture_2d & operator = (gl_texture_2d && r) = default;

        // Allocates immutable storage and optionally uploads `pixels`
        void setup(int32_t w, int32_t h, GLenum internal_fmt, GLenum format, GLenum type, const GLvoid * pixels);

        // Replaces the full image; dimensions must match setup()
        void upload(GLenum format, GLenum type, const GLvoid * pixels);

        void set_filter(GLenum filter);
        void set_wrap(GLenum wrap);
    };

    ////////////////////////
    //   gl_framebuffer   //
    ////////////////////////

    struct gl_framebuffer : public gl_handle<gl_framebuffer_factory>
    {
        gl_framebuffer() = default;
        gl_framebuffer(gl_framebuffer && r) = default;
        gl_framebuffer & operator = (gl_framebuffer && r) = default;

        void attach(GLenum attachment, const gl_texture_2d & tex) { glNamedFramebufferTexture(*this, attachment, tex, 0); }

        // Throws std::runtime_error naming the incomplete status
        void check_complete();
    };

    ///////////////////
    //   gl_shader   //
    ///////////////////

    class gl_shader : public non_copyable
    {
        GLuint program{ 0 };
        mutable std::unordered_map<std::string, GLint> locations;

        GLint location(const std::string & name) const;

    public:

        gl_shader() = default;
        gl_shader(const std::string & vert, const std::string & frag);
        gl_shader(gl_shader && r) noexcept : program(r.program), locations(std::move(r.locations)) { r.program = 0; }
        gl_shader & operator = (gl_shader && r) noexcept;
        ~gl_shader();

        GLuint handle() const { return program; }

        void bind() const { glUseProgram(program); }
        void unbind() const { glUseProgram(0); }

        void uniform(const std::string & name, int scalar) const { glProgramUniform1i(program, location(name), scalar); }
        void uniform(const std::string & name, float scalar) const { glProgramUniform1f(program, location(name), scalar); }
        void uniform(const std::string & name, const float2 & vec) const { glProgramUniform2fv(program, location(name), 1, &vec.x); }
        void uniform(const std::string & name, const float3 & vec) const { glProgramUniform3fv(program, location(name), 1, &vec.x); }

        void texture(const std::string & name, int unit, GLuint tex, GLenum target) const;
    };

} // end namespace sonogram

#endif // end sonogram_gl_api_hpp
