#include "sonogram-gfx-gl/gl-api.hpp"
#include "sonogram-core/util/logging.hpp"

#include <stdexcept>
#include <vector>

using namespace sonogram;

static const char * gl_error_name(GLenum e)
{
    switch (e)
    {
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return "unknown GL error";
    }
}

bool sonogram::gl_check_error(const char * file, int32_t line)
{
    bool clean = true;
    for (GLenum e = glGetError(); e != GL_NO_ERROR; e = glGetError())
    {
        sonogram::log::get()->render_log->error("{} at {}:{}", gl_error_name(e), file, line);
        clean = false;
    }
    return clean;
}

///////////////////////
//   gl_texture_2d   //
///////////////////////

void gl_texture_2d::setup(int32_t w, int32_t h, GLenum internal_fmt, GLenum format, GLenum type, const GLvoid * pixels)
{
    glTextureStorage2D(*this, 1, internal_fmt, w, h);
    if (pixels) glTextureSubImage2D(*this, 0, 0, 0, w, h, format, type, pixels);
    width = w;
    height = h;
    set_filter(GL_LINEAR);
    set_wrap(GL_CLAMP_TO_EDGE);
}

void gl_texture_2d::upload(GLenum format, GLenum type, const GLvoid * pixels)
{
    glTextureSubImage2D(*this, 0, 0, 0, width, height, format, type, pixels);
}

void gl_texture_2d::set_filter(GLenum filter)
{
    glTextureParameteri(*this, GL_TEXTURE_MIN_FILTER, filter);
    glTextureParameteri(*this, GL_TEXTURE_MAG_FILTER, filter);
}

void gl_texture_2d::set_wrap(GLenum wrap)
{
    glTextureParameteri(*this, GL_TEXTURE_WRAP_S, wrap);
    glTextureParameteri(*this, GL_TEXTURE_WRAP_T, wrap);
}

////////////////////////
//   gl_framebuffer   //
////////////////////////

void gl_framebuffer::check_complete()
{
    const GLenum status = glCheckNamedFramebufferStatus(*this, GL_FRAMEBUFFER);
    switch (status)
    {
        case GL_FRAMEBUFFER_COMPLETE: return;
        case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT: throw std::runtime_error("framebuffer incomplete: attachment");
        case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT: throw std::runtime_error("framebuffer incomplete: missing attachment");
        case GL_FRAMEBUFFER_UNSUPPORTED: throw std::runtime_error("framebuffer incomplete: unsupported");
        default: throw std::runtime_error("framebuffer incomplete: status " + std::to_string(status));
    }
}

///////////////////
//   gl_shader   //
///////////////////

static GLuint compile_stage(GLenum type, const std::string & source)
{
    const GLuint stage = glCreateShader(type);
    const GLchar * text = source.c_str();
    glShaderSource(stage, 1, &text, nullptr);
    glCompileShader(stage);

    GLint status = GL_FALSE;
    glGetShaderiv(stage, GL_COMPILE_STATUS, &status);
    if (status == GL_FALSE)
    {
        GLint length = 0;
        glGetShaderiv(stage, GL_INFO_LOG_LENGTH, &length);
        std::vector<GLchar> buffer(length + 1, 0);
        glGetShaderInfoLog(stage, length, nullptr, buffer.data());
        glDeleteShader(stage);
        throw std::runtime_error(std::string("GLSL compile error: ") + buffer.data());
    }
    return stage;
}

gl_shader::gl_shader(const std::string & vert, const std::string & frag)
{
    const GLuint vs = compile_stage(GL_VERTEX_SHADER, vert);
    GLuint fs = 0;
    try { fs = compile_stage(GL_FRAGMENT_SHADER, frag); }
    catch (const std::exception &)
    {
        glDeleteShader(vs);
        throw;
    }

    program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    if (status == GL_FALSE)
    {
        GLint length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        std::vector<GLchar> buffer(length + 1, 0);
        glGetProgramInfoLog(program, length, nullptr, buffer.data());
        glDeleteProgram(program);
        program = 0;
        throw std::runtime_error(std::string("GLSL link error: ") + buffer.data());
    }
}

gl_shader & gl_shader::operator = (gl_shader && r) noexcept
{
    if (this != &r)
    {
        if (program) glDeleteProgram(program);
        program = r.program;
        locations = std::move(r.locations);
        r.program = 0;
    }
    return *this;
}

gl_shader::~gl_shader()
{
    if (program) glDeleteProgram(program);
}

GLint gl_shader::location(const std::string & name) const
{
    auto it = locations.find(name);
    if (it != locations.end()) return it->second;

    const GLint loc = glGetUniformLocation(program, name.c_str());
    if (loc == -1) sonogram::log::get()->render_log->warn("uniform {} is not active", name);
    locations[name] = loc;
    return loc;
}

void gl_shader::texture(const std::string & name, int unit, GLuint tex, GLenum target) const
{
    glBindTextureUnit(unit, tex);
    uniform(name, unit);
    (void) target;
}
