#include "sonogram-app-base/glfw-app.hpp"
#include "sonogram-core/util/logging.hpp"

#include <chrono>
#include <stdexcept>

using namespace sonogram;

static app_input_event generate_input_event(GLFWwindow * window, app_input_event::Type type, int action, int mods)
{
    app_input_event e;
    e.window = window;
    e.type = type;
    e.action = action;
    e.mods = mods;
    e.value = { 0, 0 };
    glfwGetWindowSize(window, &e.window_size.x, &e.window_size.y);
    return e;
}

////////////////////
//   gl_context   //
////////////////////

gl_context::gl_context()
{
    glfwSetErrorCallback([](int err, const char * desc)
    {
        sonogram::log::get()->render_log->error("glfw error {}: {}", err, desc);
    });

    if (!glfwInit()) throw std::runtime_error("could not initialize glfw...");
}

gl_context::~gl_context()
{
    glfwTerminate();
}

/////////////////////
//   glfw_window   //
/////////////////////

static glfw_window & get(GLFWwindow * window) { return *reinterpret_cast<glfw_window *>(glfwGetWindowUserPointer(window)); }

glfw_window::glfw_window(const window_params & params)
{
    glfwWindowHint(GLFW_VISIBLE, 1);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_FALSE);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    int2 size = params.size;
    if (params.full_screen)
    {
        GLFWmonitor * monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode * mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
        if (!mode) throw std::runtime_error("full screen requested but no primary monitor was found");

        glfwWindowHint(GLFW_DECORATED, GL_FALSE);
        glfwWindowHint(GLFW_RED_BITS, mode->redBits);
        glfwWindowHint(GLFW_GREEN_BITS, mode->greenBits);
        glfwWindowHint(GLFW_BLUE_BITS, mode->blueBits);
        glfwWindowHint(GLFW_REFRESH_RATE, mode->refreshRate);
        size = { mode->width, mode->height };

        window = glfwCreateWindow(size.x, size.y, params.title.c_str(), monitor, nullptr);
    }
    else
    {
        window = glfwCreateWindow(size.x, size.y, params.title.c_str(), nullptr, nullptr);
    }

    if (!window) throw std::runtime_error("failed to open glfw window: " + params.title);

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    sonogram::log::get()->render_log->info("GL_VERSION = {}", reinterpret_cast<const char *>(glGetString(GL_VERSION)));
    sonogram::log::get()->render_log->info("GL_RENDERER = {}", reinterpret_cast<const char *>(glGetString(GL_RENDERER)));
    sonogram::log::get()->render_log->info("GLFW_VERSION = {}", glfwGetVersionString());

    glfwSetWindowUserPointer(window, this);
    glfwSetFramebufferSizeCallback(window, [](GLFWwindow * window, int width, int height) { get(window).on_window_resize({ width, height }); });
    glfwSetKeyCallback(window, [](GLFWwindow * window, int key, int, int action, int mods) { get(window).consume_key(key, action, mods); });
    glfwSetWindowCloseCallback(window, [](GLFWwindow * window) { get(window).on_window_close(); });
}

glfw_window::~glfw_window()
{
    if (window) glfwDestroyWindow(window);
}

void glfw_window::consume_key(int key, int action, int mods)
{
    // Modifier keys are reported separately so listeners can track shift state on its own
    const bool is_modifier = key == GLFW_KEY_LEFT_SHIFT || key == GLFW_KEY_RIGHT_SHIFT
        || key == GLFW_KEY_LEFT_CONTROL || key == GLFW_KEY_RIGHT_CONTROL
        || key == GLFW_KEY_LEFT_ALT || key == GLFW_KEY_RIGHT_ALT;

    // GLFW reports the modifier state from before a modifier key changed it
    if (is_modifier)
    {
        mods = 0;
        if (glfwGetKey(window, GLFW_KEY_LEFT_SHIFT) || glfwGetKey(window, GLFW_KEY_RIGHT_SHIFT)) mods |= GLFW_MOD_SHIFT;
        if (glfwGetKey(window, GLFW_KEY_LEFT_CONTROL) || glfwGetKey(window, GLFW_KEY_RIGHT_CONTROL)) mods |= GLFW_MOD_CONTROL;
        if (glfwGetKey(window, GLFW_KEY_LEFT_ALT) || glfwGetKey(window, GLFW_KEY_RIGHT_ALT)) mods |= GLFW_MOD_ALT;
    }

    auto e = generate_input_event(window, is_modifier ? app_input_event::MODIFIERS : app_input_event::KEY, action, mods);
    e.value[0] = key;
    on_input(e);
}

int2 glfw_window::get_framebuffer_size() const
{
    int2 size;
    glfwGetFramebufferSize(window, &size.x, &size.y);
    return size;
}

//////////////////////
//   sonogram_app   //
//////////////////////

sonogram_app::sonogram_app(const window_params & params) : glfw_window(params) {}

void sonogram_app::main_loop()
{
    auto t0 = std::chrono::high_resolution_clock::now();
    auto next_frame = t0;

    while (!glfwWindowShouldClose(window))
    {
        // Sleep until the next frame is due; input wakes the loop early but does not
        // advance the frame clock
        const auto now = std::chrono::high_resolution_clock::now();
        const double wait_s = std::chrono::duration<double>(next_frame - now).count();
        if (wait_s > 0.0)
        {
            glfwWaitEventsTimeout(wait_s);
            if (std::chrono::high_resolution_clock::now() < next_frame) continue;
        }
        else
        {
            glfwPollEvents();
        }

        auto t1 = std::chrono::high_resolution_clock::now();
        next_frame = t1 + std::chrono::duration_cast<std::chrono::high_resolution_clock::duration>(std::chrono::duration<double>(frame_interval_s));

        const float timestep = std::chrono::duration<float>(t1 - t0).count();
        t0 = t1;

        elapsed_frames++;
        fps_time += timestep;
        if (fps_time > 0.5)
        {
            fps = elapsed_frames / fps_time;
            elapsed_frames = 0;
            fps_time = 0;
        }

        app_update_event e;
        e.elapsed_s = glfwGetTime();
        e.timestep_ms = timestep * 1000.f;
        e.frames_per_second = static_cast<float>(fps);
        e.elapsed_frames = elapsed_frames;

        on_update(e);
        on_draw();
    }
}

void sonogram_app::exit()
{
    glfwSetWindowShouldClose(window, 1);
}
