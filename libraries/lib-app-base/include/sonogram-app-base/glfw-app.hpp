#pragma once

#ifndef sonogram_glfw_app_hpp
#define sonogram_glfw_app_hpp

#include "sonogram-gfx-gl/gl-api.hpp"

#include <string>
#include <vector>

namespace sonogram
{
    struct app_update_event
    {
        double elapsed_s;
        float timestep_ms;
        float frames_per_second;
        uint64_t elapsed_frames;
    };

    struct app_input_event
    {
        enum Type { KEY, MODIFIERS };

        GLFWwindow * window;
        int2 window_size;

        Type type;
        int action;
        int mods;

        int2 value; // key

        bool is_down() const { return action != GLFW_RELEASE; }
        bool is_up() const { return action == GLFW_RELEASE; }

        bool using_shift_key() const { return mods & GLFW_MOD_SHIFT; };
        bool using_control_key() const { return mods & GLFW_MOD_CONTROL; };
        bool using_alt_key() const { return mods & GLFW_MOD_ALT; };
    };

    struct gl_context : public non_copyable
    {
        gl_context();
        ~gl_context();
    };

    struct window_params
    {
        int2 size = { 1240, 1024 };
        std::string title = "sonogram";
        bool full_screen = false;   // borderless, covering the primary monitor
    };

    class glfw_window : public non_copyable
    {
        void consume_key(int key, int action, int mods);

    protected:

        gl_context context;
        GLFWwindow * window{ nullptr };

    public:

        glfw_window(const window_params & params);
        virtual ~glfw_window();

        virtual void on_update(const app_update_event & e) { }
        virtual void on_draw() { }
        virtual void on_window_resize(int2 size) { }
        virtual void on_window_close() { }
        virtual void on_input(const app_input_event & event) { }

        GLFWwindow * get_window() const { return window; }
        int2 get_framebuffer_size() const;
    };

    // Wakes every `frame_interval_s` or on input, then runs on_update() and on_draw()
    class sonogram_app : public glfw_window
    {
        uint64_t elapsed_frames{ 0 };
        double fps{ 0 };
        double fps_time{ 0 };
        double frame_interval_s{ 1.0 / 60.0 };

    public:

        sonogram_app(const window_params & params);

        void main_loop();
        void exit();
        void set_frame_interval(double seconds) { frame_interval_s = seconds; }
    };

} // end namespace sonogram

#endif // end sonogram_glfw_app_hpp
