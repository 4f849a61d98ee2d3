// Plays an audio file and draws its live spectrogram, either as a scrolling waterfall
// or folded into a kaleidoscope. Keys: S play, D pause, A stop, W waterfall,
// K kaleidoscope, 0 / shift+0 mirror bins, 1 / shift+1 scroll direction, Q quit.

#include "sonogram-core/lib-sonogram.hpp"
#include "sonogram-gfx-gl/spectrogram-renderer.hpp"
#include "sonogram-app-base/glfw-app.hpp"

#include <cstdlib>
#include <iostream>

using namespace sonogram;

struct sonogram_viewer final : public sonogram_app
{
    visualizer_config config;

    spectral_frame_channel channel;
    waterfall_buffer history;
    render_options options;

    input_dispatcher dispatcher;
    playback_controller controller;

    std::unique_ptr<spectrogram_renderer> renderer;

    sonogram_viewer(const launch_options & launch, const visualizer_config & config);
    ~sonogram_viewer();

    void on_input(const app_input_event & event) override;
    void on_update(const app_update_event & e) override;
    void on_draw() override;

    std::unique_ptr<audio_pipeline> make_pipeline(const std::string & source);
};

static window_params make_window_params(const launch_options & launch, const visualizer_config & config)
{
    window_params p;
    p.size = { config.window_width, config.window_height };
    p.title = "sonogram";
    p.full_screen = launch.full_screen;
    return p;
}

sonogram_viewer::sonogram_viewer(const launch_options & launch, const visualizer_config & config)
    : sonogram_app(make_window_params(launch, config)),
      config(config),
      channel(config.channel_capacity),
      history(config.history_rows, config.window_size / 2),
      controller([this](const std::string & source) { return make_pipeline(source); }, launch.file, config.fallback_source)
{
    controller.set_mode(config.start_mode);

    renderer.reset(new spectrogram_renderer(history.rows(), history.bins()));

    controller.play();
    if (controller.state() != playback_state::playing)
    {
        sonogram::log::get()->app_log->warn("starting without playback: {}", controller.last_error());
    }
}

sonogram_viewer::~sonogram_viewer()
{
    // Unblock the analyzer before its pipeline is torn down
    channel.close();
    controller.stop();
}

std::unique_ptr<audio_pipeline> sonogram_viewer::make_pipeline(const std::string & source)
{
    analysis_params analysis;
    analysis.window_size = config.window_size;
    analysis.sample_rate = config.analysis_sample_rate;

    pipeline_description desc;
    desc.elements = config.pipeline_elements;
    desc.analysis_sample_rate = config.analysis_sample_rate;

    // Frames left over from a previous pipeline would splice into the new stream
    while (channel.try_receive()) {}

    std::unique_ptr<sample_sink> analyzer(new spectral_analyzer(channel, analysis));
    return std::unique_ptr<audio_pipeline>(new decode_pipeline(source, std::move(analyzer), desc));
}

void sonogram_viewer::on_input(const app_input_event & event)
{
    if (event.type == app_input_event::MODIFIERS)
    {
        dispatcher.set_shift(event.using_shift_key());
        return;
    }

    if (event.type != app_input_event::KEY || event.action != GLFW_PRESS) return;

    dispatcher.set_shift(event.using_shift_key());
    const input_command cmd = dispatcher.translate(event.value[0]);
    if (input_dispatcher::apply(cmd, controller, options))
    {
        sonogram::log::get()->app_log->debug("{} -> {} (mode {}, bins {}, scroll {})", to_string(cmd),
            to_string(controller.state()), to_string(controller.mode()), to_string(options.bins), to_string(options.scroll));
    }
}

void sonogram_viewer::on_update(const app_update_event & e)
{
    if (controller.quit_requested())
    {
        exit();
        return;
    }

    controller.poll();

    // At most one frame per tick, so the display scrolls at a steady rate
    if (auto frame = channel.try_receive())
    {
        history.push_row(*frame);
    }
}

void sonogram_viewer::on_draw()
{
    glfwMakeContextCurrent(window);

    renderer->update(history, options);
    renderer->draw(controller.mode(), get_framebuffer_size(), static_cast<float>(glfwGetTime()));

    gl_check_error(__FILE__, __LINE__);
    glfwSwapBuffers(window);
}

int main(int argc, char * argv[])
{
    launch_options launch;
    try
    {
        launch = parse_command_line(argc, argv);
    }
    catch (const std::invalid_argument & e)
    {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (launch.help)
    {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (launch.file.empty())
    {
        std::cout << "No file" << std::endl;
        return EXIT_SUCCESS;
    }

    try
    {
        const visualizer_config config = load_visualizer_config(launch.config_path);
        sonogram::log::get()->set_level(parse_log_level(config.log_level));

        sonogram_viewer app(launch, config);
        app.main_loop();
    }
    catch (const std::exception & e)
    {
        sonogram::log::get()->app_log->critical("[Fatal] Caught exception: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
