// main.cpp
#include "app/monitor_app.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "settings/settings.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

// Global atomic flag for shutdown control
std::atomic<bool> running{true};

void signal_handler(int)
{
    running = false;
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);  // Ctrl+C
    std::signal(SIGTERM, signal_handler); // systemd / kill

    try
    {
        const std::string config_path = (argc > 1) ? argv[1] : "config.json";

        MyLogger::init("", MyLogger::Level::Info);
        json config = ConfigReader::load(config_path);
        settings::Settings settings = settings::fromJson(config);
        MyLogger::init(settings.log_file, MyLogger::parseLevel(settings.log_level));

        MonitorApp app(settings);
        MyLogger::info("=== sheetwatch starting ===");
        MyLogger::info("Config: " + config_path);

        app.initialize();
        app.start();

        while (running && !app.session().stopRequested())
        {
            std::this_thread::sleep_for(500ms);
        }

        MyLogger::info("=== Initiating shutdown ===");
        app.stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Critical Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
