#include <geomark/io/settings.hpp>
#include <geomark/session/session.hpp>
#include <geomark/shell/command_processor.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "CommandLine.hpp"

#include <fstream>
#include <iostream>

using namespace geomark;

int main(int argc, char *argv[])
{
    uint32_t debug_level = 2;
    std::string log_file = "";
    std::string config_file = "";
    std::string open_file = "";
    std::string script_file = "";
    bool printHelp = false;

    CommandLine args("Create, edit and measure placemarks in KMZ files");
    args.addArgument({"-d", "--debug"}, &debug_level, "none=0, critical=1, error=2, warn=3, info=4, debug=5");
    args.addArgument({"-l", "--log-file"}, &log_file, "Output logging file, overwrites existing files");
    args.addArgument({"-c", "--config"}, &config_file, "JSON settings file");
    args.addArgument({"-o", "--open"}, &open_file, "KMZ file to open on start");
    args.addArgument({"-s", "--script"}, &script_file, "Run the commands of this file instead of reading stdin");
    args.addArgument({"-h", "--help"}, &printHelp, "Print this help message");

    try
    {
        args.parse(argc, argv);
    }
    catch (std::runtime_error const &e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    if (printHelp)
    {
        args.printHelp();
        return 0;
    }

    auto level = spdlog::level::err;
    std::string log_level_str = "err";
    switch (debug_level)
    {
    case 0:
        level = spdlog::level::off;
        log_level_str = "off";
        break;
    case 1:
        level = spdlog::level::critical;
        log_level_str = "critical";
        break;
    case 2:
        level = spdlog::level::err;
        log_level_str = "err";
        break;
    case 3:
        level = spdlog::level::warn;
        log_level_str = "warn";
        break;
    case 4:
        level = spdlog::level::info;
        log_level_str = "info";
        break;
    case 5:
        level = spdlog::level::debug;
        log_level_str = "debug";
        break;
    }
    spdlog::set_level(level);
    if (log_file.size() > 0)
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
        spdlog::default_logger()->sinks().push_back(std::move(file_sink));
    }

    spdlog::info("Log level set to {}", log_level_str);

    Settings settings;
    if (config_file.size() > 0 && !loadSettings(config_file, settings))
    {
        std::cout << "Could not load settings from " << config_file << std::endl;
        return -1;
    }

    Session session(settings);
    CommandProcessor processor(session, std::cout);

    if (open_file.size() > 0)
    {
        processor.execute("open \"" + open_file + "\"");
    }

    std::ifstream script;
    if (script_file.size() > 0)
    {
        script.open(script_file);
        if (!script.is_open())
        {
            std::cout << "Could not open script " << script_file << std::endl;
            return -1;
        }
    }
    else
    {
        processor.setConfirmCallback([](const std::string &question) {
            std::cout << question << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
                return false;
            return answer == "y" || answer == "Y" || answer == "yes";
        });
        std::cout << "geomark shell. Type help to list commands." << std::endl;
    }

    std::istream &input = script_file.size() > 0 ? static_cast<std::istream &>(script) : std::cin;
    const bool interactive = script_file.empty();

    std::string line;
    while (true)
    {
        if (interactive)
            std::cout << "\n[geomark] >>> " << std::flush;
        if (!std::getline(input, line))
        {
            if (session.hasDocument() && session.hasUnsavedChanges())
                spdlog::warn("Input ended with unsaved changes in '{}'", session.document().name);
            break;
        }
        if (!processor.execute(line))
            break;
    }

    return 0;
}
