#include <cstdlib>
#include <filesystem>
#include <string>
#include <xpl/config/config.hpp>
#include <xpl/core/log.hpp>
#include <xpl/shell.hpp>

namespace fs = std::filesystem;

std::string get_config_path(int argc, char* argv[])
{
    // Command line argument takes priority
    if (argc > 1)
    {
        return argv[1];
    }

    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/xpl/config.toml";
    }

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/xpl/config.toml";
    }

    return "";
}

int main(int argc, char* argv[])
{
    xpl::log::init();

    try
    {
        LOG_INFO("Starting xpl-shell");

        std::string config_path = get_config_path(argc, argv);
        xpl::Config config;

        if (!config_path.empty() && fs::exists(config_path))
        {
            LOG_INFO("Loading config from: {}", config_path);
            auto loaded = xpl::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config, using defaults");
                config = xpl::default_config();
            }
        }
        else
        {
            LOG_INFO("No config file found, using defaults");
            config = xpl::default_config();
        }

        if (config.log.file != xpl::default_config().log.file)
            xpl::log::init(config.log.file);
        xpl::log::set_level(config.log.level);

        xpl::Shell shell(std::move(config));
        shell.run();
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        xpl::log::shutdown();
        return 1;
    }

    LOG_INFO("xpl-shell exiting");
    xpl::log::shutdown();
    return 0;
}
