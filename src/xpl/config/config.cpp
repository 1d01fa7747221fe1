#include "config.hpp"
#include "xpl/core/log.hpp"
#include <toml++/toml.hpp>
#include <utility>

namespace xpl
{

namespace {

// Integers that do not fit the field are ignored with a warning.
template<typename T>
void read_integer(toml::table const& table, std::string_view section, std::string_view key, T& out)
{
    auto v = table[key].value<int64_t>();
    if (!v)
        return;
    if (!std::in_range<T>(*v))
    {
        LOG_WARN("{}.{} = {} is out of range, keeping {}", section, key, *v, out);
        return;
    }
    out = static_cast<T>(*v);
}

} // namespace

Config default_config()
{
    Config cfg;

    cfg.window.width = 1400;
    cfg.window.height = 900;
    cfg.window.min_width = 800;
    cfg.window.min_height = 600;
    cfg.window.title = "XPLORER";
    cfg.window.drop_offset_x = 100;
    cfg.window.drop_offset_y = 20;

    cfg.style.classic_background = 0x1E1E1E;
    cfg.tray.close_to_tray = false;

    cfg.log.level = "info";
    cfg.log.file = "/tmp/xpl-shell.log";

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        Config cfg = default_config();

        // Window
        if (auto window = tbl["window"].as_table())
        {
            read_integer(*window, "window", "width", cfg.window.width);
            read_integer(*window, "window", "height", cfg.window.height);
            read_integer(*window, "window", "min_width", cfg.window.min_width);
            read_integer(*window, "window", "min_height", cfg.window.min_height);
            if (auto v = (*window)["title"].value<std::string>())
                cfg.window.title = *v;
            read_integer(*window, "window", "drop_offset_x", cfg.window.drop_offset_x);
            read_integer(*window, "window", "drop_offset_y", cfg.window.drop_offset_y);
        }

        // Style
        if (auto style = tbl["style"].as_table())
        {
            read_integer(*style, "style", "classic_background", cfg.style.classic_background);
        }

        // Tray
        if (auto tray = tbl["tray"].as_table())
        {
            if (auto v = (*tray)["close_to_tray"].value<bool>())
                cfg.tray.close_to_tray = *v;
        }

        // Content
        if (auto content = tbl["content"].as_table())
        {
            if (auto v = (*content)["command"].value<std::string>())
                cfg.content.command = *v;
        }

        // Backend
        if (auto backend = tbl["backend"].as_table())
        {
            if (auto v = (*backend)["socket"].value<std::string>())
                cfg.backend.socket = *v;
            if (auto v = (*backend)["command"].value<std::string>())
                cfg.backend.command = *v;
        }

        // Log
        if (auto log = tbl["log"].as_table())
        {
            if (auto v = (*log)["level"].value<std::string>())
            {
                if (*v == "trace" || *v == "debug" || *v == "info" || *v == "warn" || *v == "error"
                    || *v == "critical" || *v == "off")
                    cfg.log.level = *v;
                else
                    LOG_WARN("Unknown log level '{}', keeping '{}'", *v, cfg.log.level);
            }
            if (auto v = (*log)["file"].value<std::string>())
                cfg.log.file = *v;
        }

        if (cfg.window.width < cfg.window.min_width)
            cfg.window.width = cfg.window.min_width;
        if (cfg.window.height < cfg.window.min_height)
            cfg.window.height = cfg.window.min_height;

        return cfg;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace xpl
