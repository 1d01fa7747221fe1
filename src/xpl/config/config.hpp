#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace xpl {

struct WindowConfig
{
    uint16_t width = 1400; // Upper bound; the primary display caps it at 80%
    uint16_t height = 900;
    uint16_t min_width = 800;
    uint16_t min_height = 600;
    std::string title = "XPLORER";
    int32_t drop_offset_x = 100; // New window origin relative to the drop point
    int32_t drop_offset_y = 20;
};

struct StyleConfig
{
    uint32_t classic_background = 0x1E1E1E;
};

struct TrayConfig
{
    bool close_to_tray = false;
};

struct ContentConfig
{
    std::string command; // Spawned once per window; empty means windows are ready immediately
};

struct BackendConfig
{
    std::string socket;  // Unix stream socket carrying newline-framed events
    std::string command; // Alternatively spawn the backend and read its stdout
};

struct LogConfig
{
    std::string level = "info";
    std::string file = "/tmp/xpl-shell.log";
};

struct Config
{
    WindowConfig window;
    StyleConfig style;
    TrayConfig tray;
    ContentConfig content;
    BackendConfig backend;
    LogConfig log;
};

std::optional<Config> load_config(std::string const& path);
Config default_config();

} // namespace xpl
