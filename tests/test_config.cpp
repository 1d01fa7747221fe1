#include "xpl/config/config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace xpl;

namespace {

class TempConfig
{
public:
    explicit TempConfig(std::string const& contents)
    {
        path_ = (std::filesystem::temp_directory_path() / ("xpl-config-" + std::to_string(getpid()) + "-"
                                                            + std::to_string(counter_++) + ".toml"))
                    .string();
        std::ofstream out(path_);
        out << contents;
    }

    ~TempConfig()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string const& path() const { return path_; }

private:
    static inline int counter_ = 0;
    std::string path_;
};

} // namespace

TEST_CASE("Defaults match the documented window and tray behavior", "[config]")
{
    Config cfg = default_config();
    REQUIRE(cfg.window.width == 1400);
    REQUIRE(cfg.window.height == 900);
    REQUIRE(cfg.window.min_width == 800);
    REQUIRE(cfg.window.min_height == 600);
    REQUIRE(cfg.window.title == "XPLORER");
    REQUIRE(cfg.window.drop_offset_x == 100);
    REQUIRE(cfg.window.drop_offset_y == 20);
    REQUIRE_FALSE(cfg.tray.close_to_tray);
    REQUIRE(cfg.content.command.empty());
}

TEST_CASE("Config file overrides defaults table by table", "[config]")
{
    TempConfig file(R"(
[window]
width = 1600
title = "Files"
drop_offset_x = 40

[style]
classic_background = 0x202020

[tray]
close_to_tray = true

[content]
command = "xpl-content"

[backend]
socket = "/run/user/1000/xpl.sock"

[log]
level = "debug"
file = ""
)");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->window.width == 1600);
    REQUIRE(cfg->window.height == 900);
    REQUIRE(cfg->window.title == "Files");
    REQUIRE(cfg->window.drop_offset_x == 40);
    REQUIRE(cfg->window.drop_offset_y == 20);
    REQUIRE(cfg->style.classic_background == 0x202020);
    REQUIRE(cfg->tray.close_to_tray);
    REQUIRE(cfg->content.command == "xpl-content");
    REQUIRE(cfg->backend.socket == "/run/user/1000/xpl.sock");
    REQUIRE(cfg->log.level == "debug");
    REQUIRE(cfg->log.file.empty());
}

TEST_CASE("Configured size never drops below the minimum", "[config]")
{
    TempConfig file("[window]\nwidth = 300\nheight = 200\n");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->window.width == 800);
    REQUIRE(cfg->window.height == 600);
}

TEST_CASE("Integers outside the field range keep the default", "[config]")
{
    TempConfig file(R"(
[window]
width = 70000
height = 1000
min_width = -1
drop_offset_x = 5000000000

[style]
classic_background = -5
)");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->window.width == 1400);
    REQUIRE(cfg->window.height == 1000);
    REQUIRE(cfg->window.min_width == 800);
    REQUIRE(cfg->window.drop_offset_x == 100);
    REQUIRE(cfg->style.classic_background == 0x1E1E1E);
}

TEST_CASE("Unknown log level keeps the default", "[config]")
{
    TempConfig file("[log]\nlevel = \"chatty\"\n");

    auto cfg = load_config(file.path());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->log.level == "info");
}

TEST_CASE("Parse errors and missing files yield no config", "[config]")
{
    TempConfig broken("[window\nwidth = ");
    REQUIRE_FALSE(load_config(broken.path()).has_value());
    REQUIRE_FALSE(load_config("/nonexistent/xpl/config.toml").has_value());
}
