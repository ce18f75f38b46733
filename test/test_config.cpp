#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "config.hpp"
#include "settings.hpp"
#include "logger.hpp"

using namespace Rowan;

static std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static bool logged(const std::string& text) {
    for (const auto& message : GetDefaultLogger()->GetMessages())
        if (message.find(text) != std::string::npos)
            return true;

    return false;
}

TEST_CASE("Config save and load", "[config]") {
    const std::string path = tempPath("rowan_config_test.cfg");

    Config out;
    out.AddItem("a.int",   42);
    out.AddItem("a.bool",  true);
    out.AddItem("a.float", 0.25f);
    out.AddItem("a.str",   std::string("Blackman-Harris 7"));

    out.Save(path);

    Config in;
    in.AddItem("stale", 1);
    in.Load(path);

    CHECK_FALSE(in.Contains("stale"));
    CHECK(in["a.int"].Type() == ConfigItem::ItemType::Int);
    CHECK(in["a.int"].Int() == 42);
    CHECK(in["a.bool"].Bool());
    CHECK(in["a.float"].Float() == 0.25f);
    CHECK(in["a.str"].String() == "Blackman-Harris 7");

    std::remove(path.c_str());
}

TEST_CASE("Config ignores malformed lines", "[config]") {
    const std::string path = tempPath("rowan_config_malformed.cfg");

    {
        std::ofstream file(path);
        file << "# comment\n"
             << "\n"
             << "  good: int = 7  \n"
             << "no separator here\n"
             << "odd: complex = 1\n";
    }

    GetDefaultLogger()->ClearMessages();

    Config config;
    config.Load(path);

    CHECK(config.Contains("good"));
    CHECK(config["good"].Int() == 7);
    CHECK_FALSE(config.Contains("odd"));
    CHECK(logged("malformed line ignored"));
    CHECK(logged("unknown type 'complex'"));

    std::remove(path.c_str());
}

TEST_CASE("Config lookups", "[config]") {
    Config config;

    config.AddItem("x", 1);
    config.AddItem("x", 2);

    CHECK(config["x"].Int() == 1);

    config["x"].Int() = 3;
    CHECK(config.Get("x").Int() == 3);

    CHECK_THROWS_AS(config.Get("missing"), std::out_of_range);
    CHECK_THROWS_AS(config["x"].Bool(), std::bad_variant_access);

    config.RemoveItem("x");
    CHECK_FALSE(config.Contains("x"));

    CHECK_THROWS_AS(config.Load(tempPath("rowan_no_such_dir/none.cfg")), std::runtime_error);
}

TEST_CASE("Settings defaults", "[config][settings]") {
    Config config;

    auto settings = ReadSettings(config);

    CHECK(settings.DefaultWindow == "Rectangular");
    CHECK_FALSE(settings.Symmetric);
    CHECK(settings.Format == CoefFormat::BA);
    CHECK(settings.Verbosity == Logger::Level::Message);
    CHECK(settings.LogPath.empty());

    CHECK(config.Contains("window.default"));
    CHECK(config.Contains("filter.format"));
    CHECK(config.Contains("log.verbosity"));
}

TEST_CASE("Settings values", "[config][settings]") {
    Config config;

    config.AddItem("window.default",   std::string("Hann"));
    config.AddItem("window.symmetric", true);
    config.AddItem("filter.format",    std::string("sos"));
    config.AddItem("log.verbosity",    std::string("warning"));

    auto settings = ReadSettings(config);

    CHECK(settings.DefaultWindow == "Hann");
    CHECK(settings.Symmetric);
    CHECK(settings.Format == CoefFormat::SOS);
    CHECK(settings.Verbosity == Logger::Level::Warning);

    auto designer = MakeDesigner("cheby2", settings);
    CHECK(designer->Format() == CoefFormat::SOS);
}

TEST_CASE("Unknown settings fall back with a warning", "[config][settings]") {
    Config config;

    config.AddItem("window.default", std::string("Triangle-ish"));
    config.AddItem("filter.format",  std::string("lattice"));
    config.AddItem("log.verbosity",  std::string("loud"));

    GetDefaultLogger()->ClearMessages();

    auto settings = ReadSettings(config);

    CHECK(settings.DefaultWindow == "Rectangular");
    CHECK(settings.Format == CoefFormat::BA);
    CHECK(settings.Verbosity == Logger::Level::Message);

    CHECK(logged("Unknown window 'Triangle-ish'"));
    CHECK(logged("Unknown coefficient format 'lattice'"));
    CHECK(logged("Unknown log level 'loud'"));

    SECTION("values stored under the wrong type") {
        const std::string path = tempPath("rowan_config_types.cfg");

        {
            std::ofstream file(path);
            file << "window.symmetric: int = 1\n"
                 << "window.default: bool = true\n"
                 << "filter.format: float = 2\n"
                 << "log.path: int = 0\n";
        }

        Config loaded;
        loaded.Load(path);

        GetDefaultLogger()->ClearMessages();

        Settings typed;
        REQUIRE_NOTHROW(typed = ReadSettings(loaded));

        CHECK_FALSE(typed.Symmetric);
        CHECK(typed.DefaultWindow == "Rectangular");
        CHECK(typed.Format == CoefFormat::BA);
        CHECK(typed.LogPath.empty());

        CHECK(logged("Setting 'window.symmetric' has the wrong type"));
        CHECK(logged("Setting 'window.default' has the wrong type"));
        CHECK(logged("Setting 'filter.format' has the wrong type"));
        CHECK(logged("Setting 'log.path' has the wrong type"));

        std::remove(path.c_str());
    }
}

TEST_CASE("ApplySettings sets the default logger verbosity", "[config][settings]") {
    Logger* log = GetDefaultLogger();

    Settings settings;
    settings.Verbosity = Logger::Level::Error;

    ApplySettings(settings);
    CHECK(GetDefaultLogger() == log);
    CHECK(log->Verbosity() == Logger::Level::Error);

    ApplySettings(Settings());
    CHECK(log->Verbosity() == Logger::Level::Message);
}

TEST_CASE("ApplySettings switches to a file logger and back", "[config][settings]") {
    const std::string path = tempPath("rowan_settings_test.log");
    std::remove(path.c_str());

    Logger* embedded = GetDefaultLogger();

    Settings settings;
    settings.LogPath = path;

    ApplySettings(settings);

    Logger* fileLog = GetDefaultLogger();
    REQUIRE(fileLog != embedded);
    CHECK(fileLog->IsLogging());

    fileLog->SetEcho(false);
    DispWarning("Test", "written to file");

    ApplySettings(Settings());
    CHECK(GetDefaultLogger() == embedded);

    std::ifstream file(path);
    std::string   contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    CHECK(contents.find("[Test] Warning: written to file") != std::string::npos);

    std::remove(path.c_str());
}
