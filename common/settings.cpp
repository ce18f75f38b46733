#include <mutex>

#include "settings.hpp"
#include "iirImpls.hpp"
#include "window.hpp"

using namespace Rowan;

static const char* keyWindow    = "window.default";
static const char* keySymmetric = "window.symmetric";
static const char* keyFormat    = "filter.format";
static const char* keyVerbosity = "log.verbosity";
static const char* keyLogPath   = "log.path";

static std::unique_ptr<Logger> fileLogger;
static std::mutex              fileLoggerLock;

static const char* levelName(Logger::Level level) {
    switch (level) {
        case Logger::Level::Error:   return "error";
        case Logger::Level::Warning: return "warning";
        case Logger::Level::Info:    return "info";
        case Logger::Level::Message: return "message";
        case Logger::Level::Debug:   return "debug";
    }

    return "message";
}

void PopulateDefaults(Config& config) {
    Settings def;

    config.AddItem(keyWindow,    std::string(def.DefaultWindow));
    config.AddItem(keySymmetric, def.Symmetric);
    config.AddItem(keyFormat,    std::string("ba"));
    config.AddItem(keyVerbosity, std::string(levelName(def.Verbosity)));
    config.AddItem(keyLogPath,   std::string(def.LogPath));
}

// Item stored under the expected type, nullptr with a warning otherwise
static ConfigItem* typedItem(Config& config, const char* key, ConfigItem::ItemType type) {
    ConfigItem& item = config[key];

    if (item.Type() != type) {
        DispWarning("ReadSettings", "Setting '%s' has the wrong type, using the default", key);
        return nullptr;
    }

    return &item;
}

Settings ReadSettings(Config& config) {
    PopulateDefaults(config);

    Settings settings;

    if (auto item = typedItem(config, keyWindow, ConfigItem::ItemType::String)) {
        const std::string& window = item->String();

        if (GetWindowRegistry().Contains(window))
            settings.DefaultWindow = window;
        else
            DispWarning("ReadSettings", "Unknown window '%s', using '%s'", window.c_str(), settings.DefaultWindow.c_str());
    }

    if (auto item = typedItem(config, keySymmetric, ConfigItem::ItemType::Bool))
        settings.Symmetric = item->Bool();

    if (auto item = typedItem(config, keyFormat, ConfigItem::ItemType::String)) {
        const std::string& format = item->String();

        if (format == "ba")
            settings.Format = CoefFormat::BA;
        else if (format == "zpk")
            settings.Format = CoefFormat::ZPK;
        else if (format == "sos")
            settings.Format = CoefFormat::SOS;
        else
            DispWarning("ReadSettings", "Unknown coefficient format '%s', using 'ba'", format.c_str());
    }

    if (auto item = typedItem(config, keyVerbosity, ConfigItem::ItemType::String)) {
        const std::string& level = item->String();

        if (!ParseLevel(level, &settings.Verbosity))
            DispWarning("ReadSettings", "Unknown log level '%s', using '%s'", level.c_str(), levelName(settings.Verbosity));
    }

    if (auto item = typedItem(config, keyLogPath, ConfigItem::ItemType::String))
        settings.LogPath = item->String();

    return settings;
}

void ApplySettings(const Settings& settings) {
    std::lock_guard<std::mutex> guard(fileLoggerLock);

    if (!settings.LogPath.empty()) {
        std::unique_ptr<Logger> log(new Logger(true, settings.Verbosity, settings.LogPath));

        SetDefaultLogger(log.get());
        fileLogger.swap(log);
    } else {
        if (fileLogger) {
            SetDefaultLogger(NULL);
            fileLogger.reset();
        }

        GetDefaultLogger()->Verbosity() = settings.Verbosity;
    }
}

std::unique_ptr<FilterDesigner> MakeDesigner(const std::string& family, const Settings& settings) {
    return MakeDesigner(family, settings.Format);
}
