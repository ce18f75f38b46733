#ifndef _ROWAN_SETTINGS_
#define _ROWAN_SETTINGS_

#include <memory>
#include <string>

#include "config.hpp"
#include "iir.hpp"
#include "logger.hpp"

struct Settings {
    std::string       DefaultWindow = "Rectangular";
    bool              Symmetric     = false;
    Rowan::CoefFormat Format        = Rowan::CoefFormat::BA;
    Logger::Level     Verbosity     = Logger::Level::Message;
    std::string       LogPath;      // empty: no log file
};

// Adds every setting missing from config with its default value
void PopulateDefaults(Config& config);

// Unknown values are replaced by their defaults with a warning
Settings ReadSettings(Config& config);

/*
* Sets the verbosity of the default logger, switches to a file logger if LogPath is set
*
* A file logger set by an earlier call is destroyed, so this must not run while
* another thread (AnalyzeCatalog) logs through the default logger.
*/
void ApplySettings(const Settings& settings);

// Designer of a family producing the configured coefficient format
std::unique_ptr<FilterDesigner> MakeDesigner(const std::string& family, const Settings& settings);

#endif
