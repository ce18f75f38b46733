#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include "config.hpp"
#include "logger.hpp"

ConfigItem::ConfigItem(const std::string& name, const ConfigValue& value)
           : name(name), value(value)
{
    if (std::holds_alternative<int>(value)) {
        type = ItemType::Int;
    } else if (std::holds_alternative<bool>(value)) {
        type = ItemType::Bool;
    } else if (std::holds_alternative<float>(value)) {
        type = ItemType::Float;
    } else {
        type = ItemType::String;
    }
}

const std::string& ConfigItem::Name() const {
    return name;
}
ConfigItem::ItemType ConfigItem::Type() const {
    return type;
}

int& ConfigItem::Int() {
    return std::get<int>(value);
}
bool& ConfigItem::Bool() {
    return std::get<bool>(value);
}
float& ConfigItem::Float() {
    return std::get<float>(value);
}
std::string& ConfigItem::String() {
    return std::get<std::string>(value);
}


Config::Config() { }
Config::~Config() { }

void Config::AddItem(const std::string& name, const ConfigValue& value) {
    items.emplace(name, ConfigItem(name, value));
}
void Config::AddItem(const ConfigItem& item) {
    items.emplace(item.Name(), item);
}
void Config::RemoveItem(const std::string& name) {
    items.erase(name);
}
bool Config::Contains(const std::string& name) const {
    return items.find(name) != items.end();
}

ConfigItem& Config::Get(const std::string& name) {
    try {
        return items.at(name);
    } catch (std::out_of_range&) {
        DispError("Config", "Failed to get config item: %s", name.c_str());
        throw;
    }
}
ConfigItem& Config::operator[](const std::string& name) {
    return Get(name);
}

void Config::Save(const std::string& path) {
    FILE* file = fopen(path.c_str(), "w");

    if (!file)
        throw std::runtime_error("Failed to open config file for writing: " + path);

    fprintf(file, "# Rowan settings\n\n");

    for (auto& [name, item] : items) {
        switch (item.Type()) {
            case ConfigItem::ItemType::Int:
                fprintf(file, "%s: int = %d\n", name.c_str(), item.Int());
                break;
            case ConfigItem::ItemType::Bool:
                fprintf(file, "%s: bool = %s\n", name.c_str(), item.Bool() ? "true" : "false");
                break;
            case ConfigItem::ItemType::Float:
                fprintf(file, "%s: float = %.9g\n", name.c_str(), item.Float());
                break;
            case ConfigItem::ItemType::String:
                fprintf(file, "%s: str = %s\n", name.c_str(), item.String().c_str());
                break;
        }
    }

    fclose(file);
}

static std::string trim(const std::string& str) {
    const char* space = " \t\r\n";

    size_t start = str.find_first_not_of(space);
    if (start == std::string::npos)
        return "";

    size_t end = str.find_last_not_of(space);

    return str.substr(start, end - start + 1);
}

void Config::Load(const std::string& path) {
    FILE* file = fopen(path.c_str(), "r");

    if (!file)
        throw std::runtime_error("Failed to open config file for reading: " + path);

    items.clear();

    char buffer[4096];
    int  lineNum = 0;

    while (fgets(buffer, sizeof(buffer), file)) {
        lineNum++;

        std::string line = trim(buffer);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#')
            continue;

        size_t colon  = line.find(':');
        size_t equals = colon == std::string::npos ? std::string::npos : line.find('=', colon);

        if (equals == std::string::npos) {
            DispWarning("Config::Load", "%s:%d: malformed line ignored", path.c_str(), lineNum);
            continue;
        }

        std::string name  = trim(line.substr(0, colon));
        std::string type  = trim(line.substr(colon + 1, equals - colon - 1));
        std::string value = trim(line.substr(equals + 1));

        if (type == "int") {
            items.emplace(name, ConfigItem(name, atoi(value.c_str())));
        } else if (type == "bool") {
            items.emplace(name, ConfigItem(name, value == "true"));
        } else if (type == "float") {
            items.emplace(name, ConfigItem(name, (float)atof(value.c_str())));
        } else if (type == "str") {
            items.emplace(name, ConfigItem(name, value));
        } else {
            DispWarning("Config::Load", "%s:%d: unknown type '%s' for %s", path.c_str(), lineNum, type.c_str(), name.c_str());
        }
    }

    fclose(file);
}
