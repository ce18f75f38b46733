#ifndef _ROWAN_CONFIG_
#define _ROWAN_CONFIG_

#include <map>
#include <string>
#include <variant>

typedef std::variant<int, bool, float, std::string> ConfigValue;

class ConfigItem {
public:
    enum class ItemType {
        Int,
        Bool,
        Float,
        String
    };

    ConfigItem(const std::string& name, const ConfigValue& value);

    const std::string& Name() const;
    ItemType Type() const;

    int&         Int();
    bool&        Bool();
    float&       Float();
    std::string& String();

private:
    std::string name;
    ItemType    type;
    ConfigValue value;
};

/*
* Typed key / value store
*
* File format, one item per line, '#' starts a comment line:
*   name: int = 4
*   name: bool = true
*   name: float = 0.5
*   name: str = text
*/
class Config {
public:
    Config();
    ~Config();

    // Replaces all items. Throws std::runtime_error if the file can't be read
    void Load(const std::string& path);
    // Throws std::runtime_error if the file can't be written
    void Save(const std::string& path);

    // Existing items are kept, use Get() to change a value
    void AddItem(const std::string& name, const ConfigValue& value);
    void AddItem(const ConfigItem& item);
    void RemoveItem(const std::string& name);
    bool Contains(const std::string& name) const;

    // Throws std::out_of_range for unknown names
    ConfigItem& Get(const std::string& name);
    ConfigItem& operator[](const std::string& name);

private:
    std::map<std::string, ConfigItem> items;
};

#endif
