#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ConfigReader
{
    // Throws std::runtime_error when the file cannot be opened or parsed.
    json load(const std::string &filepath);
    bool save(const std::string &filepath, const json &j);

    // Typed getters return the fallback (and log) on a missing or mistyped key.
    int get_config_value(const std::string &key, const json &j, int fallback = 0);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback = 0);
    double get_config_double(const std::string &key, const json &j, double fallback = 0.0);
    bool get_config_bool(const std::string &key, const json &j, bool fallback = false);
};

#endif // LOAD_CONFIG_HPP
