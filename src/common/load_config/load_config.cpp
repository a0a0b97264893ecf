#include "load_config.hpp"
#include "logger/Mylogger.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw std::runtime_error("Malformed config file: " + filepath);
        }
    }

    bool save(const std::string &filepath, const json &j)
    {
        std::ofstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file for writing: " + filepath);
            throw std::runtime_error("Could not open config file for writing: " + filepath);
        }

        config_file << j.dump(4);
        if (!config_file)
        {
            MyLogger::error("Error saving JSON to file " + filepath);
            return false;
        }
        MyLogger::info("Configuration file saved successfully: " + filepath);
        return true;
    }

    int get_config_value(const std::string &key, const json &j, int fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::warning("Key not found in JSON: " + key + ", using default " + std::to_string(fallback));
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<int>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::warning("Key not found in JSON: " + key + ", using default '" + fallback + "'");
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }

    unsigned short get_config_short(const std::string &key, const json &j, unsigned short fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::warning("Key not found in JSON: " + key + ", using default " + std::to_string(fallback));
            return fallback;
        }
        if (!j[key].is_number_unsigned())
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            return fallback;
        }
        auto val = j[key].get<unsigned int>();
        if (val > std::numeric_limits<unsigned short>::max())
        {
            MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
            return fallback;
        }
        return static_cast<unsigned short>(val);
    }

    double get_config_double(const std::string &key, const json &j, double fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::warning("Key not found in JSON: " + key + ", using default " + std::to_string(fallback));
            return fallback;
        }
        if (!j[key].is_number())
        {
            MyLogger::error("Key is not a number: " + key);
            return fallback;
        }
        return j[key].get<double>();
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.is_object() || !j.contains(key))
        {
            MyLogger::warning("Key not found in JSON: " + key + ", using default " + std::string(fallback ? "true" : "false"));
            return fallback;
        }
        if (!j[key].is_boolean())
        {
            MyLogger::error("Key is not a boolean: " + key);
            return fallback;
        }
        return j[key].get<bool>();
    }
}
