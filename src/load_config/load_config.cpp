#include "load_config.hpp"
#include <fstream>
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
            throw std::runtime_error("Invalid config file: " + filepath);
        }
    }

    int get_config_value(const std::string &key, const json &j, int fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return fallback;
        }
        return j[key].get<int>();
    }

    double get_config_double(const std::string &key, const json &j, double fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
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
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_boolean())
        {
            MyLogger::error("Key is not a boolean: " + key);
            return fallback;
        }
        return j[key].get<bool>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return fallback;
        }
        return j[key].get<std::string>();
    }

    std::vector<std::string> get_config_strings(const std::string &key, const json &j,
                                                const std::vector<std::string> &fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_array())
        {
            MyLogger::error("Key is not an array: " + key);
            return fallback;
        }
        std::vector<std::string> values;
        for (const auto &item : j[key])
        {
            if (!item.is_string())
            {
                MyLogger::error("Non-string entry ignored in array: " + key);
                continue;
            }
            values.push_back(item.get<std::string>());
        }
        return values;
    }
}
