#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    json load(const std::string &filepath);
    int get_config_value(const std::string &key, const json &j, int fallback = 0);
    double get_config_double(const std::string &key, const json &j, double fallback = 0.0);
    bool get_config_bool(const std::string &key, const json &j, bool fallback = false);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
    std::vector<std::string> get_config_strings(const std::string &key, const json &j,
                                                const std::vector<std::string> &fallback = {});
};

#endif // LOAD_CONFIG_HPP
