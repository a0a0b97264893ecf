#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Initiation
{
    struct ServerConfig
    {
        std::string server_ip = "localhost";
        int server_port = 3000;
        std::string output_dir;       // empty: current directory
        std::string api_key;          // empty: generated at startup
        bool legacy_text_responses = false;
        std::string log_level = "info";
        std::string log_file;
    };

    ServerConfig from_config(const json &config);

    // Loads the config file; throws std::runtime_error when it is unreadable.
    ServerConfig initialize(const std::string &server_config_path);
}
