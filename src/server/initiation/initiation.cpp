#include "initiation.hpp"
#include "common/load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include <filesystem>

namespace Initiation
{
    ServerConfig from_config(const json &config)
    {
        ServerConfig cfg;
        cfg.server_ip = ConfigReader::get_config_string("server_ip", config, cfg.server_ip);
        cfg.server_port = ConfigReader::get_config_short("server_port", config, static_cast<unsigned short>(cfg.server_port));
        cfg.output_dir = ConfigReader::get_config_string("output_dir", config, std::filesystem::current_path().string());
        cfg.api_key = ConfigReader::get_config_string("api_key", config, "");
        cfg.legacy_text_responses = ConfigReader::get_config_bool("legacy_text_responses", config, false);
        cfg.log_level = ConfigReader::get_config_string("log_level", config, cfg.log_level);
        cfg.log_file = ConfigReader::get_config_string("log_file", config, "");
        return cfg;
    }

    ServerConfig initialize(const std::string &server_config_path)
    {
        json config = ConfigReader::load(server_config_path);
        ServerConfig cfg = from_config(config);
        MyLogger::info("Successfully initialized all config parameters.");
        return cfg;
    }
}
