#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

bool load_config_from_csv(SellManager::Config::SystemConfig& cfg, const std::string& csv_path);
int load_system_config(SellManager::Config::SystemConfig& config, const std::string& config_directory = "config");
bool validate_config(const SellManager::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
