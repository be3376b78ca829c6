#pragma once

#include "config_storage.hpp"
#include <log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>
#include <utility>

namespace features {

/**
 * @brief Loads trainer configuration from a JSON file
 * 
 * A missing or unparseable file is not an error: the defaults are kept and
 * loadConfig() reports false. Values that parse but are out of range are
 * replaced with defaults.
 */
class FilesystemConfigStorage : public ConfigStorage {
public:
    explicit FilesystemConfigStorage(std::string path = "trainer.json")
        : path_(std::move(path)) {}

    bool loadConfig(trainer::TrainerConfig& config) override {
        std::ifstream file(path_);
        if (!file.is_open()) {
            logInfo("Config %s not found, using defaults", path_.c_str());
            config = trainer::TrainerConfig();
            return false;
        }

        try {
            nlohmann::json j;
            file >> j;
            config = j.get<trainer::TrainerConfig>();
        } catch (const std::exception& e) {
            logError("Error loading config %s: %s", path_.c_str(), e.what());
            config = trainer::TrainerConfig();
            return false;
        }

        config.sanitize();
        logInfo("Loaded config from %s", path_.c_str());
        return true;
    }

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

} // namespace features
