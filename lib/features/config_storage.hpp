#pragma once

#include <trainer_config.hpp>

namespace features {

/**
 * @brief Interface for loading trainer configuration
 * 
 * Platform-specific implementations decide where configuration lives
 * (a JSON file, compiled-in defaults, etc.)
 */
class ConfigStorage {
public:
    virtual ~ConfigStorage() = default;

    /**
     * @brief Load configuration
     * @param config Receives the loaded values; left at defaults on failure
     * @return true if stored configuration was found and parsed
     */
    virtual bool loadConfig(trainer::TrainerConfig& config) = 0;
};

} // namespace features
