#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <vector>

namespace trainer {

/**
 * @brief Pressure reading for one key as reported by the telemetry bridge
 */
struct KeySnapshot {
    uint32_t keyCode = 0;  // As reported; codes outside the practice keys are still decoys
    float analogValue = 0.0f;  // Normalized key depth [0.0, 1.0]
    bool pressed = false;
};

/**
 * @brief One complete telemetry message
 * 
 * Each frame replaces the previous one in full; keys missing from a frame
 * are not pressed. The sequence number is assigned by the connection and
 * strictly increases in delivery order.
 */
struct SnapshotFrame {
    uint32_t sequence = 0;
    std::vector<KeySnapshot> keys;
};

/**
 * @brief Find the snapshot for a key in a frame
 * @return Pointer into keys, or nullptr if the key was not reported
 */
inline const KeySnapshot* findKey(const std::vector<KeySnapshot>& keys, uint32_t keyCode) {
    for (const auto& key : keys) {
        if (key.keyCode == keyCode) {
            return &key;
        }
    }
    return nullptr;
}

inline void to_json(nlohmann::json& j, const KeySnapshot& k) {
    j = nlohmann::json{
        {"keyCode", k.keyCode},
        {"analogValue", k.analogValue},
        {"pressed", k.pressed}
    };
}

} // namespace trainer
