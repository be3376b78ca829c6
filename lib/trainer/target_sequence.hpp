#ifndef TARGET_SEQUENCE_HPP
#define TARGET_SEQUENCE_HPP

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <random>
#include <vector>

namespace trainer {

/**
 * @brief A key on the practice row and its bridge key code
 */
struct PracticeKey {
    char key;
    uint16_t keyCode;
};

/**
 * @brief Fixed home-row practice set
 */
static constexpr std::array<PracticeKey, 7> HOME_ROW_KEYS = {{
    {'a', 4},
    {'s', 22},
    {'d', 7},
    {'f', 9},
    {'j', 13},
    {'k', 14},
    {'l', 15},
}};

static constexpr size_t DEFAULT_SEQUENCE_LENGTH = 20;

/**
 * @brief One pressure target: hold this key at this percentage
 */
struct TargetSpec {
    char key = 0;
    uint16_t keyCode = 0;
    uint8_t targetPressure = 0;  // Percent of full travel
};

using Sequence = std::vector<TargetSpec>;

/**
 * @brief Allowed target pressure levels for a given level count
 * @param levelCount 2 for {50, 100}, 3 for {30, 60, 100}
 * @return Level set, or an empty vector for an unsupported count
 */
std::vector<uint8_t> pressureLevelsFor(uint8_t levelCount);

/**
 * @brief Build a randomized target sequence
 * 
 * Every element independently draws a key uniformly from HOME_ROW_KEYS and a
 * level uniformly from levels. Repeats are expected. Each call starts a fresh
 * sequence; nothing carries over from previous calls except the rng state.
 * 
 * @param levels Allowed target percentages (must not be empty)
 * @param length Number of targets
 * @param rng Random source
 * @throws std::invalid_argument if levels is empty or length is zero
 */
Sequence generateSequence(const std::vector<uint8_t>& levels, size_t length, std::mt19937& rng);

inline void to_json(nlohmann::json& j, const TargetSpec& t) {
    j = nlohmann::json{
        {"key", std::string(1, t.key)},
        {"keyCode", t.keyCode},
        {"targetPressure", t.targetPressure}
    };
}

} // namespace trainer

#endif // TARGET_SEQUENCE_HPP
