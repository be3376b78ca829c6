#include "target_sequence.hpp"
#include <stdexcept>

namespace trainer {

std::vector<uint8_t> pressureLevelsFor(uint8_t levelCount)
{
    switch (levelCount) {
        case 2:
            return {50, 100};
        case 3:
            return {30, 60, 100};
        default:
            return {};
    }
}

Sequence generateSequence(const std::vector<uint8_t>& levels, size_t length, std::mt19937& rng)
{
    if (levels.empty()) {
        throw std::invalid_argument("Pressure level set must not be empty");
    }
    if (length == 0) {
        throw std::invalid_argument("Sequence length must be positive");
    }

    std::uniform_int_distribution<size_t> keyDist(0, HOME_ROW_KEYS.size() - 1);
    std::uniform_int_distribution<size_t> levelDist(0, levels.size() - 1);

    Sequence sequence;
    sequence.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        const PracticeKey& practiceKey = HOME_ROW_KEYS[keyDist(rng)];
        TargetSpec target;
        target.key = practiceKey.key;
        target.keyCode = practiceKey.keyCode;
        target.targetPressure = levels[levelDist(rng)];
        sequence.push_back(target);
    }
    return sequence;
}

} // namespace trainer
