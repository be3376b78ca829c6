#include "telemetry_decoder.hpp"
#include <log.hpp>
#include <algorithm>
#include <limits>
#include <utility>

namespace trainer {

TelemetryDecoder::TelemetryDecoder(SnapshotCallback onSnapshot)
    : onSnapshot(std::move(onSnapshot))
{
}

void TelemetryDecoder::process(char c)
{
    // Group grammar:
    //   '(' DIGITS ':' DECIMAL ':' DIGITS ')'
    //   DECIMAL = digits with at most one '.', value within [0, 1]
    //
    // '(' restarts the grammar from any state. Any other unexpected character
    // abandons the current group and waits for the next '('.

    if (c == GROUP_OPEN) {
        beginGroup();
        return;
    }

    switch (decoderState) {
        case Outside:
            // Text between groups carries no meaning
            break;

        case KeyCode:
            if (isDigit(c)) {
                keyCodeHasDigit = true;
                if (!accumulateKeyCode(keyCode, c)) {
                    logDebug("Dropping telemetry group: key code overflows");
                    decoderState = Outside;
                }
            } else if (c == FIELD_SEPARATOR && keyCodeHasDigit) {
                decoderState = AnalogValue;
            } else {
                decoderState = Outside;
            }
            break;

        case AnalogValue:
            if (c == FIELD_SEPARATOR && analogHasDigit) {
                decoderState = PressedFlag;
            } else if (analogLength >= MAX_ANALOG_CHARS) {
                decoderState = Outside;
            } else if (isDigit(c)) {
                analogMantissa = analogMantissa * 10 + static_cast<uint64_t>(c - '0');
                if (analogHasPoint) {
                    analogFractionDigits++;
                }
                analogLength++;
                analogHasDigit = true;
            } else if (c == DECIMAL_POINT && !analogHasPoint) {
                analogLength++;
                analogHasPoint = true;
            } else {
                decoderState = Outside;
            }
            break;

        case PressedFlag:
            if (isDigit(c)) {
                pressedFlagHasDigit = true;
                accumulateFlag(pressedFlag, c);
            } else if (c == GROUP_CLOSE && pressedFlagHasDigit) {
                finishGroup();
                decoderState = Outside;
            } else {
                decoderState = Outside;
            }
            break;
    }
}

void TelemetryDecoder::reset()
{
    decoderState = Outside;
}

std::vector<KeySnapshot> TelemetryDecoder::decode(const std::string& payload)
{
    std::vector<KeySnapshot> snapshots;
    TelemetryDecoder decoder([&snapshots](const KeySnapshot& snapshot) {
        snapshots.push_back(snapshot);
    });

    for (char c : payload) {
        decoder.process(c);
    }
    return snapshots;
}

void TelemetryDecoder::beginGroup()
{
    decoderState = KeyCode;
    keyCode = 0;
    keyCodeHasDigit = false;
    analogMantissa = 0;
    analogFractionDigits = 0;
    analogLength = 0;
    analogHasDigit = false;
    analogHasPoint = false;
    pressedFlag = 0;
    pressedFlagHasDigit = false;
}

void TelemetryDecoder::finishGroup()
{
    double value = analogValue();
    if (value > 1.0) {
        logDebug("Dropping telemetry group for key %u: analog value %.3f out of range",
                 static_cast<unsigned>(keyCode), value);
        return;
    }

    KeySnapshot snapshot;
    snapshot.keyCode = keyCode;
    snapshot.analogValue = static_cast<float>(value);
    snapshot.pressed = (pressedFlag == PRESSED_FLAG);
    onSnapshot(snapshot);
}

bool TelemetryDecoder::isDigit(char c)
{
    return c >= '0' && c <= '9';
}

double TelemetryDecoder::analogValue() const
{
    // At most 15 digits, so mantissa and scale are exact in a double
    double scale = 1.0;
    for (uint8_t i = 0; i < analogFractionDigits; ++i) {
        scale *= 10.0;
    }
    return static_cast<double>(analogMantissa) / scale;
}

bool TelemetryDecoder::accumulateKeyCode(uint32_t& value, char c)
{
    uint32_t digit = static_cast<uint32_t>(c - '0');
    if (value > (std::numeric_limits<uint32_t>::max() - digit) / 10) {
        return false;
    }
    value = value * 10 + digit;
    return true;
}

void TelemetryDecoder::accumulateFlag(uint32_t& value, char c)
{
    // Only "is it exactly 1" matters, so anything larger collapses to 2
    value = std::min<uint32_t>(value * 10 + static_cast<uint32_t>(c - '0'), PRESSED_FLAG + 1);
}

} // namespace trainer
