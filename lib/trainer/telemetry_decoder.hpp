#ifndef TELEMETRY_DECODER_HPP
#define TELEMETRY_DECODER_HPP

#include "key_snapshot.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace trainer {

  // Wire format constants
  static constexpr char GROUP_OPEN = '(';
  static constexpr char GROUP_CLOSE = ')';
  static constexpr char FIELD_SEPARATOR = ':';
  static constexpr char DECIMAL_POINT = '.';
  static constexpr uint8_t MAX_ANALOG_CHARS = 15;
  static constexpr uint32_t PRESSED_FLAG = 1;

  /**
   * @brief Character-level parser for analog keyboard telemetry
   * 
   * Parses the bridge's textual format, a concatenation of groups shaped
   * (keyCode:analogValue:pressedFlag), and reports one KeySnapshot per
   * well-formed group. Malformed groups are dropped without error. An opening
   * parenthesis always starts a new group, discarding any partial one, so a
   * truncated group never swallows the group that follows it.
   * 
   * Numbers are parsed by hand, independent of the C locale, so a host that
   * switches LC_NUMERIC to a comma decimal separator still reads "0.61".
   * A key code that does not fit in 32 bits is the only numeric overflow
   * that drops a group; pressed flags of any size simply read as not pressed.
   */
  class TelemetryDecoder {
  public:
    using SnapshotCallback = std::function<void(const KeySnapshot&)>;

    /**
     * @brief Construct a decoder
     * @param onSnapshot Called once for every complete, valid group
     */
    explicit TelemetryDecoder(SnapshotCallback onSnapshot);

    TelemetryDecoder(TelemetryDecoder&& other) = default;
    TelemetryDecoder& operator=(TelemetryDecoder&& other) = default;
    TelemetryDecoder(const TelemetryDecoder&) = delete;
    TelemetryDecoder& operator=(const TelemetryDecoder&) = delete;

    /**
     * @brief Process a single character of telemetry text
     */
    void process(char c);

    /**
     * @brief Discard any partially parsed group
     */
    void reset();

    /**
     * @brief Decode one complete telemetry message
     * @param payload Message text
     * @return Snapshots for every valid group, in payload order (empty if none)
     */
    static std::vector<KeySnapshot> decode(const std::string& payload);

  private:
    SnapshotCallback onSnapshot;

    enum DecoderState {
        Outside,      // Between groups; only '(' is significant
        KeyCode,      // Reading keyCode digits
        AnalogValue,  // Reading analog decimal
        PressedFlag,  // Reading pressed flag digits
    };
    DecoderState decoderState = Outside;

    uint32_t keyCode = 0;
    bool keyCodeHasDigit = false;
    uint64_t analogMantissa = 0;     // Analog digits with the point removed
    uint8_t analogFractionDigits = 0;
    uint8_t analogLength = 0;
    bool analogHasDigit = false;
    bool analogHasPoint = false;
    uint32_t pressedFlag = 0;        // Saturates just above PRESSED_FLAG
    bool pressedFlagHasDigit = false;

    void beginGroup();
    void finishGroup();
    double analogValue() const;
    static bool isDigit(char c);
    static bool accumulateKeyCode(uint32_t& value, char c);
    static void accumulateFlag(uint32_t& value, char c);
  };

} // namespace trainer

#endif // TELEMETRY_DECODER_HPP
