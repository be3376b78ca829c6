#include <unity.h>
#include <telemetry_decoder.hpp>
#include <clocale>
#include <string>
#include <vector>

void setUp(void) {
    // Unity setUp - currently not used, keeping for potential future use
}

void tearDown(void) {
    // Unity tearDown - currently not used, keeping for potential future use
}

void test_decode_singleGroup_shouldProduceOneSnapshot(void) {
    // Act
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode("(9:0.61:1)");

    // Assert
    TEST_ASSERT_EQUAL_size_t_MESSAGE(1, keys.size(), "One group should give one snapshot");
    TEST_ASSERT_EQUAL_UINT16(9, keys[0].keyCode);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.61f, keys[0].analogValue);
    TEST_ASSERT_TRUE(keys[0].pressed);
}

void test_decode_concatenatedGroups_shouldPreserveOrder(void) {
    // Act
    std::vector<trainer::KeySnapshot> keys =
        trainer::TelemetryDecoder::decode("(4:0.25:1)(22:0.9:0)(15:1:1)");

    // Assert
    TEST_ASSERT_EQUAL_size_t(3, keys.size());
    TEST_ASSERT_EQUAL_UINT16(4, keys[0].keyCode);
    TEST_ASSERT_EQUAL_UINT16(22, keys[1].keyCode);
    TEST_ASSERT_FALSE_MESSAGE(keys[1].pressed, "Pressed flag 0 should mean released");
    TEST_ASSERT_EQUAL_UINT16(15, keys[2].keyCode);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, keys[2].analogValue);
}

void test_decode_textBetweenGroups_shouldBeIgnored(void) {
    std::vector<trainer::KeySnapshot> keys =
        trainer::TelemetryDecoder::decode("keys: (4:0.5:1), (7:0.125:1)\r");

    TEST_ASSERT_EQUAL_size_t(2, keys.size());
    TEST_ASSERT_EQUAL_UINT16(7, keys[1].keyCode);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.125f, keys[1].analogValue);
}

void test_decode_emptyPayload_shouldProduceNoSnapshots(void) {
    TEST_ASSERT_EQUAL_size_t(0, trainer::TelemetryDecoder::decode("").size());
    TEST_ASSERT_EQUAL_size_t(0, trainer::TelemetryDecoder::decode("no keys here").size());
}

void test_decode_truncatedTrailingGroup_shouldBeIgnored(void) {
    // Arrange - the second group is cut off at each possible position
    const char* payloads[] = {
        "(9:0.61:1)(",
        "(9:0.61:1)(4",
        "(9:0.61:1)(4:",
        "(9:0.61:1)(4:0.",
        "(9:0.61:1)(4:0.5:",
        "(9:0.61:1)(4:0.5:1",
    };

    for (const char* payload : payloads) {
        // Act
        std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode(payload);

        // Assert
        TEST_ASSERT_EQUAL_size_t_MESSAGE(1, keys.size(), payload);
        TEST_ASSERT_EQUAL_UINT16(9, keys[0].keyCode);
    }
}

void test_decode_partialGroupFollowedByGroup_shouldKeepTheCompleteOne(void) {
    // An opening parenthesis restarts parsing, so the cut-off group cannot swallow the next
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode("(4:0.3(13:0.4:1)");

    TEST_ASSERT_EQUAL_size_t(1, keys.size());
    TEST_ASSERT_EQUAL_UINT16(13, keys[0].keyCode);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.4f, keys[0].analogValue);
}

void test_decode_malformedGroups_shouldBeSkipped(void) {
    // Arrange - one valid group surrounded by malformed ones
    std::string payload =
        "(:0.5:1)"      // missing key code
        "(4::1)"        // missing analog value
        "(4:0.5:)"      // missing pressed flag
        "(x:0.5:1)"     // non-numeric key code
        "(4:0.5.1:1)"   // two decimal points
        "(4:-0.5:1)"    // sign not allowed
        "(4:1.5:1)"     // analog value above 1
        "(4294967296:0.5:1)" // key code overflows 32 bits
        "(4:0.5:1:2)"   // extra field
        "(14:0.75:1)";  // valid

    // Act
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode(payload);

    // Assert
    TEST_ASSERT_EQUAL_size_t_MESSAGE(1, keys.size(), "Only the valid group should decode");
    TEST_ASSERT_EQUAL_UINT16(14, keys[0].keyCode);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.75f, keys[0].analogValue);
}

void test_decode_pressedFlagOtherThanOne_shouldNotBePressed(void) {
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode("(4:0.5:2)(7:0.5:01)");

    TEST_ASSERT_EQUAL_size_t(2, keys.size());
    TEST_ASSERT_FALSE(keys[0].pressed);
    TEST_ASSERT_TRUE_MESSAGE(keys[1].pressed, "Leading zeros should still read as 1");
}

void test_decode_analogWithoutLeadingDigit_shouldParse(void) {
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode("(9:.5:1)(9:0:0)");

    TEST_ASSERT_EQUAL_size_t(2, keys.size());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.5f, keys[0].analogValue);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, keys[1].analogValue);
}

void test_process_byteAtATime_shouldReportEachGroupWhenClosed(void) {
    // Arrange
    std::vector<trainer::KeySnapshot> received;
    trainer::TelemetryDecoder decoder([&received](const trainer::KeySnapshot& snapshot) {
        received.push_back(snapshot);
    });
    std::string payload = "(9:0.61:1)(22:0.9:1)";

    // Act & Assert - nothing is reported before the closing parenthesis
    for (size_t i = 0; i < 9; ++i) {
        decoder.process(payload[i]);
    }
    TEST_ASSERT_EQUAL_size_t(0, received.size());

    decoder.process(payload[9]);
    TEST_ASSERT_EQUAL_size_t(1, received.size());

    for (size_t i = 10; i < payload.size(); ++i) {
        decoder.process(payload[i]);
    }
    TEST_ASSERT_EQUAL_size_t(2, received.size());
    TEST_ASSERT_EQUAL_UINT16(22, received[1].keyCode);
}

void test_reset_shouldDiscardPartialGroup(void) {
    // Arrange
    int count = 0;
    trainer::TelemetryDecoder decoder([&count](const trainer::KeySnapshot&) { count++; });

    // Act - a group split by reset() must not complete
    for (char c : std::string("(9:0.6")) {
        decoder.process(c);
    }
    decoder.reset();
    for (char c : std::string(":1)")) {
        decoder.process(c);
    }

    // Assert
    TEST_ASSERT_EQUAL_INT(0, count);
}

void test_decode_largeKeyCodeAndFlag_shouldStillDecode(void) {
    // Arrange - fields above 16 bits are still well-formed integers
    std::string payload = "(70000:0.5:1)(9:0.5:70000)(9:0.5:1)";

    // Act
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode(payload);

    // Assert
    TEST_ASSERT_EQUAL_size_t_MESSAGE(3, keys.size(), "Every well-formed group should decode");
    TEST_ASSERT_EQUAL_UINT32(70000, keys[0].keyCode);
    TEST_ASSERT_TRUE(keys[0].pressed);
    TEST_ASSERT_EQUAL_UINT32(9, keys[1].keyCode);
    TEST_ASSERT_FALSE_MESSAGE(keys[1].pressed, "Only a flag of exactly 1 means pressed");
    TEST_ASSERT_TRUE(keys[2].pressed);
}

void test_decode_veryLongPressedFlag_shouldNotBePressed(void) {
    std::vector<trainer::KeySnapshot> keys =
        trainer::TelemetryDecoder::decode("(9:0.5:100000000000000000000)(9:0.5:0000000000001)");

    TEST_ASSERT_EQUAL_size_t(2, keys.size());
    TEST_ASSERT_FALSE(keys[0].pressed);
    TEST_ASSERT_TRUE(keys[1].pressed);
}

void test_decode_commaDecimalLocale_shouldStillReadPoint(void) {
    // Arrange - switch to any installed locale with a comma decimal separator
    const char* commaLocales[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8", "ru_RU.UTF-8"};
    for (const char* name : commaLocales) {
        if (std::setlocale(LC_NUMERIC, name) != nullptr) {
            break;
        }
    }

    // Act
    std::vector<trainer::KeySnapshot> keys = trainer::TelemetryDecoder::decode("(9:0.61:1)(9:1:1)(9:.125:0)");
    std::setlocale(LC_NUMERIC, "C");

    // Assert
    TEST_ASSERT_EQUAL_size_t(3, keys.size());
    TEST_ASSERT_FLOAT_WITHIN(0.00001f, 0.61f, keys[0].analogValue);
    TEST_ASSERT_FLOAT_WITHIN(0.00001f, 1.0f, keys[1].analogValue);
    TEST_ASSERT_FLOAT_WITHIN(0.00001f, 0.125f, keys[2].analogValue);
}

void test_decode_analogJustAboveOne_shouldBeDropped(void) {
    std::vector<trainer::KeySnapshot> keys =
        trainer::TelemetryDecoder::decode("(9:1.0000001:1)(9:1.000:1)(9:0.9999999:1)");

    TEST_ASSERT_EQUAL_size_t(2, keys.size());
    TEST_ASSERT_FLOAT_WITHIN(0.00001f, 1.0f, keys[0].analogValue);
    TEST_ASSERT_FLOAT_WITHIN(0.00001f, 0.9999999f, keys[1].analogValue);
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_decode_singleGroup_shouldProduceOneSnapshot);
    RUN_TEST(test_decode_concatenatedGroups_shouldPreserveOrder);
    RUN_TEST(test_decode_textBetweenGroups_shouldBeIgnored);
    RUN_TEST(test_decode_emptyPayload_shouldProduceNoSnapshots);
    RUN_TEST(test_decode_truncatedTrailingGroup_shouldBeIgnored);
    RUN_TEST(test_decode_partialGroupFollowedByGroup_shouldKeepTheCompleteOne);
    RUN_TEST(test_decode_malformedGroups_shouldBeSkipped);
    RUN_TEST(test_decode_pressedFlagOtherThanOne_shouldNotBePressed);
    RUN_TEST(test_decode_analogWithoutLeadingDigit_shouldParse);
    RUN_TEST(test_process_byteAtATime_shouldReportEachGroupWhenClosed);
    RUN_TEST(test_reset_shouldDiscardPartialGroup);
    RUN_TEST(test_decode_largeKeyCodeAndFlag_shouldStillDecode);
    RUN_TEST(test_decode_veryLongPressedFlag_shouldNotBePressed);
    RUN_TEST(test_decode_commaDecimalLocale_shouldStillReadPoint);
    RUN_TEST(test_decode_analogJustAboveOne_shouldBeDropped);
    return UNITY_END();
}

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
