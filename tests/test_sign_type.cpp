#include "flipdot/core/Errors.hpp"
#include "flipdot/core/SignType.hpp"

#include "TestSupport.hpp"

#include <vector>

using namespace flipdot;

static void testCatalogue() {
    for (auto type : allSignTypes()) {
        const auto& block = configBytes(type);
        auto parsed = signTypeFromConfig(std::vector<std::uint8_t>(block.begin(), block.end()));
        ASSERT_TRUE(parsed.has_value(), toString(type));
        ASSERT_TRUE(parsed && *parsed == type, toString(type));
    }

    ASSERT_TRUE(dimensions(SignType::Max3000Side90x7) == (Dimensions{90, 7}), "side sign size");
    ASSERT_TRUE(dimensions(SignType::HorizonFront140x16) == (Dimensions{140, 16}), "horizon front size");
    ASSERT_TRUE(dimensions(SignType::Max3000Rear23x10) == (Dimensions{23, 10}), "rear sign size");
    ASSERT_TRUE(family(SignType::Max3000Dash30x7) == SignFamily::Max3000, "max3000 family");
    ASSERT_TRUE(family(SignType::HorizonDash40x12) == SignFamily::Horizon, "horizon family");
    ASSERT_TRUE(isFlipDot(SignType::Max3000Front112x16), "max3000 is flip-dot");
    ASSERT_TRUE(!isFlipDot(SignType::HorizonSide96x8), "horizon is LED");
}

static void testKnownBlock() {
    const std::vector<std::uint8_t> rear = {
        0x04, 0x62, 0x00, 0x04, 0x0A, 0x1E, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    auto parsed = signTypeFromConfig(rear);
    ASSERT_TRUE(parsed && *parsed == SignType::Max3000Rear30x10, "30x10 rear sign");
}

static void testParseErrors() {
    const std::vector<std::uint8_t> shortBlock(15, 0x00);
    ASSERT_EQ(test_support::errorOf(signTypeFromConfig(shortBlock)),
              make_error_code(SignTypeError::WrongConfigLength), "15 bytes");

    const std::vector<std::uint8_t> longBlock(17, 0x00);
    ASSERT_EQ(test_support::errorOf(signTypeFromConfig(longBlock)),
              make_error_code(SignTypeError::WrongConfigLength), "17 bytes");

    std::vector<std::uint8_t> unknown(16, 0x00);
    unknown[0] = 0x04;
    unknown[1] = 0x99;
    ASSERT_EQ(test_support::errorOf(signTypeFromConfig(unknown)),
              make_error_code(SignTypeError::UnknownConfig), "unknown model id");
}

int main() {
    testCatalogue();
    testKnownBlock();
    testParseErrors();
    return test_support::finish("SignType");
}
