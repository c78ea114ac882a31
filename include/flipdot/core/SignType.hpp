#pragma once

#include "flipdot/core/Expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace flipdot {

/// Sign models whose configuration block is known.
enum class SignType : std::uint8_t {
    Max3000Front112x16,
    Max3000Front98x16,
    Max3000Side90x7,
    Max3000Rear30x10,
    Max3000Rear23x10,
    Max3000Dash30x7,
    HorizonFront160x16,
    HorizonFront140x16,
    HorizonSide96x8,
    HorizonRear48x16,
    HorizonDash40x12,
};

/// Max3000 units are electromechanical flip-dot panels, Horizon units are LED.
enum class SignFamily : std::uint8_t {
    Max3000,
    Horizon,
};

struct Dimensions {
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    bool operator==(const Dimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

constexpr std::size_t SIGN_CONFIG_SIZE = 16;
using SignConfigBlock = std::array<std::uint8_t, SIGN_CONFIG_SIZE>;

Dimensions dimensions(SignType type);
SignFamily family(SignType type);

/// Flip-dot families need their coils driven, so the loaded page is switched in explicitly.
bool isFlipDot(SignType type);

const char* toString(SignType type);

/**
 * @brief The 16-byte configuration block a sign expects during configure().
 *
 * Byte 0 selects the family (0x04 Max3000, 0x08 Horizon) and byte 1 the model.
 * The remaining bytes describe panel geometry in a family-specific layout.
 */
const SignConfigBlock& configBytes(SignType type);

/// Every known sign type, in declaration order.
const std::array<SignType, 11>& allSignTypes();

/**
 * @brief Identify a sign from its configuration block.
 *
 * Fails with SignTypeError::WrongConfigLength unless exactly 16 bytes are
 * given, or SignTypeError::UnknownConfig when the family/model pair is not in
 * the catalogue.
 */
expected<SignType> signTypeFromConfig(const std::uint8_t* data, std::size_t size);

inline expected<SignType> signTypeFromConfig(const std::vector<std::uint8_t>& bytes) {
    return signTypeFromConfig(bytes.data(), bytes.size());
}

} // namespace flipdot
