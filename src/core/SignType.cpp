#include "flipdot/core/SignType.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/log/Log.hpp"
#include "flipdot/protocol/Frame.hpp"

namespace flipdot {

namespace {

struct SignTypeInfo {
    SignType type;
    const char* name;
    Dimensions size;
    SignConfigBlock config;
};

const SignTypeInfo SIGN_TYPES[] = {
    {SignType::Max3000Front112x16, "Max3000Front112x16", {112, 16},
     {0x04, 0x47, 0x00, 0x0F, 0x10, 0x1C, 0x1C, 0x1C, 0x1C, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::Max3000Front98x16, "Max3000Front98x16", {98, 16},
     {0x04, 0x4D, 0x00, 0x0D, 0x10, 0x0E, 0x1C, 0x1C, 0x1C, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::Max3000Side90x7, "Max3000Side90x7", {90, 7},
     {0x04, 0x20, 0x00, 0x06, 0x07, 0x1E, 0x1E, 0x1E, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::Max3000Rear30x10, "Max3000Rear30x10", {30, 10},
     {0x04, 0x62, 0x00, 0x04, 0x0A, 0x1E, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::Max3000Rear23x10, "Max3000Rear23x10", {23, 10},
     {0x04, 0x61, 0x00, 0x04, 0x0A, 0x17, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::Max3000Dash30x7, "Max3000Dash30x7", {30, 7},
     {0x04, 0x26, 0x00, 0x03, 0x07, 0x1E, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::HorizonFront160x16, "HorizonFront160x16", {160, 16},
     {0x08, 0xB1, 0x00, 0x15, 0x0C, 0x10, 0x00, 0xA0, 0x04, 0x00, 0x28, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::HorizonFront140x16, "HorizonFront140x16", {140, 16},
     {0x08, 0xB2, 0x00, 0x12, 0x04, 0x10, 0x00, 0x8C, 0x01, 0x03, 0x14, 0x28, 0x00, 0x00, 0x00, 0x00}},
    {SignType::HorizonSide96x8, "HorizonSide96x8", {96, 8},
     {0x08, 0xB4, 0x00, 0x07, 0x0C, 0x08, 0x00, 0x60, 0x02, 0x00, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::HorizonRear48x16, "HorizonRear48x16", {48, 16},
     {0x08, 0xB5, 0x00, 0x07, 0x0C, 0x10, 0x00, 0x30, 0x01, 0x00, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00}},
    {SignType::HorizonDash40x12, "HorizonDash40x12", {40, 12},
     {0x08, 0xB9, 0x00, 0x06, 0x8C, 0x0C, 0x00, 0x28, 0x01, 0x00, 0x28, 0x00, 0x04, 0x00, 0x00, 0x00}},
};

const SignTypeInfo& infoFor(SignType type) {
    for (const auto& info : SIGN_TYPES) {
        if (info.type == type) {
            return info;
        }
    }
    return SIGN_TYPES[0];
}

} // namespace

Dimensions dimensions(SignType type) {
    return infoFor(type).size;
}

SignFamily family(SignType type) {
    return infoFor(type).config[0] == 0x04 ? SignFamily::Max3000 : SignFamily::Horizon;
}

bool isFlipDot(SignType type) {
    return family(type) == SignFamily::Max3000;
}

const char* toString(SignType type) {
    return infoFor(type).name;
}

const SignConfigBlock& configBytes(SignType type) {
    return infoFor(type).config;
}

const std::array<SignType, 11>& allSignTypes() {
    static const std::array<SignType, 11> types = {
        SignType::Max3000Front112x16, SignType::Max3000Front98x16, SignType::Max3000Side90x7,
        SignType::Max3000Rear30x10, SignType::Max3000Rear23x10, SignType::Max3000Dash30x7,
        SignType::HorizonFront160x16, SignType::HorizonFront140x16, SignType::HorizonSide96x8,
        SignType::HorizonRear48x16, SignType::HorizonDash40x12,
    };
    return types;
}

expected<SignType> signTypeFromConfig(const std::uint8_t* data, std::size_t size) {
    if (!data || size != SIGN_CONFIG_SIZE) {
        logError("[SignType] wrong config length: expected ", SIGN_CONFIG_SIZE,
                 ", got ", data ? size : 0, "\n");
        return unexpected(make_error_code(SignTypeError::WrongConfigLength));
    }

    for (const auto& info : SIGN_TYPES) {
        if (info.config[0] == data[0] && info.config[1] == data[1]) {
            return info.type;
        }
    }

    logError("[SignType] unknown config: ", protocol::toHexLine(data, size), "\n");
    return unexpected(make_error_code(SignTypeError::UnknownConfig));
}

} // namespace flipdot
