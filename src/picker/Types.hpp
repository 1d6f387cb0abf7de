#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

enum ePickErrorKind : uint8_t {
    PICK_ERROR_CAPTURE_UNAVAILABLE = 0,
    PICK_ERROR_MAPPING_OUT_OF_BOUNDS,
    PICK_ERROR_PERSISTENCE_WRITE_FAILED,
    PICK_ERROR_HOTKEY_REGISTRATION_FAILED,
    PICK_ERROR_NO_MONITORS,
    PICK_ERROR_ENCODE_FAILED,
    PICK_ERROR_INVALID_ARGUMENT,
};

struct SPickError {
    ePickErrorKind kind = PICK_ERROR_CAPTURE_UNAVAILABLE;
    std::string    message;
};

const char* errorKindName(ePickErrorKind kind);

template <typename T>
using CPickResult = std::expected<T, SPickError>;

inline std::unexpected<SPickError> pickError(ePickErrorKind kind, std::string message) {
    return std::unexpected(SPickError{.kind = kind, .message = std::move(message)});
}

using RGB = std::array<uint8_t, 3>;

// Device pixel coordinate relative to the top-left of one monitor
struct SScreenPoint {
    int  monitor = -1;
    int  x       = 0;
    int  y       = 0;

    bool operator==(const SScreenPoint&) const = default;
};

struct SColorSample {
    std::string  hex;
    RGB          rgb = {0, 0, 0};
    SScreenPoint source;
};

// What the rest of the desktop gets to see once a pick is confirmed.
// x and y are global logical desktop coordinates.
struct SColorInfo {
    std::string hex;
    RGB         rgb = {0, 0, 0};
    int         x   = 0;
    int         y   = 0;
};

struct SPreviewFrame {
    std::vector<uint8_t> image; // PNG
    int                  width  = 0;
    int                  height = 0;
    SColorSample         center;
};
