#include "Types.hpp"

const char* errorKindName(ePickErrorKind kind) {
    switch (kind) {
        case PICK_ERROR_CAPTURE_UNAVAILABLE: return "CaptureUnavailable";
        case PICK_ERROR_MAPPING_OUT_OF_BOUNDS: return "MappingOutOfBounds";
        case PICK_ERROR_PERSISTENCE_WRITE_FAILED: return "PersistenceWriteFailed";
        case PICK_ERROR_HOTKEY_REGISTRATION_FAILED: return "HotkeyRegistrationFailed";
        case PICK_ERROR_NO_MONITORS: return "NoMonitors";
        case PICK_ERROR_ENCODE_FAILED: return "EncodeFailed";
        case PICK_ERROR_INVALID_ARGUMENT: return "InvalidArgument";
    }

    return "Unknown";
}
