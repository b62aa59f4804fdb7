#include "brush/error.hpp"

namespace brush {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::CanvasNotFound:          return "CanvasNotFound";
        case ErrorCode::ImageNotFound:           return "ImageNotFound";
        case ErrorCode::GeometryNotFound:        return "GeometryNotFound";
        case ErrorCode::MaterialNotFound:        return "MaterialNotFound";
        case ErrorCode::LayoutNotFound:          return "LayoutNotFound";
        case ErrorCode::AttributeNotFound:       return "AttributeNotFound";
        case ErrorCode::UnsupportedPixelFormat:  return "UnsupportedPixelFormat";
        case ErrorCode::UnknownMaterialProperty: return "UnknownMaterialProperty";
        case ErrorCode::InvalidArgument:         return "InvalidArgument";
        case ErrorCode::DeviceError:             return "DeviceError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = errorCodeName(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace brush
