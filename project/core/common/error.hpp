// core/common/error.hpp
#pragma once
#include <string>

enum class ErrorKind {
    None,

    // initialization: fatal, reported once
    BackendUnavailable,
    NoSuitableAdapter,
    SurfaceConfigurationError,

    // per frame: recovered locally
    SurfaceLost,
    Timeout,
    ValidationFailed,

    // zero-area surface, deferred no-op
    ResizeDegenerate,
};

struct Error {
    ErrorKind   kind{ErrorKind::None};
    std::string message{};
};

inline bool is_initialization_error(ErrorKind k)
{
    return k == ErrorKind::BackendUnavailable ||
           k == ErrorKind::NoSuitableAdapter  ||
           k == ErrorKind::SurfaceConfigurationError;
}

inline bool is_transient_frame_error(ErrorKind k)
{
    return k == ErrorKind::SurfaceLost ||
           k == ErrorKind::Timeout     ||
           k == ErrorKind::ValidationFailed;
}

inline const char* error_kind_name(ErrorKind k)
{
    switch (k) {
    case ErrorKind::None:                      return "None";
    case ErrorKind::BackendUnavailable:        return "BackendUnavailable";
    case ErrorKind::NoSuitableAdapter:         return "NoSuitableAdapter";
    case ErrorKind::SurfaceConfigurationError: return "SurfaceConfigurationError";
    case ErrorKind::SurfaceLost:               return "SurfaceLost";
    case ErrorKind::Timeout:                   return "Timeout";
    case ErrorKind::ValidationFailed:          return "ValidationFailed";
    case ErrorKind::ResizeDegenerate:          return "ResizeDegenerate";
    }
    return "Unknown";
}
