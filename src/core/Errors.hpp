/**
 * @file Errors.hpp
 * @brief Error codes reported by the capture pipeline through Result<T>.
 */

#pragma once
#include <string_view>
#include "util/Types.hpp"

namespace mc {

enum class RecorderError : i32 {
    None = 0,
    EncoderUnavailable,  // encoder binary missing or not runnable
    NoActiveSession,     // stop for a meeting that is not recording
    EmptyRecording,      // stop before any chunk was accepted
    FinalizeTimeout,     // encoder did not exit after end of input
    EncoderNonZeroExit,  // encoder failed or crashed
    WriteFailed,         // stdin write failed for a reason other than EPIPE
    InvalidOutput,       // encoder exited cleanly but left no usable file
    InvalidFilename,     // final filename is not a plain name
    FilesystemError
};

constexpr std::string_view toString(RecorderError e) {
    switch (e) {
    case RecorderError::None: return "None";
    case RecorderError::EncoderUnavailable: return "EncoderUnavailable";
    case RecorderError::NoActiveSession: return "NoActiveSession";
    case RecorderError::EmptyRecording: return "EmptyRecording";
    case RecorderError::FinalizeTimeout: return "FinalizeTimeout";
    case RecorderError::EncoderNonZeroExit: return "EncoderNonZeroExit";
    case RecorderError::WriteFailed: return "WriteFailed";
    case RecorderError::InvalidOutput: return "InvalidOutput";
    case RecorderError::InvalidFilename: return "InvalidFilename";
    case RecorderError::FilesystemError: return "FilesystemError";
    }
    return "Unknown";
}

} // namespace mc
