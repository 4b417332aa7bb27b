/**
 * @file EncodingPlan.hpp
 * @brief Codec negotiation and encoder argument construction.
 *
 * Turns the codec set reported by an encoder binary into an
 * EncoderCapabilities value, and an EncoderCapabilities value into the full
 * argument list for one of the two invocation shapes the pipeline uses:
 * streaming a live capture from stdin, or re-encoding an existing file.
 *
 * @section Dependencies
 * - QStringList (QProcess argument lists)
 */

#pragma once
#include <QStringList>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mc {

namespace fs = std::filesystem;

using CodecSet = std::set<std::string>;

// Negotiated per encoder binary; opaque to callers beyond the two names
struct EncoderCapabilities {
    std::string videoCodec;
    std::optional<std::string> audioCodec;

    bool operator==(const EncoderCapabilities&) const = default;
};

enum class InputShape {
    LiveStream, // headerless Matroska/WebM on stdin
    File        // existing file on disk
};

class EncodingPlan {
public:
    static constexpr const char* kSoftwareH264 = "libx264";
    static constexpr const char* kFallbackVideo = "mpeg4";
    static constexpr const char* kAudio = "aac";

    // Hardware H.264 encoders worth trying on this platform, in order
    static const std::vector<std::string>& hardwareH264Encoders();

    static std::string chooseVideoCodec(const CodecSet& available);
    static std::optional<std::string> chooseAudioCodec(const CodecSet& available);
    static EncoderCapabilities negotiate(const CodecSet& available);

    static QStringList codecArgs(const EncoderCapabilities& caps);

    // Output is always MP4 with the moov atom moved to the front
    static QStringList buildArgs(const EncoderCapabilities& caps,
                                 InputShape shape,
                                 const fs::path& input,
                                 const fs::path& output);

    static bool isHardwareH264(const std::string& codec);
};

} // namespace mc
