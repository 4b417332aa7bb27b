#include "EncodingPlan.hpp"
#include <algorithm>
#include <QtGlobal>

namespace mc {

namespace {
QString qstr(const fs::path& p) {
    return QString::fromStdString(p.string());
}
} // namespace

const std::vector<std::string>& EncodingPlan::hardwareH264Encoders() {
#if defined(Q_OS_MACOS)
    static const std::vector<std::string> encoders{"h264_videotoolbox"};
#elif defined(Q_OS_WIN)
    static const std::vector<std::string> encoders{
            "h264_mf", "h264_qsv", "h264_nvenc"};
#else
    static const std::vector<std::string> encoders{"h264_nvenc",
                                                   "h264_v4l2m2m"};
#endif
    return encoders;
}

bool EncodingPlan::isHardwareH264(const std::string& codec) {
    const auto& hw = hardwareH264Encoders();
    return std::find(hw.begin(), hw.end(), codec) != hw.end();
}

std::string EncodingPlan::chooseVideoCodec(const CodecSet& available) {
    if (available.contains(kSoftwareH264))
        return kSoftwareH264;
    for (const auto& hw : hardwareH264Encoders()) {
        if (available.contains(hw))
            return hw;
    }
    // mpeg4 ships with every ffmpeg build, so it is used even when the
    // probe failed to list it
    return kFallbackVideo;
}

std::optional<std::string> EncodingPlan::chooseAudioCodec(
        const CodecSet& available) {
    if (available.contains(kAudio))
        return std::string(kAudio);
    return std::nullopt;
}

EncoderCapabilities EncodingPlan::negotiate(const CodecSet& available) {
    return EncoderCapabilities{chooseVideoCodec(available),
                               chooseAudioCodec(available)};
}

QStringList EncodingPlan::codecArgs(const EncoderCapabilities& caps) {
    QStringList args;
    args << "-c:v" << QString::fromStdString(caps.videoCodec);

    if (caps.videoCodec == kSoftwareH264) {
        args << "-preset" << "veryfast" << "-crf" << "23";
    } else if (isHardwareH264(caps.videoCodec)) {
        args << "-b:v" << "4M";
    } else {
        args << "-q:v" << "5";
    }
    args << "-pix_fmt" << "yuv420p";

    if (caps.audioCodec) {
        args << "-c:a" << QString::fromStdString(*caps.audioCodec) << "-b:a"
             << "128k";
    } else {
        args << "-an";
    }
    return args;
}

QStringList EncodingPlan::buildArgs(const EncoderCapabilities& caps,
                                    InputShape shape,
                                    const fs::path& input,
                                    const fs::path& output) {
    QStringList args{"-hide_banner", "-loglevel", "warning"};

    switch (shape) {
    case InputShape::LiveStream:
        // Chunks arrive without a seekable header or reliable timestamps
        args << "-fflags" << "+genpts" << "-f" << "matroska" << "-i"
             << "pipe:0";
        args << codecArgs(caps);
        args << "-movflags" << "+faststart" << "-f" << "mp4" << "-y"
             << qstr(output);
        break;
    case InputShape::File:
        args << "-y" << "-i" << qstr(input);
        args << codecArgs(caps);
        args << "-movflags" << "+faststart" << "-f" << "mp4" << qstr(output);
        break;
    }
    return args;
}

} // namespace mc
