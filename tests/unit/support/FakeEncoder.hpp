/**
 * @file FakeEncoder.hpp
 * @brief Shell script standing in for ffmpeg in encoder-dependent tests.
 *
 * The script answers `-version` and `-encoders`, copies stdin to the last
 * argument for live invocations and copies the `-i` input to the last
 * argument for file invocations. Every invocation is appended to a log so
 * tests can count how often the encoder ran.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mc::test {

namespace fs = std::filesystem;

struct FakeEncoderOptions {
    std::vector<std::string> encoders{"libx264", "aac"};
    int exitCode{0};
    int stderrLines{0};
    bool failVersion{false};
    bool hang{false};          // keep running after stdin closes
    bool stallInput{false};    // never read stdin on live invocations
    int exitAfterBytes{-1};    // live invocations stop reading after N bytes
    bool failTranscode{false}; // file invocations exit 1 without output
    int transcodeDelayMs{0};
};

class FakeEncoder {
public:
    FakeEncoder(const fs::path& dir, FakeEncoderOptions options = {});

    const fs::path& path() const {
        return path_;
    }
    const fs::path& logPath() const {
        return logPath_;
    }

    std::vector<std::string> invocations() const;
    std::size_t countInvocations(std::string_view needle) const;

private:
    fs::path path_;
    fs::path logPath_;
};

} // namespace mc::test
