/**
 * @file EncoderLocator.hpp
 * @brief Finds the external encoder binary and discovers what it can do.
 *
 * Resolution never fails: it always yields a candidate path, and validity is
 * checked separately by ensureAvailable(). Codec discovery spawns one probe
 * process per distinct binary path; the parsed result is cached for the
 * lifetime of the process and shared by every locator instance.
 *
 * @section Dependencies
 * - QProcess (probe invocations)
 * - EncodingPlan (capability negotiation)
 *
 * @section Patterns
 * - Cache: mutex-guarded, keyed by resolved binary path.
 */

#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "EncoderSettings.hpp"
#include "EncodingPlan.hpp"
#include "util/Result.hpp"

namespace mc {

struct ResolvedEncoder {
    fs::path path;
    bool probed{false}; // found on disk by the resolver (not a bare name)
};

class EncoderLocator {
public:
    explicit EncoderLocator(EncoderSettings settings);

    ResolvedEncoder resolve() const;

    // Runs `<path> -version`; call once per session start since the
    // override may have changed in between
    Result<void> ensureAvailable(const fs::path& path) const;

    // Runs `<path> -hide_banner -encoders` at most once per path
    CodecSet availableCodecs(const fs::path& path) const;
    EncoderCapabilities capabilities(const fs::path& path) const;

    const EncoderSettings& settings() const {
        return settings_;
    }

    static CodecSet parseEncoderList(const std::string& output);
    static void clearCache();

private:
    struct CacheEntry {
        CodecSet codecs;
        EncoderCapabilities caps;
    };

    std::optional<CacheEntry> lookup(const fs::path& path) const;
    std::optional<CacheEntry> probe(const fs::path& path) const;
    std::string overrideHint() const;

    EncoderSettings settings_;

    static std::mutex cacheMutex_;
    static std::map<std::string, CacheEntry> cache_;
};

} // namespace mc
