/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace mc {

class ConfigParsers {
public:
    static void parseEncoder(const toml::table& tbl, EncoderConfig& cfg);
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);
    static void parsePlayback(const toml::table& tbl, PlaybackConfig& cfg);
    static void parseNaming(const toml::table& tbl, NamingConfig& cfg);

    static toml::table serialize(const EncoderConfig& encoder,
                                 const RecordingConfig& recording,
                                 const PlaybackConfig& playback,
                                 const NamingConfig& naming,
                                 bool debug);
};

} // namespace mc
