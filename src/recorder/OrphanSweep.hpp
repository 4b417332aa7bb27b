/**
 * @file OrphanSweep.hpp
 * @brief Startup cleanup of temp files left by sessions that never finished.
 *
 * A forced quit or OS crash skips both finalize and discard, leaving the
 * encoder's temp output behind. The sweep runs once before the first session
 * starts and deletes every file carrying a reserved temp suffix.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "util/Types.hpp"

namespace mc {

struct SweepReport {
    usize removed{0};
    usize failed{0};
};

class OrphanSweep {
public:
    static const std::vector<std::string>& tempSuffixes();
    static bool isTempName(std::string_view filename);

    // Never throws; failures are logged and counted
    static SweepReport run(const std::filesystem::path& directory);
};

} // namespace mc
