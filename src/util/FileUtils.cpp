#include "FileUtils.hpp"
#include <QStandardPaths>
#include <QString>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace mc::file {

namespace {
fs::path standardDir(QStandardPaths::StandardLocation location) {
    auto base = QStandardPaths::writableLocation(location).toStdString();
    if (base.empty()) {
        base = fs::temp_directory_path().string();
    }
    return fs::path(base) / kAppDirName;
}
} // namespace

fs::path configDir() {
    return standardDir(QStandardPaths::GenericConfigLocation);
}

fs::path cacheDir() {
    return standardDir(QStandardPaths::GenericCacheLocation);
}

fs::path dataDir() {
    return standardDir(QStandardPaths::GenericDataLocation);
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    return fs::is_directory(dir, ec);
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}

std::vector<fs::path> listFiles(const fs::path& dir,
                                const std::vector<std::string>& extensions,
                                bool recursive) {
    std::vector<fs::path> result;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return result;

    auto matches = [&extensions](const fs::path& p) {
        if (extensions.empty())
            return true;
        auto ext = toLower(p.extension().string());
        return std::find(extensions.begin(), extensions.end(), ext) !=
               extensions.end();
    };

    if (recursive) {
        for (fs::recursive_directory_iterator it(dir, ec), end;
             !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec) && matches(it->path()))
                result.push_back(it->path());
        }
    } else {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec) && matches(it->path()))
                result.push_back(it->path());
        }
    }
    return result;
}

std::string formatBytes(u64 bytes) {
    char buf[32];
    if (bytes >= 1024ull * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f GB",
                      static_cast<f64>(bytes) / (1024.0 * 1024.0 * 1024.0));
    } else if (bytes >= 1024ull * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB",
                      static_cast<f64>(bytes) / (1024.0 * 1024.0));
    } else if (bytes >= 1024) {
        std::snprintf(
                buf, sizeof(buf), "%.1f KB", static_cast<f64>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
    }
    return buf;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.ends_with(suffix);
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool removeIfExists(const fs::path& path, std::error_code& ec) {
    ec.clear();
    return fs::remove(path, ec);
}

} // namespace mc::file
