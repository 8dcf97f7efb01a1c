#include "scpflow/LocalFs.hpp"

#include <chrono>
#include <cstdio>

namespace fs = std::filesystem;

namespace scpflow {

// file_time_type has no portable epoch in C++17; translate through now().
std::int64_t epochMsFromFileTime(fs::file_time_type t) {
    const auto sysNow = std::chrono::system_clock::now();
    const auto fileNow = fs::file_time_type::clock::now();
    const auto sys =
        sysNow + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                     t - fileNow);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               sys.time_since_epoch())
        .count();
}

bool setLocalMtimeMs(const std::string& path, std::int64_t mtime_ms,
                     std::string& err) {
    const auto sysNow = std::chrono::system_clock::now();
    const auto fileNow = fs::file_time_type::clock::now();
    const std::chrono::system_clock::time_point target{
        std::chrono::milliseconds(mtime_ms)};
    const auto ft =
        fileNow + std::chrono::duration_cast<fs::file_time_type::duration>(
                      target - sysNow);
    std::error_code ec;
    fs::last_write_time(path, ft, ec);
    if (ec) {
        err = "Could not set local mtime: " + ec.message();
        return false;
    }
    return true;
}

bool localPermissions(const std::string& path, std::uint32_t& mode,
                      std::string& err) {
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (ec) {
        err = "Could not read local permissions: " + ec.message();
        return false;
    }
    mode = static_cast<std::uint32_t>(st.permissions() & fs::perms::mask) & 0777;
    return true;
}

bool setLocalPermissions(const std::string& path, std::uint32_t mode,
                         std::string& err) {
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & 0777),
                    fs::perm_options::replace, ec);
    if (ec) {
        err = "Could not set local permissions: " + ec.message();
        return false;
    }
    return true;
}

bool ensureLocalParentDir(const std::string& path, std::string& err) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty())
        return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        err = "Could not create local directory " + parent.string() + ": " +
              ec.message();
        return false;
    }
    return true;
}

bool preallocateLocalFile(const std::string& path, std::uint64_t size,
                          std::string& err) {
    FILE *f = std::fopen(path.c_str(), "wb");
    if (!f) {
        err = "Could not create local file " + path;
        return false;
    }
    std::fclose(f);
    std::error_code ec;
    fs::resize_file(path, size, ec);
    if (ec) {
        err = "Could not size local file: " + ec.message();
        return false;
    }
    return true;
}

} // namespace scpflow
