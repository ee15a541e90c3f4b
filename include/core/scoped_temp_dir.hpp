#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Uniquely named temporary directory removed when the owner goes out of scope.
 *
 * Placed on RAM-backed storage when available (/dev/shm, then /run/user/<uid>),
 * otherwise under the system temp directory. Creation failure throws IoError;
 * removal failure is logged and swallowed so it never masks the real result.
 */
class ScopedTempDir
{
public:
    /**
     * @param prefix Leading part of the directory name
     * @param prefer_ram Try tmpfs locations before the system temp directory
     */
    explicit ScopedTempDir(const std::string &prefix = "videohash", bool prefer_ram = true);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    ScopedTempDir(ScopedTempDir &&other) noexcept;
    ScopedTempDir &operator=(ScopedTempDir &&other) noexcept;

    const fs::path &path() const { return path_; }

    /**
     * @brief Build a path for a file inside the directory (does not create it)
     */
    fs::path filePath(const std::string &name) const { return path_ / name; }

    /**
     * @brief Pick the base directory new temp directories are created in
     */
    static fs::path selectBaseDirectory(bool prefer_ram);

private:
    void removeNow() noexcept;

    fs::path path_;
};
