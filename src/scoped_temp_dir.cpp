#include "core/scoped_temp_dir.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <Poco/UUID.h>
#include <atomic>
#include <system_error>
#include <unistd.h>

namespace
{
    std::atomic<unsigned long> temp_dir_counter{0};

    bool isUsableDirectory(const fs::path &dir)
    {
        std::error_code ec;
        return fs::is_directory(dir, ec) && access(dir.c_str(), W_OK) == 0;
    }
}

ScopedTempDir::ScopedTempDir(const std::string &prefix, bool prefer_ram)
{
    unsigned long count = temp_dir_counter.fetch_add(1);
    std::string uuid = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    std::string unique_name = prefix + "_" + uuid + "_" + std::to_string(count);

    fs::path dir = selectBaseDirectory(prefer_ram) / unique_name;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        throw IoError("Failed to create temporary directory " + dir.string() + ": " + ec.message());
    }

    path_ = dir;
    Logger::debug("Created temporary directory: " + path_.string());
}

ScopedTempDir::~ScopedTempDir()
{
    removeNow();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir &&other) noexcept
    : path_(std::move(other.path_))
{
    other.path_.clear();
}

ScopedTempDir &ScopedTempDir::operator=(ScopedTempDir &&other) noexcept
{
    if (this != &other)
    {
        removeNow();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

fs::path ScopedTempDir::selectBaseDirectory(bool prefer_ram)
{
    if (prefer_ram)
    {
        if (isUsableDirectory("/dev/shm"))
            return "/dev/shm";

        fs::path user_run = fs::path("/run/user") / std::to_string(getuid());
        if (isUsableDirectory(user_run))
            return user_run;
    }
    return fs::temp_directory_path();
}

void ScopedTempDir::removeNow() noexcept
{
    if (path_.empty())
        return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::warn("Failed to clean up temporary directory " + path_.string() + ": " + ec.message());
    }
    else
    {
        Logger::debug("Cleaned up temporary directory: " + path_.string());
    }
    path_.clear();
}
