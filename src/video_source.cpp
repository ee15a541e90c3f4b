#include "core/video_source.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <stdexcept>

VideoSource VideoSource::fromPath(const std::string &path)
{
    VideoSource source(Kind::PATH, fs::path(path).stem().string());
    source.path_ = path;
    return source;
}

VideoSource VideoSource::fromUri(const std::string &uri)
{
    const std::string file_scheme = "file://";
    if (uri.compare(0, file_scheme.size(), file_scheme) == 0)
    {
        return fromPath(uri.substr(file_scheme.size()));
    }
    if (uri.find("://") != std::string::npos)
    {
        throw std::invalid_argument("Unsupported video URI scheme (fetch remote videos before hashing): " + uri);
    }
    return fromPath(uri);
}

VideoSource VideoSource::fromBuffer(std::vector<uint8_t> bytes, const std::string &id)
{
    VideoSource source(Kind::BUFFER, id);
    source.bytes_ = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    return source;
}

MaterializedVideo VideoSource::materialize(const TempDirSettings &temp_settings) const
{
    MaterializedVideo video;

    if (kind_ == Kind::PATH)
    {
        std::error_code ec;
        if (!fs::is_regular_file(path_, ec))
        {
            throw DecodeError("Video file does not exist or is not accessible: " + path_);
        }
        video.path = path_;
        return video;
    }

    if (!bytes_ || bytes_->empty())
    {
        throw DecodeError("Video buffer is empty: " + id_);
    }

    video.temp_dir = std::make_unique<ScopedTempDir>(temp_settings.prefix, temp_settings.prefer_ram);
    video.path = video.temp_dir->filePath("temp_video.mp4");

    std::ofstream out(video.path, std::ios::binary);
    if (!out.is_open())
    {
        throw IoError("Could not create temporary video file: " + video.path.string());
    }
    out.write(reinterpret_cast<const char *>(bytes_->data()), static_cast<std::streamsize>(bytes_->size()));
    out.close();
    if (!out)
    {
        throw IoError("Could not write temporary video file: " + video.path.string());
    }

    Logger::debug("Wrote " + std::to_string(bytes_->size()) + " bytes of " + id_ + " to " + video.path.string());
    return video;
}
