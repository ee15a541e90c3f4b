#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/scoped_temp_dir.hpp"
#include "core/video_hash_config.hpp"

/**
 * @brief A video on local disk, ready for the decoders.
 *
 * When the source was an in-memory buffer the file lives in a temp directory
 * owned by this object and disappears with it.
 */
struct MaterializedVideo
{
    fs::path path;
    std::unique_ptr<ScopedTempDir> temp_dir;
};

/**
 * @brief Where the bytes of a video come from: a local file or a memory buffer
 */
class VideoSource
{
public:
    enum class Kind
    {
        PATH,
        BUFFER
    };

    static VideoSource fromPath(const std::string &path);

    /**
     * @brief Accept "file://" URIs and bare paths
     * @throws std::invalid_argument for any other scheme; remote fetching belongs to the caller
     */
    static VideoSource fromUri(const std::string &uri);

    /**
     * @param bytes Complete container bytes
     * @param id Identifier reported in metadata and logs
     */
    static VideoSource fromBuffer(std::vector<uint8_t> bytes, const std::string &id = "buffer");

    Kind kind() const { return kind_; }
    const std::string &id() const { return id_; }
    const std::string &path() const { return path_; }

    /**
     * @brief Make the video available as a file
     * @throws DecodeError if a path source does not exist
     * @throws IoError if a buffer cannot be written to temp storage
     */
    MaterializedVideo materialize(const TempDirSettings &temp_settings = TempDirSettings()) const;

private:
    VideoSource(Kind kind, std::string id) : kind_(kind), id_(std::move(id)) {}

    Kind kind_;
    std::string id_;
    std::string path_;
    std::shared_ptr<const std::vector<uint8_t>> bytes_;
};
