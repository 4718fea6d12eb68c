#include "core/temp_artifact_manager.hpp"
#include "logging/logger.hpp"
#include <openssl/rand.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

TempArtifactManager::TempArtifactManager(const std::string &temp_dir)
    : temp_dir_(temp_dir)
{
    std::error_code ec;
    if (!fs::exists(temp_dir_, ec))
    {
        fs::create_directories(temp_dir_, ec);
        if (ec)
        {
            throw ClipError(ClipErrorKind::ArtifactIOFailed,
                            "Failed to create temp directory " + temp_dir_ + ": " + ec.message());
        }
        Logger::info("TempArtifactManager: created temp directory " + temp_dir_);
    }
}

std::string TempArtifactManager::generateId()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        throw ClipError(ClipErrorKind::ArtifactIOFailed, "Random number generator unavailable");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : bytes)
    {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

TempArtifact TempArtifactManager::allocate(const std::string &id)
{
    TempArtifact artifact;
    artifact.id = id;
    artifact.path = (fs::path(temp_dir_) / ("clip_" + id + ".mp4")).string();
    artifact.created_at = std::chrono::system_clock::now();

    // O_EXCL: fails if another request already holds this path
    int fd = open(artifact.path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        throw ClipError(ClipErrorKind::ArtifactIOFailed,
                        "Failed to allocate temp file " + artifact.path + ": " + std::strerror(errno));
    }
    close(fd);

    Logger::debug("TempArtifactManager: allocated " + artifact.path);
    return artifact;
}

std::vector<uint8_t> TempArtifactManager::finalize(const TempArtifact &artifact)
{
    std::ifstream in(artifact.path, std::ios::binary | std::ios::ate);
    if (!in.is_open())
    {
        throw ClipError(ClipErrorKind::ArtifactIOFailed, "Failed to open finished clip " + artifact.path);
    }

    std::streamsize size = in.tellg();
    if (size <= 0)
    {
        throw ClipError(ClipErrorKind::ArtifactIOFailed, "Finished clip is empty: " + artifact.path);
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    if (!in.read(reinterpret_cast<char *>(data.data()), size))
    {
        throw ClipError(ClipErrorKind::ArtifactIOFailed, "Failed to read finished clip " + artifact.path);
    }

    Logger::debug("TempArtifactManager: read " + std::to_string(data.size()) + " bytes from " + artifact.path);
    return data;
}

void TempArtifactManager::dispose(const TempArtifact &artifact) noexcept
{
    try
    {
        std::error_code ec;
        bool removed = fs::remove(artifact.path, ec);
        if (ec)
        {
            Logger::warn("TempArtifactManager: failed to delete " + artifact.path + ": " + ec.message());
        }
        else if (removed)
        {
            Logger::debug("TempArtifactManager: deleted " + artifact.path);
        }
    }
    catch (const std::exception &e)
    {
        Logger::warn("TempArtifactManager: error while deleting " + artifact.path + ": " + e.what());
    }
}
