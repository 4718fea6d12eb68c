#pragma once

#include "core/clip_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Owns the on-disk lifecycle of per-request clip files
 *
 * Every artifact follows create -> write (by the transcoder) -> read -> delete.
 * Paths are derived from a random per-request id and created exclusively, so two
 * requests can never be handed the same file. No state is kept between calls.
 *
 * Methods are virtual so tests can observe the lifecycle.
 */
class TempArtifactManager
{
public:
    /**
     * @param temp_dir Directory for artifacts, created if missing
     * @throws ClipError(ArtifactIOFailed) if the directory cannot be created
     */
    explicit TempArtifactManager(const std::string &temp_dir);
    virtual ~TempArtifactManager() = default;

    /**
     * @brief 128-bit random token, hex encoded
     * @throws ClipError(ArtifactIOFailed) if the system RNG is unavailable
     */
    static std::string generateId();

    /**
     * @brief Reserve <temp_dir>/clip_<id>.mp4 for one request
     * @throws ClipError(ArtifactIOFailed) if the path exists or cannot be created
     */
    virtual TempArtifact allocate(const std::string &id);

    /**
     * @brief Read the finished file back
     * @throws ClipError(ArtifactIOFailed) if the file is missing, unreadable or empty
     */
    virtual std::vector<uint8_t> finalize(const TempArtifact &artifact);

    /**
     * @brief Delete the artifact. Idempotent; failures are logged, never thrown
     */
    virtual void dispose(const TempArtifact &artifact) noexcept;

    const std::string &tempDir() const { return temp_dir_; }

private:
    std::string temp_dir_;
};

/**
 * @brief Disposes its artifact exactly once when it goes out of scope
 */
class ScopedArtifact
{
public:
    ScopedArtifact(TempArtifactManager &manager, TempArtifact artifact)
        : manager_(manager), artifact_(std::move(artifact)) {}

    ~ScopedArtifact() { release(); }

    ScopedArtifact(const ScopedArtifact &) = delete;
    ScopedArtifact &operator=(const ScopedArtifact &) = delete;

    const TempArtifact &get() const { return artifact_; }
    const std::string &path() const { return artifact_.path; }

    void release() noexcept
    {
        if (!released_)
        {
            released_ = true;
            manager_.dispose(artifact_);
        }
    }

private:
    TempArtifactManager &manager_;
    TempArtifact artifact_;
    bool released_{false};
};
