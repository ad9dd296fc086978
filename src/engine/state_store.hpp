#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace hoststate {

/**
 * StateStore owns the single JSON state file of one managed host.
 *
 * Writes go to a 0600 temp file in the same directory, are fsynced and then
 * renamed over the target, so readers only ever see a complete document.
 * A sibling "<file>.lock" carries an advisory flock for read-modify-write
 * cycles across processes.
 */
class StateStore {
public:
    // Exclusive advisory lock, released on destruction.
    class Lock {
    public:
        Lock() = default;
        explicit Lock(int fd);
        ~Lock();

        Lock(const Lock &) = delete;
        Lock &operator=(const Lock &) = delete;
        Lock(Lock &&other) noexcept;
        Lock &operator=(Lock &&other) noexcept;

        bool isHeld() const
        {
            return m_fd >= 0;
        }

        void release();

    private:
        int m_fd = -1;
    };

    explicit StateStore(std::string path);

    const std::string &path() const
    {
        return m_path;
    }

    std::string lockPath() const;

    // std::nullopt when no file exists. A present but unparseable file throws
    // StateError(CorruptionError) and is left in place.
    std::optional<StateDocument> read() const;
    std::optional<std::string> readRaw() const;

    // Throws StateError(IoError); the previous file is untouched on failure.
    void write(const StateDocument &document) const;

    // Throws StateError(LockTimeout) once `timeout` elapses without the lock.
    Lock acquireLock(std::chrono::milliseconds timeout) const;

    // Removes "<file>.tmp.*" leftovers of interrupted writes. Call with the
    // lock held. Returns the number of files removed.
    int removeStaleTempFiles() const;

    // Copies the current file to "<file>.corrupt-<UTC timestamp>" and returns
    // the backup path.
    std::string backupCurrentFile(std::chrono::system_clock::time_point now) const;

private:
    std::string m_path;
};

} // namespace hoststate
