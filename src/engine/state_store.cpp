#include "engine/state_store.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/state_error.hpp"
#include "engine/state_document.hpp"

namespace hoststate {

namespace {

constexpr mode_t kStateFileMode = S_IRUSR | S_IWUSR;
constexpr auto kLockRetryInterval = std::chrono::milliseconds(10);
constexpr const char *kTempInfix = ".tmp.";

class FileDescriptor {
public:
    explicit FileDescriptor(int fd)
        : m_fd(fd)
    {
    }

    ~FileDescriptor()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    int get() const
    {
        return m_fd;
    }

    // Closes explicitly so that a failing close() can be reported.
    int close()
    {
        const int fd = m_fd;
        m_fd = -1;
        return ::close(fd);
    }

    int take()
    {
        const int fd = m_fd;
        m_fd = -1;
        return fd;
    }

private:
    int m_fd = -1;
};

StateError ioError(const std::string &what, const std::string &path, int err)
{
    return StateError(ErrorCode::IoError,
                      what + " '" + path + "': " + std::strerror(err));
}

void writeAll(int fd, const std::string &data, const std::string &path)
{
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ioError("Failed to write", path, errno);
        }
        offset += static_cast<std::size_t>(written);
    }
}

std::string compactTimestamp(std::chrono::system_clock::time_point now)
{
    std::string iso = toIso8601Utc(now);
    std::string compact;
    for (char c : iso) {
        if (c != '-' && c != ':') {
            compact.push_back(c);
        }
    }
    return compact;
}

void syncDirectory(const std::filesystem::path &dir)
{
    FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0 || ::fsync(fd.get()) != 0) {
        HSLOG_WARN(QStringLiteral("StateStore"),
                   QStringLiteral("write"),
                   QStringLiteral("directory_sync_failed"),
                   QString::fromLocal8Bit(std::strerror(errno)),
                   QStringLiteral("fsync"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"dir", dir.string()}}));
    }
}

} // namespace

StateStore::Lock::Lock(int fd)
    : m_fd(fd)
{
}

StateStore::Lock::~Lock()
{
    release();
}

StateStore::Lock::Lock(Lock &&other) noexcept
    : m_fd(std::exchange(other.m_fd, -1))
{
}

StateStore::Lock &StateStore::Lock::operator=(Lock &&other) noexcept
{
    if (this != &other) {
        release();
        m_fd = std::exchange(other.m_fd, -1);
    }
    return *this;
}

void StateStore::Lock::release()
{
    // Closing the descriptor drops the flock.
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

StateStore::StateStore(std::string path)
    : m_path(std::move(path))
{
}

std::string StateStore::lockPath() const
{
    return m_path + ".lock";
}

std::optional<std::string> StateStore::readRaw() const
{
    FileDescriptor fd(::open(m_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw ioError("Failed to open state file", m_path, errno);
    }

    std::string content;
    std::vector<char> buffer(64 * 1024);
    while (true) {
        const ssize_t count = ::read(fd.get(), buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ioError("Failed to read state file", m_path, errno);
        }
        if (count == 0) {
            break;
        }
        content.append(buffer.data(), static_cast<std::size_t>(count));
    }
    return content;
}

std::optional<StateDocument> StateStore::read() const
{
    const auto raw = readRaw();
    if (!raw) {
        return std::nullopt;
    }

    try {
        return loadDocument(*raw);
    } catch (const StateError &error) {
        if (error.code() != ErrorCode::CorruptionError) {
            throw;
        }
        HSLOG_WARN(QStringLiteral("StateStore"),
                   QStringLiteral("read"),
                   QStringLiteral("state_file_corrupt"),
                   QString::fromStdString(error.what()),
                   QStringLiteral("json_parse"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path}}));
        throw StateError(ErrorCode::CorruptionError,
                         std::string(error.what()) + ": " + m_path);
    }
}

void StateStore::write(const StateDocument &document) const
{
    const std::filesystem::path target(m_path);
    std::filesystem::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw StateError(ErrorCode::IoError,
                         "Failed to create state directory '" + dir.string() + "': "
                             + ec.message());
    }

    const std::string payload = serializeDocument(document);

    // mkstemp creates the file with mode 0600 before any content exists.
    std::string tempPath = m_path + kTempInfix + "XXXXXX";
    FileDescriptor fd(::mkstemp(tempPath.data()));
    if (fd.get() < 0) {
        throw ioError("Failed to create temp file", tempPath, errno);
    }

    try {
        if (::fchmod(fd.get(), kStateFileMode) != 0) {
            throw ioError("Failed to set permissions on", tempPath, errno);
        }
        writeAll(fd.get(), payload, tempPath);
        if (::fsync(fd.get()) != 0) {
            throw ioError("Failed to fsync", tempPath, errno);
        }
        if (fd.close() != 0) {
            throw ioError("Failed to close", tempPath, errno);
        }
        if (::rename(tempPath.c_str(), m_path.c_str()) != 0) {
            throw ioError("Failed to replace state file", m_path, errno);
        }
    } catch (const StateError &error) {
        ::unlink(tempPath.c_str());
        HSLOG_ERROR(QStringLiteral("StateStore"),
                    QStringLiteral("write"),
                    QStringLiteral("state_write_failed"),
                    QString::fromStdString(error.what()),
                    QStringLiteral("atomic_rename"),
                    hoststate::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", m_path}}));
        throw;
    }

    syncDirectory(dir);

    HSLOG_DEBUG(QStringLiteral("StateStore"),
                QStringLiteral("write"),
                QStringLiteral("state_written"),
                QStringLiteral("persist_document"),
                QStringLiteral("atomic_rename"),
                hoststate::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"path", m_path},
                                {"bytes", payload.size()},
                                {"schemaVersion", document.schemaVersion}}));
}

StateStore::Lock StateStore::acquireLock(std::chrono::milliseconds timeout) const
{
    const std::string path = lockPath();
    std::error_code ec;
    const std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw StateError(ErrorCode::IoError,
                             "Failed to create state directory '" + dir.string() + "': "
                                 + ec.message());
        }
    }

    FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, kStateFileMode));
    if (fd.get() < 0) {
        throw ioError("Failed to open lock file", path, errno);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd.get(), LOCK_EX | LOCK_NB) == 0) {
            return Lock(fd.take());
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EWOULDBLOCK) {
            throw ioError("Failed to lock", path, errno);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kLockRetryInterval);
    }

    HSLOG_WARN(QStringLiteral("StateStore"),
               QStringLiteral("acquireLock"),
               QStringLiteral("lock_timeout"),
               QStringLiteral("held_by_other_writer"),
               QStringLiteral("flock"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path}, {"timeoutMs", timeout.count()}}));
    throw StateError(ErrorCode::LockTimeout,
                     "Timed out after " + std::to_string(timeout.count())
                         + " ms waiting for lock on '" + path + "'");
}

int StateStore::removeStaleTempFiles() const
{
    const std::filesystem::path target(m_path);
    std::filesystem::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    const std::string prefix = target.filename().string() + kTempInfix;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }

    int removed = 0;
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0) {
            continue;
        }
        std::error_code removeError;
        if (std::filesystem::remove(it->path(), removeError)) {
            ++removed;
        }
    }
    if (ec) {
        HSLOG_WARN(QStringLiteral("StateStore"),
                   QStringLiteral("removeStaleTempFiles"),
                   QStringLiteral("directory_scan_stopped"),
                   QString::fromStdString(ec.message()),
                   QStringLiteral("directory_scan"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path}, {"removed", removed}}));
    }

    if (removed > 0) {
        HSLOG_INFO(QStringLiteral("StateStore"),
                   QStringLiteral("removeStaleTempFiles"),
                   QStringLiteral("stale_temp_removed"),
                   QStringLiteral("interrupted_write"),
                   QStringLiteral("directory_scan"),
                   hoststate::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path}, {"removed", removed}}));
    }
    return removed;
}

std::string StateStore::backupCurrentFile(std::chrono::system_clock::time_point now) const
{
    const std::string backupPath = m_path + ".corrupt-" + compactTimestamp(now);

    std::error_code ec;
    std::filesystem::copy_file(m_path, backupPath,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw StateError(ErrorCode::IoError,
                         "Failed to back up '" + m_path + "': " + ec.message());
    }
    std::filesystem::permissions(backupPath,
                                 std::filesystem::perms::owner_read
                                     | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw StateError(ErrorCode::IoError,
                         "Failed to restrict permissions on '" + backupPath + "': "
                             + ec.message());
    }

    HSLOG_WARN(QStringLiteral("StateStore"),
               QStringLiteral("backupCurrentFile"),
               QStringLiteral("state_file_backed_up"),
               QStringLiteral("replacing_corrupt_file"),
               QStringLiteral("copy_file"),
               hoststate::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path}, {"backup", backupPath}}));
    return backupPath;
}

} // namespace hoststate
