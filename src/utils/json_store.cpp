#include "sd_base.hpp"
#include "utils/file_lock.hpp"
#include "utils/json_store.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

#if defined(SYNCDESK_IS_POSIX)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace syncdesk::utils
{

namespace
{

constexpr int kRenameRetries = 5;
constexpr int kRenameDelayMs = 10;

void set_error(std::error_code *err_code, std::error_code ec)
{
    if (err_code != nullptr)
        *err_code = ec;
}

void set_errno(std::error_code *err_code, int errnum)
{
    set_error(err_code, std::error_code(errnum, std::generic_category()));
}

#if defined(SYNCDESK_PLATFORM_WIN64)

bool write_and_replace_win(const fs::path &target, const std::string &content,
                           std::error_code *err_code)
{
    const fs::path tmp = target.parent_path() /
                         fmt::format("{}.tmp.{}", target.filename().string(),
                                     platform::get_pid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            set_error(err_code, std::make_error_code(std::errc::io_error));
            LOGGER_ERROR("atomic_write_json: cannot create '{}'", tmp.string());
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out)
        {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            set_error(err_code, std::make_error_code(std::errc::io_error));
            return false;
        }
    }
    DWORD last_error = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (MoveFileExW(tmp.wstring().c_str(), target.wstring().c_str(),
                        MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
        {
            return true;
        }
        last_error = GetLastError();
        // Readers holding the file open without FILE_SHARE_DELETE make this transient.
        if (last_error != ERROR_ACCESS_DENIED && last_error != ERROR_SHARING_VIOLATION)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    std::error_code ignore;
    fs::remove(tmp, ignore);
    set_error(err_code, std::error_code(static_cast<int>(last_error), std::system_category()));
    LOGGER_ERROR("atomic_write_json: MoveFileExW failed for '{}' (error {})", target.string(),
                 last_error);
    return false;
}

#else

bool write_fsync_close_posix(int fd, const std::string &tmp_path, const std::string &content,
                             const fs::path &target, std::error_code *err_code)
{
    size_t written = 0;
    while (written < content.size())
    {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            const int errnum = errno;
            ::close(fd);
            ::unlink(tmp_path.c_str());
            set_errno(err_code, errnum);
            LOGGER_ERROR("atomic_write_json: write failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0)
    {
        const int errnum = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        set_errno(err_code, errnum);
        LOGGER_ERROR("atomic_write_json: fsync(file) failed for '{}'. Error: {}", tmp_path,
                     std::strerror(errnum));
        return false;
    }
    // Keep the permissions of the file being replaced.
    struct stat stat_buf;
    if (::stat(target.c_str(), &stat_buf) == 0 && ::fchmod(fd, stat_buf.st_mode) != 0)
    {
        const int errnum = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        set_errno(err_code, errnum);
        return false;
    }
    if (::close(fd) != 0)
    {
        const int errnum = errno;
        ::unlink(tmp_path.c_str());
        set_errno(err_code, errnum);
        return false;
    }
    return true;
}

bool atomic_rename_posix(const std::string &tmp_path, const fs::path &target,
                         std::error_code *err_code)
{
    int last_errnum = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (std::rename(tmp_path.c_str(), target.c_str()) == 0)
            return true;
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    ::unlink(tmp_path.c_str());
    set_errno(err_code, last_errnum);
    LOGGER_ERROR("atomic_write_json: rename failed for '{}'. Error: {}", target.string(),
                 std::strerror(last_errnum));
    return false;
}

void fsync_parent_posix(const fs::path &target)
{
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    const int dfd = ::open(parent.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0)
        return;
    if (::fsync(dfd) != 0)
    {
        LOGGER_WARN("atomic_write_json: fsync(dir) failed for '{}'. Error: {}", parent.string(),
                    std::strerror(errno));
    }
    ::close(dfd);
}

#endif

} // namespace

void atomic_write_json(const fs::path &target, const nlohmann::json &snapshot,
                       std::error_code *err_code) noexcept
{
    set_error(err_code, {});
    try
    {
        const auto parent = target.parent_path();
        if (!parent.empty())
        {
            std::error_code dir_ec;
            fs::create_directories(parent, dir_ec);
            if (dir_ec)
            {
                set_error(err_code, dir_ec);
                return;
            }
        }
        if (fs::is_symlink(target))
        {
            set_error(err_code, std::make_error_code(std::errc::operation_not_permitted));
            LOGGER_ERROR("atomic_write_json: refusing to replace symlink '{}'", target.string());
            return;
        }
        const std::string content = snapshot.dump(2);

#if defined(SYNCDESK_PLATFORM_WIN64)
        (void)write_and_replace_win(target, content, err_code);
#else
        const fs::path dir = parent.empty() ? fs::path(".") : parent;
        std::string tmpl = (dir / (target.filename().string() + ".tmp.XXXXXX")).string();
        const int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
        if (fd < 0)
        {
            const int errnum = errno;
            set_errno(err_code, errnum);
            LOGGER_ERROR("atomic_write_json: mkostemp failed in '{}'. Error: {}", dir.string(),
                         std::strerror(errnum));
            return;
        }
        if (!write_fsync_close_posix(fd, tmpl, content, target, err_code))
            return;
        if (!atomic_rename_posix(tmpl, target, err_code))
            return;
        fsync_parent_posix(target);
#endif
    }
    catch (const std::exception &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("atomic_write_json: exception: {}", ex.what());
    }
}

bool read_json_file(const fs::path &source, nlohmann::json &out,
                    std::error_code *err_code) noexcept
{
    set_error(err_code, {});
    try
    {
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            out = nlohmann::json::object();
            return true;
        }
        const std::string text((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
        if (format_tools::trim_whitespace(text).empty())
        {
            out = nlohmann::json::object();
            return true;
        }
        out = nlohmann::json::parse(text);
        return true;
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::illegal_byte_sequence));
        LOGGER_ERROR("read_json_file: '{}' is not valid JSON: {}", source.string(), ex.what());
        return false;
    }
    catch (const std::exception &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("read_json_file: I/O failure on '{}': {}", source.string(), ex.what());
        return false;
    }
}

JsonStore::JsonStore(fs::path path, std::chrono::milliseconds lock_timeout)
    : m_path(std::move(path)), m_lock_timeout(lock_timeout)
{
}

bool JsonStore::read(nlohmann::json &out, std::error_code *err_code) const noexcept
{
    FileLock lock(m_path, m_lock_timeout);
    if (!lock.valid())
    {
        set_error(err_code, lock.error_code());
        return false;
    }
    return read_json_file(m_path, out, err_code);
}

bool JsonStore::write(const nlohmann::json &doc, std::error_code *err_code) const noexcept
{
    FileLock lock(m_path, m_lock_timeout);
    if (!lock.valid())
    {
        set_error(err_code, lock.error_code());
        return false;
    }
    std::error_code ec;
    atomic_write_json(m_path, doc, &ec);
    set_error(err_code, ec);
    return !ec;
}

bool JsonStore::update(const Mutator &fn, std::error_code *err_code,
                       nlohmann::json *result) const noexcept
{
    FileLock lock(m_path, m_lock_timeout);
    if (!lock.valid())
    {
        set_error(err_code, lock.error_code());
        return false;
    }
    nlohmann::json doc;
    if (!read_json_file(m_path, doc, err_code))
        return false;
    try
    {
        fn(doc);
    }
    catch (const std::exception &ex)
    {
        set_error(err_code, std::make_error_code(std::errc::operation_canceled));
        LOGGER_WARN("JsonStore::update: mutator for '{}' threw: {}", m_path.string(), ex.what());
        return false;
    }
    std::error_code ec;
    atomic_write_json(m_path, doc, &ec);
    set_error(err_code, ec);
    if (!ec && result != nullptr)
    {
        try
        {
            *result = doc;
        }
        catch (const std::exception &)
        {
            set_error(err_code, std::make_error_code(std::errc::not_enough_memory));
            return false;
        }
    }
    return !ec;
}

} // namespace syncdesk::utils
