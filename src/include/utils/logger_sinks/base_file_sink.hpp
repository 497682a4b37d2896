#pragma once

#include "sd_platform.hpp"

#include <filesystem>
#include <string>

namespace syncdesk::utils
{

/**
 * @class BaseFileSink
 * @brief Append-only file handle shared by the file based sinks.
 *
 * Not a Sink itself: it opens, writes, flushes and closes one file. With `use_flock` each
 * write is bracketed by an advisory `flock` so several processes can share one log file.
 */
class BaseFileSink
{
  public:
    BaseFileSink();
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;
    BaseFileSink(BaseFileSink &&) = delete;
    BaseFileSink &operator=(BaseFileSink &&) = delete;

  protected:
    /// @throws std::system_error when the file cannot be opened.
    void open(const std::filesystem::path &path, bool use_flock);
    void close();
    /// @throws std::system_error on a short or failed write.
    void fwrite(const std::string &content);
    void fflush();
    bool is_open() const;
    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
#if defined(SYNCDESK_PLATFORM_WIN64)
    void *m_file_handle = nullptr; // HANDLE, kept opaque to avoid <windows.h> here
#else
    int m_fd = -1;
#endif
};

} // namespace syncdesk::utils
