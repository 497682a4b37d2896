#pragma once
/**
 * @file json_store.hpp
 * @brief A JSON document persisted in one file, shared between threads and processes.
 *
 * Every operation takes the FileLock of the file for its whole duration, so a read-modify-write
 * through `update()` is atomic with respect to every other JsonStore on the same path, in this
 * process or another. Writes go through `atomic_write_json()`: a reader never observes a
 * half-written file.
 *
 * A missing file reads as an empty object. Errors are reported through the optional
 * `std::error_code*`; no method throws.
 */
#include "sd_base.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <system_error>

#include <nlohmann/json.hpp>

namespace syncdesk::utils
{

/**
 * @brief Writes `snapshot` to `target` through a temporary file in the same directory,
 *        fsync and rename. The caller is responsible for cross-process locking.
 */
SYNCDESK_UTILS_EXPORT void atomic_write_json(const std::filesystem::path &target,
                                             const nlohmann::json &snapshot,
                                             std::error_code *err_code) noexcept;

/**
 * @brief Parses `source`. A missing or empty file yields an empty object and no error.
 */
SYNCDESK_UTILS_EXPORT bool read_json_file(const std::filesystem::path &source,
                                          nlohmann::json &out, std::error_code *err_code) noexcept;

class SYNCDESK_UTILS_EXPORT JsonStore
{
  public:
    using Mutator = std::function<void(nlohmann::json &)>;

    explicit JsonStore(std::filesystem::path path,
                       std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    bool read(nlohmann::json &out, std::error_code *err_code = nullptr) const noexcept;
    bool write(const nlohmann::json &doc, std::error_code *err_code = nullptr) const noexcept;

    /**
     * @brief Loads the document, applies `fn`, writes the result back, all under the lock.
     *
     * If `fn` throws, nothing is written and `err_code` is set to `errc::operation_canceled`.
     * When `result` is given it receives the document as written.
     */
    bool update(const Mutator &fn, std::error_code *err_code = nullptr,
                nlohmann::json *result = nullptr) const noexcept;

  private:
    std::filesystem::path m_path;
    std::chrono::milliseconds m_lock_timeout;
};

} // namespace syncdesk::utils
