#pragma once

#include <cstdint>
#include <string>

#include "mz/log.hpp"
#include "mz/stream/stream_handle.hpp"

namespace mz::stream {

/// Owns a file on disk and deletes it on destruction.
class temp_file {
public:
    temp_file() = default;
    explicit temp_file(std::string path);
    ~temp_file();

    temp_file(temp_file&& other) noexcept;
    temp_file& operator=(temp_file&& other) noexcept;

    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;

    const std::string& path() const { return m_path; }
    std::uintmax_t size() const;
    explicit operator bool() const { return !m_path.empty(); }

    /// Deletes now. Safe to call twice.
    void reset();

private:
    std::string m_path;
};

/// Drains a stream handle into a uniquely named file under `download_path`.
class download_writer {
public:
    explicit download_writer(std::string download_path, logger log = {});

    /// Throws stream_unavailable (locator-only handle, empty stream, segment
    /// failure) or mz::error for file system trouble. Nothing is left on disk
    /// after a failure.
    temp_file write(stream_handle& handle, const std::string& title) const;

    static std::string extension_for(const std::string& locator);

private:
    std::string m_dir;
    logger      m_log;
};

} // namespace mz::stream
