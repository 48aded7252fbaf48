#include "mz/stream/download.hpp"

#include "mz/core/errors.hpp"
#include "mz/stream/hls.hpp"
#include "mz/util/text.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mz::stream {

temp_file::temp_file(std::string path)
    : m_path(std::move(path))
{
}

temp_file::~temp_file()
{
    reset();
}

temp_file::temp_file(temp_file&& other) noexcept
    : m_path(std::move(other.m_path))
{
    other.m_path.clear();
}

temp_file& temp_file::operator=(temp_file&& other) noexcept
{
    if (this != &other) {
        reset();
        m_path = std::move(other.m_path);
        other.m_path.clear();
    }
    return *this;
}

std::uintmax_t temp_file::size() const
{
    std::error_code ec;
    const auto n = fs::file_size(m_path, ec);
    return ec ? 0 : n;
}

void temp_file::reset()
{
    if (m_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(m_path, ec);
    m_path.clear();
}

download_writer::download_writer(std::string download_path, logger log)
    : m_dir(std::move(download_path))
    , m_log(std::move(log))
{
}

std::string download_writer::extension_for(const std::string& locator)
{
    if (is_hls_url(locator)) {
        return ".ts";
    }

    const std::string lower = util::to_lower(locator);
    if (lower.find("mime=audio%2fwebm") != std::string::npos) {
        return ".webm";
    }
    if (lower.find("mime=audio%2fmp4") != std::string::npos) {
        return ".m4a";
    }

    const std::string path = util::url_path(lower);
    for (const char* ext : { ".webm", ".m4a", ".mp3", ".ogg", ".opus", ".aac", ".ts" }) {
        const std::string e(ext);
        if (path.size() >= e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0) {
            return e;
        }
    }
    return ".audio";
}

temp_file download_writer::write(stream_handle& handle, const std::string& title) const
{
    if (!handle.is_byte_stream()) {
        throw stream_unavailable("'" + title + "' is only reachable through its provider page");
    }

    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec) {
        throw error("cannot create download directory " + m_dir + ": " + ec.message());
    }

    const std::string ext = extension_for(handle.locator());
    std::string pattern = (fs::path(m_dir) / (util::sanitize_filename(title) + "-XXXXXX" + ext)).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(ext.size()));
    if (fd < 0) {
        throw error("cannot create download file: " + std::string(std::strerror(errno)));
    }
    ::close(fd);

    temp_file file(buf.data());

    std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
    if (!out) {
        throw error("cannot open " + file.path() + " for writing");
    }

    std::uintmax_t written = 0;
    while (auto chunk = handle.next_chunk()) {
        out.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
        if (!out) {
            throw error("write to " + file.path() + " failed");
        }
        written += chunk->size();
    }
    out.close();

    if (written == 0) {
        throw stream_unavailable("'" + title + "' produced no audio");
    }

    std::ostringstream oss;
    oss << "Download: '" << title << "' -> " << file.path() << " (" << written << " bytes)";
    m_log.log(dpp::ll_info, oss.str());
    return file;
}

} // namespace mz::stream
