/**
 * @file Reader.cpp
 * @brief Implementation of the sequential file reader.
 *
 * Wraps a POSIX file descriptor. Regular files and block devices report their
 * size up front so callers can drive a determinate progress bar; pipes and
 * character devices report no size and get an indeterminate display.
 */

#include "Reader.hpp"
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/ioctl.h>
#include <linux/fs.h>
#endif

std::optional<uint64_t> Reader::get_size(const std::filesystem::path& fname) {
    struct stat st;
    if( stat(fname.c_str(), &st) == -1 ) {
        return std::nullopt;
    }

    if (S_ISREG(st.st_mode)) {
        return static_cast<uint64_t>(st.st_size);
    }
#ifdef __linux__
    if (S_ISBLK(st.st_mode)) {
        int fd = open(fname.c_str(), O_RDONLY);
        if (fd == -1) {
            return std::nullopt;
        }
        uint64_t size = 0;
        int rc = ioctl(fd, BLKGETSIZE64, &size);
        close(fd);
        if (rc == -1) {
            return std::nullopt;
        }
        return size;
    }
#endif
    return std::nullopt;
}

/**
 * @brief Opens a file or device for sequential reading.
 *
 * @param fname Path to the file.
 * @throws ReadError If the file cannot be opened or is a directory.
 */
Reader::Reader(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.c_str(), O_RDONLY);
    if (m_fd == -1) {
        throw ReadError(fmt::format("open(\"{}\"): {}", fname.string(), strerror(errno)));
    }

    struct stat st;
    if (fstat(m_fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        close(m_fd);
        m_fd = -1;
        throw ReadError(fmt::format("\"{}\" is a directory", fname.string()));
    }

    m_size = get_size(fname);
}

/**
 * @brief Reads up to count bytes from the current position.
 *
 * Retries on EINTR.
 *
 * @param buf Destination buffer.
 * @param count Maximum number of bytes to read.
 * @return Number of bytes read, 0 at end of file.
 * @throws ReadError On read error.
 */
size_t Reader::read(void* buf, size_t count) {
    while (true) {
        ssize_t nread = ::read(m_fd, buf, count);
        if (nread == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw ReadError(fmt::format("read(\"{}\", {}, {:#x}): {}", m_fname.string(), m_pos, count, strerror(errno)));
        }
        m_pos += nread;
        return static_cast<size_t>(nread);
    }
}

Reader::~Reader() {
    if( m_fd != -1 ){
        close(m_fd);
        m_fd = -1;
    }
}
