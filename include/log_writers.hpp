/**
 * @file log_writers.hpp
 * @brief File descriptor writers used by the console and file destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>
#include <sys/uio.h> // For writev

namespace relaylog
{

// Maximum iovec entries handed to a single writev call
static constexpr size_t WRITER_MAX_IOV = 1024;

/**
 * @brief Appends to a file descriptor, either owned (opened by name) or borrowed
 *
 * Writes loop over short writes and EINTR, so a successful return means every byte
 * reached the kernel.
 */
class file_writer
{
  public:
    /**
     * @brief Open @p filename for appending, creating it if needed
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit file_writer(const std::string &filename)
    : filename_(filename),
      close_fd_(true)
    {
        fd_ = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) { throw std::runtime_error("Failed to open log file: " + filename); }
    }

    explicit file_writer(int fd, bool close_fd = false)
    : fd_(fd),
      close_fd_(close_fd)
    {
    }

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    file_writer(file_writer &&other) noexcept
    : filename_(std::move(other.filename_)),
      fd_(other.fd_),
      close_fd_(other.close_fd_)
    {
        other.fd_       = -1;
        other.close_fd_ = false;
    }

    ~file_writer()
    {
        if (close_fd_ && fd_ >= 0)
        {
            close(fd_);
            fd_ = -1;
        }
    }

    /**
     * @brief Write the whole buffer
     * @return false on an I/O error (errno is preserved)
     */
    bool write(std::string_view data) const
    {
        if (fd_ < 0) return false;

        size_t total_written = 0;
        while (total_written < data.size())
        {
            ssize_t written = ::write(fd_, data.data() + total_written, data.size() - total_written);
            if (written < 0)
            {
                if (errno == EINTR) continue;
                return false;
            }
            total_written += static_cast<size_t>(written);
        }
        return true;
    }

    /**
     * @brief Write several buffers back to back, one writev per WRITER_MAX_IOV chunk
     * @return false on an I/O error
     */
    bool write_all(const std::vector<std::string> &chunks) const
    {
        if (fd_ < 0) return false;

        size_t start = 0;
        while (start < chunks.size())
        {
            size_t count = std::min(chunks.size() - start, WRITER_MAX_IOV);

            struct iovec iov[WRITER_MAX_IOV];
            size_t expected = 0;
            for (size_t i = 0; i < count; ++i)
            {
                iov[i].iov_base = const_cast<char *>(chunks[start + i].data());
                iov[i].iov_len  = chunks[start + i].size();
                expected += iov[i].iov_len;
            }

            ssize_t written = writev(fd_, iov, static_cast<int>(count));
            if (written < 0)
            {
                if (errno == EINTR) continue;
                return false;
            }

            // Short writev: finish the chunk byte-wise from where the kernel stopped
            if (static_cast<size_t>(written) < expected)
            {
                size_t skip = static_cast<size_t>(written);
                for (size_t i = 0; i < count; ++i)
                {
                    std::string_view chunk = chunks[start + i];
                    if (skip >= chunk.size())
                    {
                        skip -= chunk.size();
                        continue;
                    }
                    if (!write(chunk.substr(skip))) return false;
                    skip = 0;
                }
            }

            start += count;
        }
        return true;
    }

    int fd() const noexcept { return fd_; }
    const std::string &filename() const noexcept { return filename_; }

  private:
    std::string filename_;
    int fd_{-1};
    bool close_fd_{false};
};

} // namespace relaylog
