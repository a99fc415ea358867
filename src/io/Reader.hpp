#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

// sequential reader for regular files, pipes and character devices
// size is known only for regular files and block devices
class Reader {
    public:
    Reader(const std::filesystem::path& fname);
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public std::runtime_error {
        public:
        explicit ReadError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // returns 0 at EOF, throws ReadError on failure
    size_t read(void* buf, size_t count);

    std::optional<uint64_t> size() const { return m_size; }
    uint64_t pos() const { return m_pos; }

    // size of a regular file/block device, nullopt for streams or on error
    static std::optional<uint64_t> get_size(const std::filesystem::path& fname);

    private:
        std::filesystem::path m_fname;
        int m_fd = -1;
        std::optional<uint64_t> m_size;
        uint64_t m_pos = 0;
};
