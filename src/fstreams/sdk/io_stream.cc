#include <fstreams/sdk/io_stream.hh>
#include <fstreams/error.hh>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace fstreams {

namespace {

// Target of a seek inside [0, size], or -1
int64_t seek_target(int64_t offset, seek_origin whence, size_t position, size_t size) {
    int64_t base = 0;
    switch (whence) {
        case seek_origin::set: base = 0; break;
        case seek_origin::cur: base = static_cast<int64_t>(position); break;
        case seek_origin::end: base = static_cast<int64_t>(size); break;
    }
    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(size)) {
        return -1;
    }
    return target;
}

// Read-only view over caller memory
class memory_view : public io_stream {
public:
    memory_view(const void* data, size_t size_bytes)
        : m_data(static_cast<const uint8_t*>(data)), m_size(size_bytes) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_size) {
            return 0;
        }
        size_t n = std::min(size_bytes, m_size - m_position);
        std::memcpy(ptr, m_data + m_position, n);
        m_position += n;
        return n;
    }

    size_t write(const void*, size_t) override {
        return 0;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        auto target = m_is_open ? seek_target(offset, whence, m_position, m_size) : -1;
        if (target >= 0) {
            m_position = static_cast<size_t>(target);
        }
        return target;
    }

    int64_t tell() override { return m_is_open ? static_cast<int64_t>(m_position) : -1; }
    int64_t get_size() override { return m_is_open ? static_cast<int64_t>(m_size) : -1; }
    void close() override { m_is_open = false; }
    bool is_open() const override { return m_is_open; }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_position = 0;
    bool m_is_open = true;
};

// Owning buffer, grows on write
class bytes_stream : public io_stream {
public:
    explicit bytes_stream(std::vector<uint8_t> bytes)
        : m_data(std::move(bytes)), m_position(0), m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_data.size()) {
            return 0;
        }
        size_t to_read = std::min(size_bytes, m_data.size() - m_position);
        std::memcpy(ptr, m_data.data() + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        if (!m_is_open) {
            return 0;
        }
        if (m_position + size_bytes > m_data.size()) {
            m_data.resize(m_position + size_bytes);
        }
        std::memcpy(m_data.data() + m_position, ptr, size_bytes);
        m_position += size_bytes;
        return size_bytes;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        auto target = m_is_open ? seek_target(offset, whence, m_position, m_data.size()) : -1;
        if (target >= 0) {
            m_position = static_cast<size_t>(target);
        }
        return target;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_data.size()) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    std::vector<uint8_t> m_data;
    size_t m_position;
    bool m_is_open;
};

class file_stream : public io_stream {
public:
    file_stream(const std::filesystem::path& path, const char* mode) {
        std::ios::openmode open_mode = std::ios::binary;
        const bool plus = std::strchr(mode, '+') != nullptr;

        if (std::strchr(mode, 'r')) {
            open_mode |= std::ios::in;
            if (plus) {
                open_mode |= std::ios::out;
            }
        } else if (std::strchr(mode, 'w')) {
            open_mode |= std::ios::out | std::ios::trunc;
            if (plus) {
                open_mode |= std::ios::in;
            }
        } else if (std::strchr(mode, 'a')) {
            open_mode |= std::ios::out | std::ios::app;
            if (plus) {
                open_mode |= std::ios::in;
            }
        }

        m_file.open(path, open_mode);
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        auto got = static_cast<size_t>(m_file.gcount());
        if (m_file.eof()) {
            // a short read at EOF must not poison later seeks
            m_file.clear();
        }
        return got;
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.write(static_cast<const char*>(ptr), static_cast<std::streamsize>(size_bytes));
        return m_file.good() ? size_bytes : 0;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }
        std::ios::seekdir dir = std::ios::beg;
        switch (whence) {
            case seek_origin::set: dir = std::ios::beg; break;
            case seek_origin::cur: dir = std::ios::cur; break;
            case seek_origin::end: dir = std::ios::end; break;
        }
        m_file.clear();
        m_file.seekg(offset, dir);
        m_file.seekp(m_file.tellg());
        if (!m_file) {
            m_file.clear();
            return -1;
        }
        return tell();
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        if (!is_open()) {
            return -1;
        }
        auto cur_pos = m_file.tellg();
        m_file.seekg(0, std::ios::end);
        auto file_size = m_file.tellg();
        m_file.seekg(cur_pos);
        return static_cast<int64_t>(file_size);
    }

    void close() override {
        if (m_file.is_open()) {
            m_file.close();
        }
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    mutable std::fstream m_file;
};

} // namespace

bool read_u32le(io_stream& stream, uint32_t& value) {
    uint8_t bytes[4];
    if (stream.read(bytes, 4) != 4) {
        return false;
    }
    value = static_cast<uint32_t>(bytes[0])
          | static_cast<uint32_t>(bytes[1]) << 8
          | static_cast<uint32_t>(bytes[2]) << 16
          | static_cast<uint32_t>(bytes[3]) << 24;
    return true;
}

bool write_u32le(io_stream& stream, uint32_t value) {
    const uint8_t bytes[4] = {
        static_cast<uint8_t>(value),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 24)
    };
    return stream.write(bytes, 4) == 4;
}

std::unique_ptr<io_stream> io_from_file(const std::filesystem::path& path, const char* mode) {
    auto stream = std::make_unique<file_stream>(path, mode);
    if (!stream->is_open()) {
        throw io_error("cannot open " + path.string() + " with mode \"" + mode + "\"");
    }
    return stream;
}

std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
    return std::make_unique<memory_view>(mem, size_bytes);
}

std::unique_ptr<io_stream> io_from_bytes(std::vector<uint8_t> bytes) {
    return std::make_unique<bytes_stream>(std::move(bytes));
}

} // namespace fstreams
