#ifndef FSTREAMS_MOCK_COMPONENTS_HH
#define FSTREAMS_MOCK_COMPONENTS_HH

#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/sdk/handler.hh>
#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/open_options.hh>
#include <failsafe/failsafe.hh>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fstreams::test {

// Handler with a per-instance name; tests create as many as they need
class named_handler : public fstreams::handler {
public:
    explicit named_handler(std::string name)
        : m_name(std::move(name)) {}

    const char* get_name() const override {
        return m_name.c_str();
    }

private:
    std::string m_name;
};

// In-memory stream with every capability; counts close calls
template<typename T>
class vector_stream : public fstreams::formatted_stream<T> {
public:
    static constexpr capability_set capabilities = capability_set::all();

    explicit vector_stream(std::vector<T> values, int* close_count = nullptr)
        : m_values(std::move(values)), m_close_count(close_count) {}

    const char* get_name() const override { return "vector"; }
    capability_set get_capabilities() const override { return capabilities; }

    const std::vector<T>& values() const { return m_values; }
    int reads() const { return m_reads; }

protected:
    stream_pos_t do_position() const override { return static_cast<stream_pos_t>(m_index); }
    bool do_eof() override { return m_index >= m_values.size(); }
    void do_seek_start() override { m_index = 0; }

    void do_close() override {
        if (m_close_count) {
            ++*m_close_count;
        }
    }

    T do_read() override {
        ++m_reads;
        return m_values[m_index++];
    }

    void do_read_into(T& out) override {
        ++m_reads;
        out = m_values[m_index++];
    }

    void do_write(const T& value) override {
        if (m_index < m_values.size()) {
            m_values[m_index] = value;
        } else {
            m_values.push_back(value);
        }
        ++m_index;
    }

    void do_seek(stream_pos_t index) override {
        if (index < 0 || static_cast<size_t>(index) > m_values.size()) {
            throw std::out_of_range("seek outside of stream");
        }
        m_index = static_cast<size_t>(index);
    }

    void do_seek_end() override { m_index = m_values.size(); }
    stream_pos_t do_length() override { return static_cast<stream_pos_t>(m_values.size()); }

    void do_truncate(stream_pos_t count) override {
        if (static_cast<size_t>(count) < m_values.size()) {
            m_values.resize(static_cast<size_t>(count));
        }
        if (m_index > m_values.size()) {
            m_index = m_values.size();
        }
    }

private:
    std::vector<T> m_values;
    size_t m_index = 0;
    int* m_close_count;
    int m_reads = 0;
};

// Sequential reads only
template<typename T>
class read_only_stream : public fstreams::formatted_stream<T> {
public:
    static constexpr capability_set capabilities = capability::read;

    explicit read_only_stream(std::vector<T> values)
        : m_values(std::move(values)) {}

    const char* get_name() const override { return "read-only"; }
    capability_set get_capabilities() const override { return capabilities; }

protected:
    stream_pos_t do_position() const override { return static_cast<stream_pos_t>(m_index); }
    bool do_eof() override { return m_index >= m_values.size(); }
    void do_seek_start() override { m_index = 0; }
    void do_close() override {}
    T do_read() override { return m_values[m_index++]; }

private:
    std::vector<T> m_values;
    size_t m_index = 0;
};

// Close always fails
class failing_close_stream : public fstreams::formatted_stream<int> {
public:
    static constexpr capability_set capabilities = capability::read;

    explicit failing_close_stream(int* close_count)
        : m_close_count(close_count) {}

    const char* get_name() const override { return "failing-close"; }
    capability_set get_capabilities() const override { return capabilities; }

protected:
    stream_pos_t do_position() const override { return 0; }
    bool do_eof() override { return true; }
    void do_seek_start() override {}

    void do_close() override {
        ++*m_close_count;
        throw std::runtime_error("close failed");
    }

private:
    int* m_close_count;
};

/*
 * Little-endian uint32 records over a byte stream. Length is derived from
 * the byte size, so the layout declares length, seek and seek_end.
 *
 * Options:
 *   "fill" (uint32_t)  value returned instead of the stored one, for testing
 *                      option forwarding
 */
class u32_record_stream : public fstreams::formatted_stream<uint32_t> {
public:
    static constexpr capability_set capabilities =
        capability::read | capability::read_into | capability::seek | capability::seek_end
        | capability::length | capability::write;

    u32_record_stream(std::unique_ptr<io_stream> io, const open_options& options)
        : m_io(std::move(io)) {
        auto size = m_io->get_size();
        if (size < 0 || size % 4 != 0) {
            THROW_RUNTIME("u32 records: byte size ", size, " is not a multiple of 4");
        }
        if (options.contains("fill")) {
            m_fill = options.get<uint32_t>("fill");
            m_has_fill = true;
        }
        m_io->seek(0, seek_origin::set);
    }

    const char* get_name() const override { return "u32-records"; }
    capability_set get_capabilities() const override { return capabilities; }

    io_stream& io() { return *m_io; }

protected:
    stream_pos_t do_position() const override { return m_index; }
    bool do_eof() override { return m_index >= count(); }

    void do_seek_start() override {
        do_seek(0);
    }

    void do_close() override {
        m_io->close();
    }

    uint32_t do_read() override {
        uint32_t value = 0;
        do_read_into(value);
        return value;
    }

    void do_read_into(uint32_t& out) override {
        uint32_t value = 0;
        if (!read_u32le(*m_io, value)) {
            THROW_RUNTIME("u32 records: short read at record ", m_index);
        }
        ++m_index;
        out = m_has_fill ? m_fill : value;
    }

    void do_write(const uint32_t& value) override {
        if (!write_u32le(*m_io, value)) {
            THROW_RUNTIME("u32 records: short write at record ", m_index);
        }
        ++m_index;
    }

    void do_seek(stream_pos_t index) override {
        if (index < 0 || index > count()) {
            THROW_RUNTIME("u32 records: record ", index, " out of range");
        }
        m_io->seek(index * 4, seek_origin::set);
        m_index = index;
    }

    void do_seek_end() override {
        do_seek(count());
    }

    stream_pos_t do_length() override {
        return count();
    }

private:
    stream_pos_t count() {
        return m_io->get_size() / 4;
    }

    std::unique_ptr<io_stream> m_io;
    stream_pos_t m_index = 0;
    uint32_t m_fill = 0;
    bool m_has_fill = false;
};

// Byte stream "coding" for tests: XORs every byte read or written with a key
class xor_io_stream : public fstreams::io_stream {
public:
    xor_io_stream(std::unique_ptr<io_stream> inner, uint8_t key)
        : m_inner(std::move(inner)), m_key(key) {}

    size_t read(void* ptr, size_t size_bytes) override {
        auto got = m_inner->read(ptr, size_bytes);
        auto* bytes = static_cast<uint8_t*>(ptr);
        for (size_t i = 0; i < got; i++) {
            bytes[i] ^= m_key;
        }
        return got;
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        std::vector<uint8_t> encoded(static_cast<const uint8_t*>(ptr),
                                     static_cast<const uint8_t*>(ptr) + size_bytes);
        for (auto& b : encoded) {
            b ^= m_key;
        }
        return m_inner->write(encoded.data(), encoded.size());
    }

    int64_t seek(int64_t offset, seek_origin whence) override { return m_inner->seek(offset, whence); }
    int64_t tell() override { return m_inner->tell(); }
    int64_t get_size() override { return m_inner->get_size(); }
    void close() override { m_inner->close(); }
    bool is_open() const override { return m_inner->is_open(); }

private:
    std::unique_ptr<io_stream> m_inner;
    uint8_t m_key;
};

inline std::vector<uint8_t> u32_bytes(const std::vector<uint32_t>& values) {
    std::vector<uint8_t> out;
    for (auto v : values) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v >> 16));
        out.push_back(static_cast<uint8_t>(v >> 24));
    }
    return out;
}

} // namespace fstreams::test

#endif // FSTREAMS_MOCK_COMPONENTS_HH
