/**
 * @file io_stream.hh
 * @brief Byte stream seam between the resolver and format handlers
 * @ingroup sdk_io
 */

#ifndef FSTREAMS_SDK_IO_STREAM_HH
#define FSTREAMS_SDK_IO_STREAM_HH

#include <fstreams/export_fstreams.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace fstreams {

/**
 * @enum seek_origin
 * @brief Seek origin for byte positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< From beginning of stream (SEEK_SET)
    cur = 1,  ///< From current position (SEEK_CUR)
    end = 2   ///< From end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract binary byte stream
 * @ingroup sdk_io
 *
 * This is what the resolver prepares (opening a path, applying a coding
 * transform) and hands to a handler constructor. Coding transforms are
 * themselves io_streams wrapping another io_stream.
 *
 * @code
 * class gzip_stream : public fstreams::io_stream {
 *     std::unique_ptr<io_stream> m_inner;
 * public:
 *     explicit gzip_stream(std::unique_ptr<io_stream> inner);
 *     size_t read(void* ptr, size_t size) override;   // inflate from m_inner
 *     // ... other methods
 * };
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), io_from_bytes()
 */
class io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data
     * @return Number of bytes read; 0 on EOF or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Write binary data
     * @return Number of bytes written
     * @note Read-only streams return 0
     */
    virtual size_t write(const void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Seek to a byte position
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @brief Current byte position, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @brief Total size in bytes, or -1 if unknown
     */
    virtual int64_t get_size() = 0;

    /**
     * @brief Close the stream
     * @note Calling close() on a closed stream is a no-op
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Little-endian uint32 access for record-oriented handlers
 *
 * read_u32le() returns false when fewer than 4 bytes were available;
 * write_u32le() returns false when the stream accepted fewer than 4.
 */
FSTREAMS_EXPORT bool read_u32le(io_stream& stream, uint32_t& value);
FSTREAMS_EXPORT bool write_u32le(io_stream& stream, uint32_t value);

/**
 * @defgroup io_factory I/O Stream Factory Functions
 * @ingroup sdk_io
 * @{
 */

/**
 * @brief Open a file as a byte stream
 *
 * @param path File to open
 * @param mode C-style mode: "rb", "wb", "ab", optionally with '+'
 * @throws io_error if the file cannot be opened
 */
FSTREAMS_EXPORT std::unique_ptr<io_stream> io_from_file(const std::filesystem::path& path, const char* mode = "rb");

/**
 * @brief Read-only view over caller memory
 * @note The memory must remain valid for the lifetime of the stream
 */
FSTREAMS_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/**
 * @brief Owning, growable in-memory stream
 *
 * Writes past the end extend the buffer.
 */
FSTREAMS_EXPORT std::unique_ptr<io_stream> io_from_bytes(std::vector<uint8_t> bytes = {});

/** @} */

} // namespace fstreams

#endif // FSTREAMS_SDK_IO_STREAM_HH
