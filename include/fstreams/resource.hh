/**
 * @file resource.hh
 * @brief A path or byte stream tagged with its format and coding
 * @ingroup resolver
 */

#pragma once

#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/export_fstreams.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace fstreams {

    /**
     * @struct classification
     * @brief What the classifier found out about a resource
     */
    struct classification {
        format_id_t format;
        std::optional<coding_id_t> coding;
    };

    /**
     * @class formatted_resource
     * @brief A resource whose format (and optional coding) is known
     * @ingroup resolver
     *
     * Either a path, opened by the resolver with the stored mode, or a byte
     * stream the resource owns until the resolver takes it. Build one with
     * specify().
     */
    class FSTREAMS_EXPORT formatted_resource {
        public:
            formatted_resource(std::filesystem::path path,
                               classification what,
                               std::string mode = "rb");
            formatted_resource(std::unique_ptr<io_stream> stream,
                               classification what);

            formatted_resource(formatted_resource&&) noexcept;
            formatted_resource& operator=(formatted_resource&&) noexcept;
            ~formatted_resource();

            [[nodiscard]] const format_id_t& format() const noexcept { return m_what.format; }
            [[nodiscard]] const std::optional<coding_id_t>& coding() const noexcept { return m_what.coding; }
            [[nodiscard]] const std::string& mode() const noexcept { return m_mode; }

            [[nodiscard]] bool is_path() const noexcept;

            /**
             * @brief The path, or nullptr for stream resources
             */
            [[nodiscard]] const std::filesystem::path* path() const noexcept;

            /**
             * @brief Raw byte stream of the resource (before any coding)
             *
             * Opens the path, or hands over the owned stream. A stream
             * resource can be opened once.
             *
             * @throws io_error if the path cannot be opened
             * @throws state_error if the stream was already taken
             */
            [[nodiscard]] std::unique_ptr<io_stream> open_raw();

            /**
             * @brief "path (format, coding)" style description for messages
             */
            [[nodiscard]] std::string describe() const;

        private:
            std::variant<std::filesystem::path, std::unique_ptr<io_stream>> m_source;
            classification m_what;
            std::string m_mode;
    };

    /**
     * @brief Tag a path with its format and optional coding
     * @param mode Open mode for the path ("rb", "wb", "r+b", ...)
     */
    FSTREAMS_EXPORT formatted_resource specify(std::filesystem::path path,
                                               format_id_t format,
                                               std::optional<coding_id_t> coding = std::nullopt,
                                               std::string mode = "rb");

    /**
     * @brief Tag an open byte stream with its format and optional coding
     */
    FSTREAMS_EXPORT formatted_resource specify(std::unique_ptr<io_stream> stream,
                                               format_id_t format,
                                               std::optional<coding_id_t> coding = std::nullopt);

} // namespace fstreams
