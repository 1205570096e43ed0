/**
 * @file classifier.hh
 * @brief Format/coding inference for untagged resources
 * @ingroup resolver
 */

#pragma once

#include <fstreams/resource.hh>
#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/export_fstreams.h>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace fstreams {

    /**
     * @class format_classifier
     * @brief Guesses the format and coding of a resource
     * @ingroup resolver
     *
     * The resolver calls a classifier only for resources that were not
     * tagged with specify(). Implementations that sniff stream content must
     * leave the stream position where they found it.
     */
    class FSTREAMS_EXPORT format_classifier {
        public:
            virtual ~format_classifier();

            /**
             * @throws classification_error if the path cannot be classified
             */
            [[nodiscard]] virtual classification classify(const std::filesystem::path& path) const = 0;

            /**
             * @throws classification_error if the stream cannot be classified
             */
            [[nodiscard]] virtual classification classify(io_stream& stream) const = 0;
    };

    /**
     * @class extension_classifier
     * @brief Classifies paths by file suffix
     *
     * The last suffix is first looked up as a coding; if it names one, the
     * suffix before it gives the format ("run.xtc.gz"). Suffixes are matched
     * case-insensitively and include the dot.
     *
     * Streams carry no name: they classify as the stream fallback format if
     * one was set, and fail otherwise.
     */
    class FSTREAMS_EXPORT extension_classifier : public format_classifier {
        public:
            void add_format(const std::string& suffix, const format_id_t& format);
            void add_coding(const std::string& suffix, const coding_id_t& coding);
            void set_stream_fallback(std::optional<format_id_t> format);

            [[nodiscard]] classification classify(const std::filesystem::path& path) const override;
            [[nodiscard]] classification classify(io_stream& stream) const override;

            void clear();

        private:
            std::map<std::string, format_id_t> m_formats;
            std::map<std::string, coding_id_t> m_codings;
            std::optional<format_id_t> m_stream_fallback;
    };

    /**
     * @brief Process-wide classifier used by the free open functions
     */
    FSTREAMS_EXPORT extension_classifier& default_classifier();

} // namespace fstreams
