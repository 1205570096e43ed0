/**
 * @file coding_registry.hh
 * @brief Transfer codings (compression and the like) applied to byte streams
 * @ingroup registry
 */

#pragma once

#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/export_fstreams.h>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace fstreams {

    /**
     * @class coding_registry
     * @brief Maps a coding id to the transform that decodes it
     * @ingroup registry
     *
     * A transform takes ownership of a byte stream and returns a stream
     * reading (or writing) through the coding, e.g. a gzip inflater. No
     * transform ships with the library; integrators register the ones their
     * formats need.
     *
     * @code
     * default_codings().add_transform("application/gzip",
     *     [](std::unique_ptr<io_stream> raw) {
     *         return std::make_unique<gzip_stream>(std::move(raw));
     *     });
     * @endcode
     */
    class FSTREAMS_EXPORT coding_registry {
        public:
            using transform_func_t = std::function<std::unique_ptr<io_stream>(std::unique_ptr<io_stream>)>;

            /**
             * @brief Register the transform for @p coding, replacing any previous one
             */
            void add_transform(const coding_id_t& coding, transform_func_t transform);

            /**
             * @throws unknown_coding if nothing is registered for @p coding
             */
            [[nodiscard]] const transform_func_t& transform_for(const coding_id_t& coding) const;

            /**
             * @brief Wrap @p raw in the transform for @p coding
             * @throws unknown_coding
             */
            [[nodiscard]] std::unique_ptr<io_stream> apply(const coding_id_t& coding,
                                                          std::unique_ptr<io_stream> raw) const;

            [[nodiscard]] bool contains(const coding_id_t& coding) const;
            [[nodiscard]] std::vector<coding_id_t> codings() const;
            void clear();

        private:
            std::map<coding_id_t, transform_func_t> m_transforms;
    };

    /**
     * @brief Process-wide coding registry used by the free open functions
     */
    FSTREAMS_EXPORT coding_registry& default_codings();

} // namespace fstreams
