/**
 * @file dispatcher.hh
 * @brief Constructor table keyed by (handler, format)
 * @ingroup registry
 */

#pragma once

#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/sdk/handler.hh>
#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/open_options.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/export_fstreams.h>
#include <functional>
#include <map>
#include <memory>
#include <utility>

namespace fstreams {

    class registry;

    /**
     * @class dispatcher
     * @brief Maps a (handler, format) pair to the function building its stream
     * @ingroup registry
     *
     * This is the extension point for integrators. A handler may stream
     * several formats with a different constructor for each; the registry
     * decides which handler to use, the dispatcher knows how to build the
     * stream once the handler is chosen.
     *
     * The constructor receives the prepared byte stream (already opened and
     * decoded from its coding) and owns it from then on. It validates the
     * layout and throws on malformed input.
     *
     * @code
     * default_dispatcher().add_constructor(xtc(), "trajectory/x-xtc",
     *     [](const handler&, const format_id_t&, std::unique_ptr<io_stream> io,
     *        const open_options& opts) -> std::unique_ptr<any_stream> {
     *         return std::make_unique<xtc_stream>(std::move(io), opts);
     *     });
     * @endcode
     *
     * @note Not thread-safe - configure at startup
     */
    class FSTREAMS_EXPORT dispatcher {
        public:
            using constructor_func_t = std::function<std::unique_ptr<any_stream>(
                const handler&, const format_id_t&, std::unique_ptr<io_stream>, const open_options&)>;

            /**
             * @brief Register the constructor for (@p h, @p format)
             *
             * A second registration for the same pair replaces the first,
             * with a warning.
             */
            void add_constructor(const handler& h, const format_id_t& format, constructor_func_t ctor);

            [[nodiscard]] bool has_constructor(const handler& h, const format_id_t& format) const;

            /**
             * @brief Build the stream for @p format with handler @p h
             *
             * @throws no_constructor_registered if nothing is registered for the pair
             * @throws state_error if the constructor produced no stream
             * @note Whatever the constructor throws propagates unchanged
             */
            [[nodiscard]] std::unique_ptr<any_stream> dispatch(const handler& h,
                                                              const format_id_t& format,
                                                              std::unique_ptr<io_stream> io,
                                                              const open_options& options = {}) const;

            [[nodiscard]] size_t size() const;
            void clear();

        private:
            using key_t = std::pair<const handler*, format_id_t>;
            std::map<key_t, constructor_func_t> m_constructors;
    };

    /**
     * @brief Process-wide dispatcher used by the free open functions
     */
    FSTREAMS_EXPORT dispatcher& default_dispatcher();

    /**
     * @brief Constructor building @p Stream from (io, options)
     *
     * @p Stream must be constructible from
     * (std::unique_ptr<io_stream>, const open_options&).
     */
    template<typename Stream>
    dispatcher::constructor_func_t make_constructor() {
        return [](const handler&, const format_id_t&, std::unique_ptr<io_stream> io,
                  const open_options& options) -> std::unique_ptr<any_stream> {
            return std::make_unique<Stream>(std::move(io), options);
        };
    }

    /**
     * @brief Register @p h for @p format in @p reg and its constructor in @p disp
     *
     * @throws duplicate_registration as registry::add_streamer(); the
     *         dispatcher is left untouched in that case
     */
    FSTREAMS_EXPORT void register_streamer(registry& reg, dispatcher& disp,
                                           const format_id_t& format, const handler& h,
                                           dispatcher::constructor_func_t ctor);

    /**
     * @brief register_streamer() on the process-wide registry and dispatcher
     */
    FSTREAMS_EXPORT void register_streamer(const format_id_t& format, const handler& h,
                                           dispatcher::constructor_func_t ctor);

} // namespace fstreams
