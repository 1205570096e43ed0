/**
 * @file registry.hh
 * @brief Registry of format streamers and preference resolution
 * @ingroup registry
 */

#pragma once

#include <fstreams/sdk/handler.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/error.hh>
#include <fstreams/export_fstreams.h>
#include <map>
#include <utility>
#include <vector>

namespace fstreams {

    /**
     * @class registry
     * @brief Catalog of handlers per format, with favorites
     * @ingroup registry
     *
     * The registry keeps three structures:
     * - the handlers registered for each format, in registration order;
     * - at most one favorite handler per format;
     * - a set of globally favored handlers.
     *
     * ## Resolution
     *
     * resolve() picks the handler that streams a format:
     * 1. the per-format favorite, if any, wins over everything else;
     * 2. otherwise the only registered handler;
     * 3. otherwise the only registered handler that is a global favorite.
     * Anything else is an error: no_handler_registered when nothing is
     * registered, ambiguous_handler when zero or several global favorites
     * are among the candidates.
     *
     * @code
     * auto& reg = fstreams::default_registry();
     * reg.add_streamer("trajectory/x-xtc", xtc_native());
     * reg.add_streamer("trajectory/x-xtc", xtc_chemfiles());
     * reg.prefer(xtc_native(), "trajectory/x-xtc");
     * const handler& h = reg.resolve("trajectory/x-xtc");   // xtc_native
     * @endcode
     *
     * ## Thread Safety
     *
     * None. Register during initialization, resolve afterwards.
     */
    class FSTREAMS_EXPORT registry {
        public:
            /**
             * @struct resolution
             * @brief Outcome of try_resolve()
             *
             * @c chosen is set iff @c status is error_kind::none. For
             * error_kind::ambiguous_handler, @c candidates holds every handler
             * registered for the format.
             */
            struct resolution {
                error_kind status = error_kind::none;
                const handler* chosen = nullptr;
                std::vector<const handler*> candidates;

                explicit operator bool() const noexcept { return status == error_kind::none; }
            };

            /**
             * @brief Register @p h as able to stream @p format
             *
             * Registering a second handler for a format is allowed; it is
             * logged as an informational notice.
             *
             * @throws duplicate_registration if @p h is already registered for @p format
             */
            void add_streamer(const format_id_t& format, const handler& h);

            /**
             * @brief Make @p h a global favorite
             *
             * A global favorite breaks ties for every format it is registered
             * for, unless that format has its own favorite.
             *
             * @throws already_global_favorite if @p h is already one
             */
            void prefer(const handler& h);

            /**
             * @brief Make @p h the favorite for @p format
             *
             * Replaces an existing favorite (with a warning).
             *
             * @throws unregistered_handler_preference if @p h is not registered for @p format
             */
            void prefer(const handler& h, const format_id_t& format);

            /**
             * @brief The handler to stream @p format
             * @throws no_handler_registered, ambiguous_handler
             */
            [[nodiscard]] const handler& resolve(const format_id_t& format) const;

            /**
             * @brief Non-throwing form of resolve()
             */
            [[nodiscard]] resolution try_resolve(const format_id_t& format) const;

            /**
             * @brief Handlers registered for @p format, in registration order
             */
            [[nodiscard]] const std::vector<const handler*>& handlers_for(const format_id_t& format) const;

            /**
             * @brief Favorite for @p format, or nullptr
             */
            [[nodiscard]] const handler* favorite_for(const format_id_t& format) const;

            [[nodiscard]] bool is_global_favorite(const handler& h) const;
            [[nodiscard]] const std::vector<const handler*>& global_favorites() const;

            /**
             * @brief Formats with at least one registered handler, sorted
             */
            [[nodiscard]] std::vector<format_id_t> formats() const;

            [[nodiscard]] bool empty() const;

            /**
             * @brief Forget all handlers and favorites
             */
            void clear();

            /**
             * @brief Add the contents of @p other
             *
             * Handlers already registered for a format are skipped, per-format
             * favorites of @p other replace ours, global favorites are added
             * unless already present.
             */
            void merge(const registry& other);

        private:
            std::map<format_id_t, std::vector<const handler*>> m_streamers;
            std::map<format_id_t, const handler*> m_favorites;
            std::vector<const handler*> m_global_favorites;
    };

    /**
     * @brief Process-wide registry used by the free open functions
     */
    FSTREAMS_EXPORT registry& default_registry();

    /**
     * @class scoped_registry_override
     * @brief Temporarily replaces the contents of a registry
     * @ingroup registry
     *
     * The constructor saves the registry's state and empties it; the
     * destructor puts the saved state back, discarding whatever was
     * registered in between. Meant for tests and localized overrides.
     *
     * Only the registry is overridden. Constructors added to a dispatcher
     * in the meantime (e.g. through register_streamer()) stay registered;
     * save and restore a copy of the dispatcher where that matters.
     *
     * @code
     * {
     *     scoped_registry_override guard(default_registry());
     *     default_registry().add_streamer("text/x-lines", mock_handler());
     *     auto s = open_stream<std::string>(specify(io_from_bytes(data), "text/x-lines"));
     *     ...
     * }   // default_registry() is back to what it was
     * @endcode
     */
    class FSTREAMS_EXPORT scoped_registry_override {
        public:
            explicit scoped_registry_override(registry& target);
            ~scoped_registry_override();

            scoped_registry_override(const scoped_registry_override&) = delete;
            scoped_registry_override& operator=(const scoped_registry_override&) = delete;

        private:
            registry& m_target;
            registry m_saved;
    };

    /**
     * @brief Run @p fn against an emptied @p reg, then restore it
     *
     * @p fn registers the temporary handler set and runs the code using it.
     * The registry is restored on every exit path.
     */
    template<typename Func>
    decltype(auto) with_temporary_registry(registry& reg, Func&& fn) {
        scoped_registry_override guard(reg);
        return std::forward<Func>(fn)();
    }

} // namespace fstreams
