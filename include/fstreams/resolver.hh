/**
 * @file resolver.hh
 * @brief Turns a resource into a formatted stream
 * @ingroup resolver
 */

#pragma once

#include <fstreams/classifier.hh>
#include <fstreams/coding_registry.hh>
#include <fstreams/dispatcher.hh>
#include <fstreams/registry.hh>
#include <fstreams/resource.hh>
#include <fstreams/session.hh>
#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/open_options.hh>
#include <fstreams/export_fstreams.h>
#include <filesystem>
#include <memory>
#include <utility>

namespace fstreams {

    /**
     * @class resolver
     * @brief Resolution chain from resource to stream
     * @ingroup resolver
     *
     * A resolver ties together the four collaborators of an open:
     * - the classifier, consulted for untagged paths and streams;
     * - the registry, which picks the handler for the format;
     * - the coding registry, which wraps the byte stream when the resource
     *   has a coding;
     * - the dispatcher, which builds the stream with the handler's
     *   constructor.
     *
     * It only keeps references; the collaborators must outlive it. The free
     * functions open_stream(), open_any_stream() and with_stream() use
     * default_resolver(), built on the process-wide instances.
     *
     * ## Usage
     *
     * @code
     * // format guessed from the suffix
     * auto s = open_stream<frame>("run.xtc");
     *
     * // format given explicitly, gzip coding
     * auto t = open_stream<frame>(specify("run.dat", "trajectory/x-trr", "application/gzip"));
     *
     * // opened, used, closed
     * auto n = with_stream<frame>("run.xtc", [](auto& s) { return s.length(); });
     * @endcode
     *
     * Failures of any step propagate unchanged: classification_error,
     * io_error, unknown_coding, no_handler_registered, ambiguous_handler,
     * no_constructor_registered, or whatever the constructor throws.
     */
    class FSTREAMS_EXPORT resolver {
        public:
            resolver(const registry& reg,
                     const dispatcher& disp,
                     const coding_registry& codings,
                     const format_classifier& classifier);

            /**
             * @brief Tag a path using the classifier
             */
            [[nodiscard]] formatted_resource classify(const std::filesystem::path& path) const;

            /**
             * @brief Tag a byte stream using the classifier
             */
            [[nodiscard]] formatted_resource classify(std::unique_ptr<io_stream> stream) const;

            /**
             * @brief Open a tagged resource
             *
             * Resolves the handler, opens the raw byte stream, applies the
             * coding transform and calls the handler's constructor.
             */
            [[nodiscard]] std::unique_ptr<any_stream> open_any(formatted_resource resource,
                                                              const open_options& options = {}) const;

            [[nodiscard]] std::unique_ptr<any_stream> open_any(const std::filesystem::path& path,
                                                              const open_options& options = {}) const;

            [[nodiscard]] std::unique_ptr<any_stream> open_any(std::unique_ptr<io_stream> stream,
                                                              const open_options& options = {}) const;

            /**
             * @brief Open @p io as @p format with a given handler
             *
             * Bypasses classification and the registry.
             */
            [[nodiscard]] std::unique_ptr<any_stream> open_with(const handler& h,
                                                               const format_id_t& format,
                                                               std::unique_ptr<io_stream> io,
                                                               const open_options& options = {}) const;

            /**
             * @brief Typed open
             * @throws value_type_mismatch if the stream does not produce T
             */
            template<typename T, typename Resource>
            [[nodiscard]] std::unique_ptr<formatted_stream<T>> open(Resource&& resource,
                                                                    const open_options& options = {}) const {
                return stream_cast<T>(open_any(std::forward<Resource>(resource), options));
            }

            /**
             * @brief Open, call @p fn with the stream, close
             * @see close_after()
             */
            template<typename T, typename Resource, typename Func>
            auto with_stream(Resource&& resource, Func&& fn, const open_options& options = {}) const {
                return close_after(open<T>(std::forward<Resource>(resource), options), std::forward<Func>(fn));
            }

            [[nodiscard]] const registry& get_registry() const noexcept { return m_registry; }
            [[nodiscard]] const dispatcher& get_dispatcher() const noexcept { return m_dispatcher; }

        private:
            const registry& m_registry;
            const dispatcher& m_dispatcher;
            const coding_registry& m_codings;
            const format_classifier& m_classifier;
    };

    /**
     * @brief Resolver over default_registry(), default_dispatcher(),
     *        default_codings() and default_classifier()
     */
    FSTREAMS_EXPORT const resolver& default_resolver();

    template<typename T, typename Resource>
    std::unique_ptr<formatted_stream<T>> open_stream(Resource&& resource, const open_options& options = {}) {
        return default_resolver().open<T>(std::forward<Resource>(resource), options);
    }

    template<typename Resource>
    std::unique_ptr<any_stream> open_any_stream(Resource&& resource, const open_options& options = {}) {
        return default_resolver().open_any(std::forward<Resource>(resource), options);
    }

    template<typename T, typename Resource, typename Func>
    auto with_stream(Resource&& resource, Func&& fn, const open_options& options = {}) {
        return default_resolver().with_stream<T>(std::forward<Resource>(resource), std::forward<Func>(fn), options);
    }

} // namespace fstreams
