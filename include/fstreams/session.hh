/**
 * @file session.hh
 * @brief Run a function on a stream and close it on every exit path
 * @ingroup resolver
 */

#pragma once

#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/error.hh>
#include <fstreams/export_fstreams.h>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace fstreams {

    namespace detail {
        /**
         * @brief Close @p stream while another exception is in flight
         *
         * A close failure is logged and dropped so that it does not replace
         * the exception being propagated.
         */
        FSTREAMS_EXPORT void close_after_failure(any_stream& stream);
    }

    /**
     * @brief Call @p fn with @p stream, then close the stream
     *
     * The stream is closed exactly once whether @p fn returns or throws.
     * If @p fn throws, its exception propagates unchanged after the close;
     * if it returns, a failing close propagates instead.
     *
     * @return Whatever @p fn returns (by value)
     *
     * @code
     * auto count = close_after(open_stream<frame>("run.xtc"), [](auto& s) {
     *     size_t n = 0;
     *     for (const auto& f : each_value(s)) { n++; }
     *     return n;
     * });
     * @endcode
     */
    template<typename Stream, typename Func>
    auto close_after(std::unique_ptr<Stream> stream, Func&& fn) {
        static_assert(std::is_base_of_v<any_stream, Stream>, "close_after() needs a formatted stream");
        if (!stream) {
            throw state_error("no stream to run a session on");
        }

        using result_t = std::invoke_result_t<Func, Stream&>;
        if constexpr (std::is_void_v<result_t>) {
            try {
                std::invoke(std::forward<Func>(fn), *stream);
            } catch (...) {
                detail::close_after_failure(*stream);
                throw;
            }
            stream->close();
        } else {
            std::optional<std::decay_t<result_t>> result;
            try {
                result.emplace(std::invoke(std::forward<Func>(fn), *stream));
            } catch (...) {
                detail::close_after_failure(*stream);
                throw;
            }
            stream->close();
            return std::move(*result);
        }
    }

} // namespace fstreams
