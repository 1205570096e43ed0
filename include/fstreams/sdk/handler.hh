/**
 * @file handler.hh
 * @brief Identity token of a streaming backend
 * @ingroup sdk
 */

#pragma once

#include <fstreams/export_fstreams.h>
#include <string>
#include <vector>

namespace fstreams {

    /**
     * @class handler
     * @brief Identifies one streaming backend for one or more formats
     * @ingroup sdk
     *
     * A handler carries no behaviour of its own: it is the key the registry
     * and the dispatcher use to find the constructor of a concrete stream.
     * Identity is object identity, so each backend exposes exactly one
     * instance, usually a function-local static:
     *
     * @code
     * class xtc_handler : public fstreams::handler {
     * public:
     *     const char* get_name() const override { return "xtc"; }
     * };
     *
     * const xtc_handler& xtc() {
     *     static xtc_handler instance;
     *     return instance;
     * }
     * @endcode
     *
     * The registry only stores pointers; the handler object must outlive every
     * registration that refers to it.
     */
    class FSTREAMS_EXPORT handler {
        public:
            handler() = default;
            virtual ~handler();

            handler(const handler&) = delete;
            handler& operator=(const handler&) = delete;
            handler(handler&&) = delete;
            handler& operator=(handler&&) = delete;

            /**
             * @brief Human-readable name used in log and error messages
             */
            [[nodiscard]] virtual const char* get_name() const = 0;
    };

    inline bool operator==(const handler& a, const handler& b) noexcept {
        return &a == &b;
    }

    inline bool operator!=(const handler& a, const handler& b) noexcept {
        return &a != &b;
    }

    /**
     * @brief Comma separated names of the given handlers
     */
    FSTREAMS_EXPORT std::string describe(const std::vector<const handler*>& handlers);

} // namespace fstreams
