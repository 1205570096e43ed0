/**
 * @file capability.hh
 * @brief Optional operations a formatted stream may declare
 * @ingroup sdk
 */

#pragma once

#include <fstreams/export_fstreams.h>
#include <cstdint>
#include <string>

namespace fstreams {

    /**
     * @enum capability
     * @brief One optional stream operation
     */
    enum class capability : uint32_t {
        read      = 1u << 0,  ///< formatted_stream::read()
        read_into = 1u << 1,  ///< formatted_stream::read_into()
        seek      = 1u << 2,  ///< any_stream::seek()
        seek_end  = 1u << 3,  ///< any_stream::seek_end()
        length    = 1u << 4,  ///< any_stream::length()
        write     = 1u << 5,  ///< formatted_stream::write()
        truncate  = 1u << 6   ///< any_stream::truncate()
    };

    FSTREAMS_EXPORT const char* to_string(capability c);

    /**
     * @class capability_set
     * @brief Compile-time friendly set of capabilities
     *
     * Concrete streams declare their set as a static constant:
     *
     * @code
     * static constexpr capability_set capabilities =
     *     capability::read | capability::seek | capability::length;
     * @endcode
     */
    class capability_set {
        public:
            constexpr capability_set() noexcept = default;
            constexpr capability_set(capability c) noexcept // NOLINT(google-explicit-constructor)
                : m_bits(static_cast<uint32_t>(c)) {
            }

            [[nodiscard]] constexpr bool contains(capability c) const noexcept {
                return (m_bits & static_cast<uint32_t>(c)) != 0;
            }

            [[nodiscard]] constexpr bool empty() const noexcept {
                return m_bits == 0;
            }

            [[nodiscard]] constexpr uint32_t bits() const noexcept {
                return m_bits;
            }

            constexpr capability_set operator|(capability_set other) const noexcept {
                return capability_set(m_bits | other.m_bits);
            }

            constexpr capability_set operator&(capability_set other) const noexcept {
                return capability_set(m_bits & other.m_bits);
            }

            constexpr bool operator==(capability_set other) const noexcept {
                return m_bits == other.m_bits;
            }

            constexpr bool operator!=(capability_set other) const noexcept {
                return m_bits != other.m_bits;
            }

            /**
             * @brief Every capability there is
             */
            static constexpr capability_set all() noexcept {
                return capability_set(0x7fu);
            }

        private:
            constexpr explicit capability_set(uint32_t bits) noexcept
                : m_bits(bits) {
            }

            uint32_t m_bits = 0;
    };

    constexpr capability_set operator|(capability a, capability b) noexcept {
        return capability_set(a) | capability_set(b);
    }

    /**
     * @brief Names of the capabilities in the set, e.g. "read|seek"
     */
    FSTREAMS_EXPORT std::string to_string(capability_set caps);

} // namespace fstreams
