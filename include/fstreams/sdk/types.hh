/**
 * @file types.hh
 * @brief Identifier and position types shared by the whole library
 * @ingroup sdk_types
 */

#ifndef FSTREAMS_SDK_TYPES_HH
#define FSTREAMS_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>
#include <string>

namespace fstreams {

/**
 * @typedef format_id_t
 * @brief Opaque media-type style key naming a data format
 *
 * e.g. "trajectory/x-xtc". The library never looks inside; the value is
 * only used as a map key and in messages.
 */
using format_id_t = std::string;

/**
 * @typedef coding_id_t
 * @brief Opaque key naming a transfer coding applied atop a format
 *
 * e.g. "application/gzip".
 */
using coding_id_t = std::string;

/**
 * @typedef stream_pos_t
 * @brief Index of a value inside a formatted stream
 *
 * Counts decoded values, not bytes.
 */
using stream_pos_t = int64_t;

} // namespace fstreams

#endif // FSTREAMS_SDK_TYPES_HH
