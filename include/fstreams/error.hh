// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <fstreams/export_fstreams.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace fstreams {

class handler;

/**
 * @enum error_kind
 * @brief Discriminator carried by every fstreams exception
 *
 * Lets callers switch on the failure instead of matching messages.
 * Also used as the status of registry::try_resolve().
 */
enum class error_kind : int {
    none = 0,
    duplicate_registration,
    ambiguous_handler,
    no_handler_registered,
    unregistered_handler_preference,
    already_global_favorite,
    unsupported_operation,
    no_constructor_registered,
    value_type_mismatch,
    unknown_coding,
    classification,
    io,
    state,
    end_of_stream,
    option
};

/**
 * @brief Human-readable name of an error kind
 */
FSTREAMS_EXPORT const char* to_string(error_kind kind);

/**
 * @brief Base exception class for all fstreams errors
 *
 * All fstreams-specific exceptions derive from this class, making it easy
 * to catch all fstreams errors with a single catch block.
 */
class FSTREAMS_EXPORT fstreams_error : public std::runtime_error {
public:
    fstreams_error(error_kind kind, const std::string& what);

    [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

private:
    error_kind m_kind;
};

/**
 * @brief A handler was registered twice for the same format
 */
class FSTREAMS_EXPORT duplicate_registration : public fstreams_error {
public:
    explicit duplicate_registration(const std::string& what);
};

/**
 * @brief Several handlers can stream a format and no preference decides
 *
 * The candidates are the handlers registered for the format, in
 * registration order.
 */
class FSTREAMS_EXPORT ambiguous_handler : public fstreams_error {
public:
    ambiguous_handler(const std::string& format, std::vector<const handler*> candidates);

    [[nodiscard]] const std::string& format() const noexcept { return m_format; }
    [[nodiscard]] const std::vector<const handler*>& candidates() const noexcept { return m_candidates; }

private:
    std::string m_format;
    std::vector<const handler*> m_candidates;
};

/**
 * @brief No handler is registered for the requested format
 */
class FSTREAMS_EXPORT no_handler_registered : public fstreams_error {
public:
    explicit no_handler_registered(const std::string& format);

    [[nodiscard]] const std::string& format() const noexcept { return m_format; }

private:
    std::string m_format;
};

/**
 * @brief A per-format preference names a handler not registered for it
 */
class FSTREAMS_EXPORT unregistered_handler_preference : public fstreams_error {
public:
    explicit unregistered_handler_preference(const std::string& what);
};

/**
 * @brief The handler is already a global favorite
 */
class FSTREAMS_EXPORT already_global_favorite : public fstreams_error {
public:
    explicit already_global_favorite(const std::string& what);
};

/**
 * @brief An optional stream operation the stream does not declare
 */
class FSTREAMS_EXPORT unsupported_operation : public fstreams_error {
public:
    explicit unsupported_operation(const std::string& what);
};

/**
 * @brief No constructor is registered for a (handler, format) pair
 */
class FSTREAMS_EXPORT no_constructor_registered : public fstreams_error {
public:
    explicit no_constructor_registered(const std::string& what);
};

/**
 * @brief A typed open produced a stream of another value type
 */
class FSTREAMS_EXPORT value_type_mismatch : public fstreams_error {
public:
    explicit value_type_mismatch(const std::string& what);
};

/**
 * @brief No coding transform is registered for a coding id
 */
class FSTREAMS_EXPORT unknown_coding : public fstreams_error {
public:
    explicit unknown_coding(const std::string& coding);
};

/**
 * @brief A resource could not be classified
 */
class FSTREAMS_EXPORT classification_error : public fstreams_error {
public:
    explicit classification_error(const std::string& what);
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when byte stream operations fail, such as:
 * - File not found
 * - Read/write errors
 * - Seek failures
 */
class FSTREAMS_EXPORT io_error : public fstreams_error {
public:
    explicit io_error(const std::string& what);
};

/**
 * @brief Operation attempted in an invalid state (e.g. on a closed stream)
 */
class FSTREAMS_EXPORT state_error : public fstreams_error {
public:
    explicit state_error(const std::string& what);
};

/**
 * @brief Read attempted at end of data
 */
class FSTREAMS_EXPORT end_of_stream : public fstreams_error {
public:
    explicit end_of_stream(const std::string& what);
};

/**
 * @brief Missing or mistyped open option
 */
class FSTREAMS_EXPORT option_error : public fstreams_error {
public:
    explicit option_error(const std::string& what);
};

} // namespace fstreams

/*
 * Copyright (C) 2025
 *
 * This file is part of fstreams.
 *
 * fstreams is free software: you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * fstreams is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with fstreams.  If not, see <http://www.gnu.org/licenses/>.
 */
