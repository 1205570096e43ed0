/**
 * @file formatted_stream.hh
 * @brief Stream of decoded values and its capability contract
 * @ingroup stream_interface
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <fstreams/sdk/capability.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/error.hh>
#include <fstreams/export_fstreams.h>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace fstreams {
    /**
     * @class any_stream
     * @brief Value-type independent part of a formatted stream
     * @ingroup stream_interface
     *
     * Every stream produced by a handler derives from formatted_stream<T>,
     * which derives from this class. The resolver works with any_stream;
     * callers usually ask for the typed form.
     *
     * ## Contract
     *
     * Mandatory on every stream: position(), eof(), seek_start(), close().
     * Optional, declared through get_capabilities(): read, read_into, seek,
     * seek_end, length, write, truncate. The public methods are non-virtual:
     * they check the declaration and the open state, then call the protected
     * do_*() hook. Calling an undeclared operation throws
     * unsupported_operation; calling anything but close()/is_open() on a
     * closed stream throws state_error.
     *
     * ## Implementing a Stream
     *
     * @code
     * class xtc_stream : public formatted_stream<frame> {
     * public:
     *     static constexpr capability_set capabilities =
     *         capability::read | capability::read_into;
     *
     *     const char* get_name() const override { return "xtc"; }
     *     capability_set get_capabilities() const override { return capabilities; }
     *
     * protected:
     *     stream_pos_t do_position() const override { return m_index; }
     *     bool do_eof() override;
     *     void do_seek_start() override;
     *     void do_close() override { m_io->close(); }
     *     frame do_read() override;
     *     void do_read_into(frame& out) override;
     * };
     * @endcode
     *
     * A stream has one owner and one cursor; it is not thread-safe.
     */
    class FSTREAMS_EXPORT any_stream {
        public:
            any_stream();
            virtual ~any_stream();

            any_stream(const any_stream&) = delete;
            any_stream& operator=(const any_stream&) = delete;

            /**
             * @brief Human-readable name of the stream implementation
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief The optional operations this stream type implements
             *
             * Must return the same set for every instance of a concrete type.
             */
            [[nodiscard]] virtual capability_set get_capabilities() const = 0;

            /**
             * @brief Type of the decoded values
             */
            [[nodiscard]] virtual std::type_index value_type() const = 0;

            [[nodiscard]] bool supports(capability c) const;

            /**
             * @brief Index of the next value
             */
            [[nodiscard]] stream_pos_t position() const;

            /**
             * @brief True when no value is left to read
             */
            [[nodiscard]] bool eof();

            /**
             * @brief Move the cursor back to the first value
             */
            void seek_start();

            /**
             * @brief Release the stream's resources
             *
             * Only the first call reaches the implementation; later calls do
             * nothing. The stream counts as closed even if the implementation
             * throws.
             */
            void close();

            [[nodiscard]] bool is_open() const;

            /**
             * @brief Move the cursor to value @p index
             * @throws unsupported_operation unless capability::seek is declared
             */
            void seek(stream_pos_t index);

            /**
             * @brief Move the cursor past the last value
             * @throws unsupported_operation unless capability::seek_end is declared
             */
            void seek_end();

            /**
             * @brief Number of values in the stream
             *
             * Only declared by layouts where the count is known without
             * scanning.
             *
             * @throws unsupported_operation unless capability::length is declared
             */
            [[nodiscard]] stream_pos_t length();

            /**
             * @brief Keep the first @p count values, drop the rest
             * @throws unsupported_operation unless capability::truncate is declared
             */
            void truncate(stream_pos_t count);

        protected:
            /**
             * @brief Throw unless open and @p c is declared
             */
            void require(capability c) const;
            void require_open() const;

            [[noreturn]] void unsupported(capability c) const;

            [[nodiscard]] virtual stream_pos_t do_position() const = 0;
            [[nodiscard]] virtual bool do_eof() = 0;
            virtual void do_seek_start() = 0;
            virtual void do_close() = 0;

            virtual void do_seek(stream_pos_t index);
            virtual void do_seek_end();
            [[nodiscard]] virtual stream_pos_t do_length();
            virtual void do_truncate(stream_pos_t count);

        private:
            bool m_is_open;
    };

    /**
     * @class formatted_stream
     * @brief Stream of values of type T
     * @ingroup stream_interface
     *
     * Adds the value-typed optional operations to any_stream.
     */
    template<typename T>
    class formatted_stream : public any_stream {
        public:
            using value_t = T;

            [[nodiscard]] std::type_index value_type() const final {
                return std::type_index(typeid(T));
            }

            /**
             * @brief Decode and return the next value
             * @throws end_of_stream at end of data
             * @throws unsupported_operation unless capability::read is declared
             */
            T read() {
                require(capability::read);
                if (do_eof()) {
                    throw end_of_stream(std::string(get_name()) + ": read past end of stream");
                }
                return do_read();
            }

            /**
             * @brief Decode the next value into @p out
             * @return @p out, populated
             * @throws end_of_stream at end of data
             * @throws unsupported_operation unless capability::read_into is declared
             */
            T& read_into(T& out) {
                require(capability::read_into);
                if (do_eof()) {
                    throw end_of_stream(std::string(get_name()) + ": read past end of stream");
                }
                do_read_into(out);
                return out;
            }

            /**
             * @brief Write @p value at the cursor, overwriting or appending
             * @throws unsupported_operation unless capability::write is declared
             */
            void write(const T& value) {
                require(capability::write);
                do_write(value);
            }

        protected:
            virtual T do_read() {
                unsupported(capability::read);
            }

            virtual void do_read_into(T&) {
                unsupported(capability::read_into);
            }

            virtual void do_write(const T&) {
                unsupported(capability::write);
            }
    };

    /**
     * @brief Downcast an untyped stream to its value type
     * @throws value_type_mismatch if the stream does not produce T
     */
    template<typename T>
    std::unique_ptr<formatted_stream<T>> stream_cast(std::unique_ptr<any_stream> stream) {
        if (!stream) {
            return nullptr;
        }
        auto* typed = dynamic_cast<formatted_stream<T>*>(stream.get());
        if (!typed) {
            throw value_type_mismatch(std::string(stream->get_name()) + " produces values of type "
                                      + stream->value_type().name() + ", not " + typeid(T).name());
        }
        stream.release();
        return std::unique_ptr<formatted_stream<T>>(typed);
    }

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
