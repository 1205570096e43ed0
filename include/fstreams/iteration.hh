/**
 * @file iteration.hh
 * @brief Range adapters over formatted streams
 * @ingroup stream_interface
 */

#ifndef FSTREAMS_ITERATION_HH
#define FSTREAMS_ITERATION_HH

#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/error.hh>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace fstreams {

    namespace detail {
        template<typename T>
        void require_capability(formatted_stream<T>& stream, capability c) {
            if (!stream.supports(c)) {
                throw unsupported_operation(std::string(stream.get_name()) + ": operation '" + to_string(c)
                                            + "' is not supported");
            }
        }
    }

    /**
     * @class value_range
     * @brief Iterates over the values of a stream, yielding each by value
     * @ingroup stream_interface
     *
     * begin() rewinds the stream; each step reads one value until eof().
     * Calling begin() again (or building a new range) starts over from the
     * first value. The range shares the stream's cursor: two ranges over the
     * same stream iterated at once interfere with each other.
     *
     * The number of values is not known in advance.
     */
    template<typename T>
    class value_range {
        public:
            class iterator {
                public:
                    using iterator_category = std::input_iterator_tag;
                    using value_type = T;
                    using difference_type = std::ptrdiff_t;
                    using pointer = T*;
                    using reference = T&;

                    iterator() = default;

                    explicit iterator(formatted_stream<T>* stream)
                        : m_stream(stream) {
                        advance();
                    }

                    reference operator*() { return *m_value; }
                    pointer operator->() { return &*m_value; }

                    iterator& operator++() {
                        advance();
                        return *this;
                    }

                    void operator++(int) {
                        advance();
                    }

                    friend bool operator==(const iterator& a, const iterator& b) {
                        return a.m_stream == b.m_stream;
                    }

                    friend bool operator!=(const iterator& a, const iterator& b) {
                        return a.m_stream != b.m_stream;
                    }

                private:
                    void advance() {
                        if (m_stream->eof()) {
                            m_stream = nullptr;
                            m_value.reset();
                        } else {
                            m_value = m_stream->read();
                        }
                    }

                    formatted_stream<T>* m_stream = nullptr;
                    std::optional<T> m_value;
            };

            /**
             * @throws unsupported_operation unless the stream can read()
             */
            explicit value_range(formatted_stream<T>& stream)
                : m_stream(&stream) {
                detail::require_capability(stream, capability::read);
            }

            iterator begin() {
                m_stream->seek_start();
                return iterator(m_stream);
            }

            iterator end() {
                return iterator();
            }

        private:
            formatted_stream<T>* m_stream;
    };

    /**
     * @class buffered_value_range
     * @brief Iterates over the values of a stream, decoding into one object
     * @ingroup stream_interface
     *
     * Same control flow as value_range, but each step calls read_into() on
     * a single output value. Every dereference yields a reference to that
     * same object, overwritten by the next step: copy it to keep a value.
     *
     * The output value is either the caller's (lvalue overload of
     * each_value_into()) or owned by the range (rvalue overload).
     */
    template<typename T>
    class buffered_value_range {
        public:
            class iterator {
                public:
                    using iterator_category = std::input_iterator_tag;
                    using value_type = T;
                    using difference_type = std::ptrdiff_t;
                    using pointer = T*;
                    using reference = T&;

                    iterator() = default;

                    iterator(formatted_stream<T>* stream, T* output)
                        : m_stream(stream), m_output(output) {
                        advance();
                    }

                    reference operator*() const { return *m_output; }
                    pointer operator->() const { return m_output; }

                    iterator& operator++() {
                        advance();
                        return *this;
                    }

                    void operator++(int) {
                        advance();
                    }

                    friend bool operator==(const iterator& a, const iterator& b) {
                        return a.m_stream == b.m_stream;
                    }

                    friend bool operator!=(const iterator& a, const iterator& b) {
                        return a.m_stream != b.m_stream;
                    }

                private:
                    void advance() {
                        if (m_stream->eof()) {
                            m_stream = nullptr;
                        } else {
                            m_stream->read_into(*m_output);
                        }
                    }

                    formatted_stream<T>* m_stream = nullptr;
                    T* m_output = nullptr;
            };

            /**
             * @brief Decode into the caller's @p output
             * @throws unsupported_operation unless the stream can read_into()
             */
            buffered_value_range(formatted_stream<T>& stream, T& output)
                : m_stream(&stream), m_output(&output) {
                detail::require_capability(stream, capability::read_into);
            }

            /**
             * @brief Decode into an output owned by the range
             */
            buffered_value_range(formatted_stream<T>& stream, T&& output)
                : m_stream(&stream), m_owned(std::move(output)), m_output(&*m_owned) {
                detail::require_capability(stream, capability::read_into);
            }

            // iterators point into the range
            buffered_value_range(const buffered_value_range&) = delete;
            buffered_value_range& operator=(const buffered_value_range&) = delete;

            iterator begin() {
                m_stream->seek_start();
                return iterator(m_stream, m_output);
            }

            iterator end() {
                return iterator();
            }

            /**
             * @brief The object every step decodes into
             */
            T& output() noexcept { return *m_output; }

        private:
            formatted_stream<T>* m_stream;
            std::optional<T> m_owned;
            T* m_output;
    };

    /**
     * @brief Iterate over the values of @p stream
     *
     * @code
     * for (const auto& frame : each_value(*s)) { ... }
     * @endcode
     */
    template<typename T>
    value_range<T> each_value(formatted_stream<T>& stream) {
        return value_range<T>(stream);
    }

    /**
     * @brief Iterate over the values of @p stream, decoding into @p output
     */
    template<typename T>
    buffered_value_range<T> each_value_into(formatted_stream<T>& stream, T& output) {
        return buffered_value_range<T>(stream, output);
    }

    /**
     * @brief Iterate over the values of @p stream, decoding into a range-owned @p output
     *
     * @code
     * for (auto& frame : each_value_into(*s, frame{})) { ... }
     * @endcode
     */
    template<typename T>
    buffered_value_range<T> each_value_into(formatted_stream<T>& stream, T&& output) {
        return buffered_value_range<T>(stream, std::move(output));
    }

} // namespace fstreams

#endif // FSTREAMS_ITERATION_HH
