// This is copyrighted software. More information is at the end of this file.
#include <fstreams/sdk/formatted_stream.hh>

namespace fstreams {
    any_stream::any_stream()
        : m_is_open(true) {
    }

    any_stream::~any_stream() = default;

    bool any_stream::supports(capability c) const {
        return get_capabilities().contains(c);
    }

    bool any_stream::is_open() const {
        return m_is_open;
    }

    void any_stream::require_open() const {
        if (!m_is_open) {
            throw state_error(std::string(get_name()) + ": stream is closed");
        }
    }

    void any_stream::require(capability c) const {
        require_open();
        if (!supports(c)) {
            unsupported(c);
        }
    }

    void any_stream::unsupported(capability c) const {
        throw unsupported_operation(std::string(get_name()) + ": operation '" + to_string(c)
                                    + "' is not supported");
    }

    stream_pos_t any_stream::position() const {
        require_open();
        return do_position();
    }

    bool any_stream::eof() {
        require_open();
        return do_eof();
    }

    void any_stream::seek_start() {
        require_open();
        do_seek_start();
    }

    void any_stream::close() {
        if (!m_is_open) {
            return;
        }
        m_is_open = false;
        do_close();
    }

    void any_stream::seek(stream_pos_t index) {
        require(capability::seek);
        do_seek(index);
    }

    void any_stream::seek_end() {
        require(capability::seek_end);
        do_seek_end();
    }

    stream_pos_t any_stream::length() {
        require(capability::length);
        return do_length();
    }

    void any_stream::truncate(stream_pos_t count) {
        require(capability::truncate);
        do_truncate(count);
    }

    // Reached only when a stream declares a capability without implementing it
    void any_stream::do_seek(stream_pos_t) {
        unsupported(capability::seek);
    }

    void any_stream::do_seek_end() {
        unsupported(capability::seek_end);
    }

    stream_pos_t any_stream::do_length() {
        unsupported(capability::length);
    }

    void any_stream::do_truncate(stream_pos_t) {
        unsupported(capability::truncate);
    }
}

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
