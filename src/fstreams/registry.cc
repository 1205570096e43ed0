// This is copyrighted software. More information is at the end of this file.
#include <fstreams/registry.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace fstreams {

namespace {

bool contains(const std::vector<const handler*>& handlers, const handler* h) {
    return std::find(handlers.begin(), handlers.end(), h) != handlers.end();
}

const std::vector<const handler*>& no_handlers() {
    static const std::vector<const handler*> empty;
    return empty;
}

} // namespace

void registry::add_streamer(const format_id_t& format, const handler& h) {
    auto& streamers = m_streamers[format];
    if (contains(streamers, &h)) {
        throw duplicate_registration(std::string("streamer ") + h.get_name()
                                     + " already registered for " + format);
    }
    streamers.push_back(&h);

    if (streamers.size() > 1) {
        LOG_INFO("registry", format, "has multiple registered streamers:", describe(streamers));
    }
}

void registry::prefer(const handler& h) {
    if (contains(m_global_favorites, &h)) {
        throw already_global_favorite(std::string("streamer ") + h.get_name()
                                      + " is already globally preferred");
    }
    m_global_favorites.push_back(&h);
}

void registry::prefer(const handler& h, const format_id_t& format) {
    if (!contains(handlers_for(format), &h)) {
        throw unregistered_handler_preference(std::string("streamer ") + h.get_name()
                                              + " is not registered for " + format);
    }
    auto it = m_favorites.find(format);
    if (it != m_favorites.end()) {
        LOG_WARN("registry", "replacing preferred streamer for", format,
                 "(", it->second->get_name(), "->", h.get_name(), ")");
        it->second = &h;
        return;
    }
    m_favorites.emplace(format, &h);
}

registry::resolution registry::try_resolve(const format_id_t& format) const {
    resolution result;

    if (const handler* favorite = favorite_for(format)) {
        result.chosen = favorite;
        return result;
    }

    const auto& streamers = handlers_for(format);
    if (streamers.empty()) {
        result.status = error_kind::no_handler_registered;
        return result;
    }
    if (streamers.size() == 1) {
        result.chosen = streamers.front();
        return result;
    }

    const handler* favored = nullptr;
    size_t favored_count = 0;
    for (const auto* h : streamers) {
        if (contains(m_global_favorites, h)) {
            favored = h;
            favored_count++;
        }
    }
    if (favored_count == 1) {
        result.chosen = favored;
        return result;
    }

    result.status = error_kind::ambiguous_handler;
    result.candidates = streamers;
    return result;
}

const handler& registry::resolve(const format_id_t& format) const {
    auto result = try_resolve(format);
    switch (result.status) {
        case error_kind::none:
            break;
        case error_kind::no_handler_registered:
            throw no_handler_registered(format);
        default:
            throw ambiguous_handler(format, std::move(result.candidates));
    }
    LOG_DEBUG("registry", "resolved", format, "to", result.chosen->get_name());
    return *result.chosen;
}

const std::vector<const handler*>& registry::handlers_for(const format_id_t& format) const {
    auto it = m_streamers.find(format);
    return it == m_streamers.end() ? no_handlers() : it->second;
}

const handler* registry::favorite_for(const format_id_t& format) const {
    auto it = m_favorites.find(format);
    return it == m_favorites.end() ? nullptr : it->second;
}

bool registry::is_global_favorite(const handler& h) const {
    return contains(m_global_favorites, &h);
}

const std::vector<const handler*>& registry::global_favorites() const {
    return m_global_favorites;
}

std::vector<format_id_t> registry::formats() const {
    std::vector<format_id_t> out;
    for (const auto& [format, streamers] : m_streamers) {
        if (!streamers.empty()) {
            out.push_back(format);
        }
    }
    return out;
}

bool registry::empty() const {
    return formats().empty() && m_favorites.empty() && m_global_favorites.empty();
}

void registry::clear() {
    m_streamers.clear();
    m_favorites.clear();
    m_global_favorites.clear();
}

void registry::merge(const registry& other) {
    for (const auto& [format, streamers] : other.m_streamers) {
        auto& ours = m_streamers[format];
        for (const auto* h : streamers) {
            if (!contains(ours, h)) {
                ours.push_back(h);
            }
        }
    }
    for (const auto& [format, favorite] : other.m_favorites) {
        m_favorites[format] = favorite;
    }
    for (const auto* h : other.m_global_favorites) {
        if (!contains(m_global_favorites, h)) {
            m_global_favorites.push_back(h);
        }
    }
}

registry& default_registry() {
    static registry instance;
    return instance;
}

scoped_registry_override::scoped_registry_override(registry& target)
    : m_target(target), m_saved(target) {
    m_target.clear();
}

scoped_registry_override::~scoped_registry_override() {
    m_target = std::move(m_saved);
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
