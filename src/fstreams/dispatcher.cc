#include <fstreams/dispatcher.hh>
#include <fstreams/registry.hh>
#include <fstreams/error.hh>
#include <failsafe/failsafe.hh>

namespace fstreams {

void dispatcher::add_constructor(const handler& h, const format_id_t& format, constructor_func_t ctor) {
    if (!m_constructors.insert_or_assign(key_t{&h, format}, std::move(ctor)).second) {
        LOG_WARN("dispatcher", "replacing constructor of", h.get_name(), "for", format);
    }
}

bool dispatcher::has_constructor(const handler& h, const format_id_t& format) const {
    return m_constructors.find(key_t{&h, format}) != m_constructors.end();
}

std::unique_ptr<any_stream> dispatcher::dispatch(const handler& h,
                                                 const format_id_t& format,
                                                 std::unique_ptr<io_stream> io,
                                                 const open_options& options) const {
    auto it = m_constructors.find(key_t{&h, format});
    if (it == m_constructors.end() || !it->second) {
        throw no_constructor_registered(std::string("streamer ") + h.get_name()
                                        + " has no constructor for " + format);
    }
    if (!io) {
        throw io_error(std::string("no byte stream to open as ") + format);
    }

    auto stream = it->second(h, format, std::move(io), options);
    if (!stream) {
        throw state_error(std::string("streamer ") + h.get_name() + " produced no stream for " + format);
    }
    return stream;
}

size_t dispatcher::size() const {
    return m_constructors.size();
}

void dispatcher::clear() {
    m_constructors.clear();
}

dispatcher& default_dispatcher() {
    static dispatcher instance;
    return instance;
}

void register_streamer(registry& reg, dispatcher& disp,
                       const format_id_t& format, const handler& h,
                       dispatcher::constructor_func_t ctor) {
    reg.add_streamer(format, h);
    disp.add_constructor(h, format, std::move(ctor));
}

void register_streamer(const format_id_t& format, const handler& h,
                       dispatcher::constructor_func_t ctor) {
    register_streamer(default_registry(), default_dispatcher(), format, h, std::move(ctor));
}

} // namespace fstreams
