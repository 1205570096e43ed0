#include <fstreams/resolver.hh>
#include <fstreams/error.hh>
#include <failsafe/failsafe.hh>

namespace fstreams {

resolver::resolver(const registry& reg,
                   const dispatcher& disp,
                   const coding_registry& codings,
                   const format_classifier& classifier)
    : m_registry(reg),
      m_dispatcher(disp),
      m_codings(codings),
      m_classifier(classifier) {
}

formatted_resource resolver::classify(const std::filesystem::path& path) const {
    return formatted_resource(path, m_classifier.classify(path));
}

formatted_resource resolver::classify(std::unique_ptr<io_stream> stream) const {
    if (!stream) {
        throw io_error("cannot classify a null byte stream");
    }
    auto what = m_classifier.classify(*stream);
    return formatted_resource(std::move(stream), std::move(what));
}

std::unique_ptr<any_stream> resolver::open_any(formatted_resource resource, const open_options& options) const {
    // handler first: an unknown format must not open or transform anything
    const handler& h = m_registry.resolve(resource.format());

    auto io = resource.open_raw();
    if (resource.coding()) {
        io = m_codings.apply(*resource.coding(), std::move(io));
    }

    LOG_DEBUG("resolver", "opening", resource.describe(), "with", h.get_name());
    return m_dispatcher.dispatch(h, resource.format(), std::move(io), options);
}

std::unique_ptr<any_stream> resolver::open_any(const std::filesystem::path& path, const open_options& options) const {
    return open_any(classify(path), options);
}

std::unique_ptr<any_stream> resolver::open_any(std::unique_ptr<io_stream> stream, const open_options& options) const {
    return open_any(classify(std::move(stream)), options);
}

std::unique_ptr<any_stream> resolver::open_with(const handler& h,
                                                const format_id_t& format,
                                                std::unique_ptr<io_stream> io,
                                                const open_options& options) const {
    return m_dispatcher.dispatch(h, format, std::move(io), options);
}

const resolver& default_resolver() {
    static const resolver instance(default_registry(), default_dispatcher(),
                                   default_codings(), default_classifier());
    return instance;
}

} // namespace fstreams
