#include <fstreams/coding_registry.hh>
#include <fstreams/error.hh>
#include <failsafe/failsafe.hh>

namespace fstreams {

void coding_registry::add_transform(const coding_id_t& coding, transform_func_t transform) {
    if (m_transforms.count(coding) > 0) {
        LOG_WARN("codings", "replacing transform for", coding);
    }
    m_transforms[coding] = std::move(transform);
}

const coding_registry::transform_func_t& coding_registry::transform_for(const coding_id_t& coding) const {
    auto it = m_transforms.find(coding);
    if (it == m_transforms.end() || !it->second) {
        throw unknown_coding(coding);
    }
    return it->second;
}

std::unique_ptr<io_stream> coding_registry::apply(const coding_id_t& coding,
                                                  std::unique_ptr<io_stream> raw) const {
    const auto& transform = transform_for(coding);
    LOG_DEBUG("codings", "applying transform for", coding);
    auto decoded = transform(std::move(raw));
    if (!decoded) {
        throw io_error("transform for " + coding + " produced no stream");
    }
    return decoded;
}

bool coding_registry::contains(const coding_id_t& coding) const {
    return m_transforms.find(coding) != m_transforms.end();
}

std::vector<coding_id_t> coding_registry::codings() const {
    std::vector<coding_id_t> out;
    out.reserve(m_transforms.size());
    for (const auto& entry : m_transforms) {
        out.push_back(entry.first);
    }
    return out;
}

void coding_registry::clear() {
    m_transforms.clear();
}

coding_registry& default_codings() {
    static coding_registry instance;
    return instance;
}

} // namespace fstreams
