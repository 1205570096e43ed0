#include <fstreams/sdk/open_options.hh>

namespace fstreams {

    bool open_options::contains(const std::string& name) const {
        return m_values.find(name) != m_values.end();
    }

    bool open_options::empty() const {
        return m_values.empty();
    }

    size_t open_options::size() const {
        return m_values.size();
    }

} // namespace fstreams
