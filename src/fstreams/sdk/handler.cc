#include <fstreams/sdk/handler.hh>

namespace fstreams {

    handler::~handler() = default;

    std::string describe(const std::vector<const handler*>& handlers) {
        std::string out;
        for (const auto* h : handlers) {
            if (!out.empty()) {
                out += ", ";
            }
            out += h ? h->get_name() : "<null>";
        }
        return out;
    }

} // namespace fstreams
