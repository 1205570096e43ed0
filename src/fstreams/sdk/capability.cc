#include <fstreams/sdk/capability.hh>

namespace fstreams {

    const char* to_string(capability c) {
        switch (c) {
            case capability::read: return "read";
            case capability::read_into: return "read_into";
            case capability::seek: return "seek";
            case capability::seek_end: return "seek_end";
            case capability::length: return "length";
            case capability::write: return "write";
            case capability::truncate: return "truncate";
        }
        return "unknown";
    }

    std::string to_string(capability_set caps) {
        static constexpr capability order[] = {
            capability::read, capability::read_into, capability::seek, capability::seek_end,
            capability::length, capability::write, capability::truncate
        };
        std::string out;
        for (auto c : order) {
            if (caps.contains(c)) {
                if (!out.empty()) {
                    out += '|';
                }
                out += to_string(c);
            }
        }
        return out;
    }

} // namespace fstreams
