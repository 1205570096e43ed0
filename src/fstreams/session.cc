#include <fstreams/session.hh>
#include <failsafe/failsafe.hh>

namespace fstreams::detail {

    void close_after_failure(any_stream& stream) {
        try {
            stream.close();
        } catch (const std::exception& e) {
            LOG_ERROR("session", "closing", stream.get_name(), "after a failed session also failed:", e.what());
        } catch (...) {
            LOG_ERROR("session", "closing", stream.get_name(), "after a failed session also failed: unknown exception");
        }
    }

} // namespace fstreams::detail
