#include <fstreams/error.hh>
#include <fstreams/sdk/handler.hh>

#include <utility>

namespace fstreams {

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::none: return "none";
        case error_kind::duplicate_registration: return "duplicate registration";
        case error_kind::ambiguous_handler: return "ambiguous handler";
        case error_kind::no_handler_registered: return "no handler registered";
        case error_kind::unregistered_handler_preference: return "unregistered handler preference";
        case error_kind::already_global_favorite: return "already global favorite";
        case error_kind::unsupported_operation: return "unsupported operation";
        case error_kind::no_constructor_registered: return "no constructor registered";
        case error_kind::value_type_mismatch: return "value type mismatch";
        case error_kind::unknown_coding: return "unknown coding";
        case error_kind::classification: return "classification error";
        case error_kind::io: return "I/O error";
        case error_kind::state: return "state error";
        case error_kind::end_of_stream: return "end of stream";
        case error_kind::option: return "option error";
    }
    return "unknown";
}

fstreams_error::fstreams_error(error_kind kind, const std::string& what)
    : std::runtime_error(what), m_kind(kind) {
}

duplicate_registration::duplicate_registration(const std::string& what)
    : fstreams_error(error_kind::duplicate_registration, what) {
}

ambiguous_handler::ambiguous_handler(const std::string& format, std::vector<const handler*> candidates)
    : fstreams_error(error_kind::ambiguous_handler,
                     "ambiguous streamer for " + format + ", candidates: " + describe(candidates)),
      m_format(format),
      m_candidates(std::move(candidates)) {
}

no_handler_registered::no_handler_registered(const std::string& format)
    : fstreams_error(error_kind::no_handler_registered, "no streamer registered for " + format),
      m_format(format) {
}

unregistered_handler_preference::unregistered_handler_preference(const std::string& what)
    : fstreams_error(error_kind::unregistered_handler_preference, what) {
}

already_global_favorite::already_global_favorite(const std::string& what)
    : fstreams_error(error_kind::already_global_favorite, what) {
}

unsupported_operation::unsupported_operation(const std::string& what)
    : fstreams_error(error_kind::unsupported_operation, what) {
}

no_constructor_registered::no_constructor_registered(const std::string& what)
    : fstreams_error(error_kind::no_constructor_registered, what) {
}

value_type_mismatch::value_type_mismatch(const std::string& what)
    : fstreams_error(error_kind::value_type_mismatch, what) {
}

unknown_coding::unknown_coding(const std::string& coding)
    : fstreams_error(error_kind::unknown_coding, "no transform registered for coding " + coding) {
}

classification_error::classification_error(const std::string& what)
    : fstreams_error(error_kind::classification, what) {
}

io_error::io_error(const std::string& what)
    : fstreams_error(error_kind::io, what) {
}

state_error::state_error(const std::string& what)
    : fstreams_error(error_kind::state, what) {
}

end_of_stream::end_of_stream(const std::string& what)
    : fstreams_error(error_kind::end_of_stream, what) {
}

option_error::option_error(const std::string& what)
    : fstreams_error(error_kind::option, what) {
}

} // namespace fstreams
