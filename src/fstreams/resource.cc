#include <fstreams/resource.hh>
#include <fstreams/error.hh>
#include <utility>

namespace fstreams {

    formatted_resource::formatted_resource(std::filesystem::path path,
                                           classification what,
                                           std::string mode)
        : m_source(std::move(path)),
          m_what(std::move(what)),
          m_mode(std::move(mode)) {
    }

    formatted_resource::formatted_resource(std::unique_ptr<io_stream> stream,
                                           classification what)
        : m_source(std::move(stream)),
          m_what(std::move(what)) {
    }

    formatted_resource::formatted_resource(formatted_resource&&) noexcept = default;
    formatted_resource& formatted_resource::operator=(formatted_resource&&) noexcept = default;
    formatted_resource::~formatted_resource() = default;

    bool formatted_resource::is_path() const noexcept {
        return std::holds_alternative<std::filesystem::path>(m_source);
    }

    const std::filesystem::path* formatted_resource::path() const noexcept {
        return std::get_if<std::filesystem::path>(&m_source);
    }

    std::unique_ptr<io_stream> formatted_resource::open_raw() {
        if (const auto* p = path()) {
            return io_from_file(*p, m_mode.c_str());
        }
        auto& stream = std::get<std::unique_ptr<io_stream>>(m_source);
        if (!stream) {
            throw state_error("byte stream of " + describe() + " was already taken");
        }
        return std::move(stream);
    }

    std::string formatted_resource::describe() const {
        std::string out = is_path() ? path()->string() : std::string("<stream>");
        out += " (" + m_what.format;
        if (m_what.coding) {
            out += ", " + *m_what.coding;
        }
        out += ")";
        return out;
    }

    formatted_resource specify(std::filesystem::path path,
                               format_id_t format,
                               std::optional<coding_id_t> coding,
                               std::string mode) {
        return formatted_resource(std::move(path),
                                  classification{std::move(format), std::move(coding)},
                                  std::move(mode));
    }

    formatted_resource specify(std::unique_ptr<io_stream> stream,
                               format_id_t format,
                               std::optional<coding_id_t> coding) {
        return formatted_resource(std::move(stream),
                                  classification{std::move(format), std::move(coding)});
    }

} // namespace fstreams
