#include <fstreams/classifier.hh>
#include <fstreams/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cctype>

namespace fstreams {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalized_suffix(const std::string& suffix) {
    if (suffix.empty() || suffix.front() == '.') {
        return lower(suffix);
    }
    return lower("." + suffix);
}

} // namespace

format_classifier::~format_classifier() = default;

void extension_classifier::add_format(const std::string& suffix, const format_id_t& format) {
    m_formats[normalized_suffix(suffix)] = format;
}

void extension_classifier::add_coding(const std::string& suffix, const coding_id_t& coding) {
    m_codings[normalized_suffix(suffix)] = coding;
}

void extension_classifier::set_stream_fallback(std::optional<format_id_t> format) {
    m_stream_fallback = std::move(format);
}

classification extension_classifier::classify(const std::filesystem::path& path) const {
    classification result;
    auto name = path.filename();
    auto suffix = lower(name.extension().string());

    auto coding = m_codings.find(suffix);
    if (coding != m_codings.end()) {
        result.coding = coding->second;
        suffix = lower(name.stem().extension().string());
    }

    auto format = m_formats.find(suffix);
    if (suffix.empty() || format == m_formats.end()) {
        throw classification_error("cannot guess format of " + path.string());
    }
    result.format = format->second;

    LOG_DEBUG("classifier", path.string(), "classified as", result.format,
              result.coding ? *result.coding : std::string("(no coding)"));
    return result;
}

classification extension_classifier::classify(io_stream&) const {
    if (!m_stream_fallback) {
        throw classification_error("cannot guess format of an unnamed byte stream");
    }
    return classification{*m_stream_fallback, std::nullopt};
}

void extension_classifier::clear() {
    m_formats.clear();
    m_codings.clear();
    m_stream_fallback.reset();
}

extension_classifier& default_classifier() {
    static extension_classifier instance;
    return instance;
}

} // namespace fstreams
