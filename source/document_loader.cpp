// document_loader.cpp - JSON document loading with distinct read / parse failures

#include <keydiff/document_loader.h>
#include <keydiff/json.h>
#include <keydiff/log.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace keydiff {

namespace {

// Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(const std::string& text)
{
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + len >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            if (cc < min || cc > max) {
                return false;
            }
        }
        i += len + 1;
    }
    return true;
}

std::string read_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        detail::log_load_error("load_json_file", path.string(), "is a directory");
        throw ReadError(path, "is a directory");
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        const std::string reason = std::strerror(errno);
        detail::log_load_error("load_json_file", path.string(), reason);
        throw ReadError(path, reason);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        detail::log_load_error("load_json_file", path.string(), "I/O error while reading");
        throw ReadError(path, "I/O error while reading");
    }
    std::string text = buffer.str();
    if (!is_valid_utf8(text)) {
        detail::log_load_error("load_json_file", path.string(), "stream did not contain valid UTF-8");
        throw ReadError(path, "stream did not contain valid UTF-8");
    }
    return text;
}

Value parse_document(const std::string& text, const std::string& source)
{
    std::string error;
    Value doc = from_json(text, &error);
    if (!error.empty()) {
        detail::log_load_error("load_json", source, error);
        throw ParseError(source, error);
    }
    return doc;
}

ValueMap require_mapping(const Value& doc, const std::string& source)
{
    if (auto* m = doc.get_if<ValueMap>()) {
        return *m;
    }
    const std::string reason = "document root is not a JSON object (found " + value_to_string(doc) + ")";
    detail::log_load_error("load_json_mapping", source, reason);
    throw ParseError(source, reason);
}

} // anonymous namespace

Value load_json_file(const std::filesystem::path& path)
{
    return parse_document(read_file(path), path.string());
}

ValueMap load_json_mapping(const std::filesystem::path& path)
{
    return require_mapping(load_json_file(path), path.string());
}

ValueMap parse_json_mapping(const std::string& json_text, const std::string& source)
{
    return require_mapping(parse_document(json_text, source), source);
}

} // namespace keydiff
