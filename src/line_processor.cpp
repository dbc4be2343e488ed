#include "line_processor.hpp"
#include "text_utils.hpp"

#include <exception>
#include <vector>

namespace datelang {

// ============================================================================
// JSON line builder using thread_local buffers
// ============================================================================

// Cross-platform force inline macro
#if defined(_MSC_VER)
    #define FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
    #define FORCE_INLINE __attribute__((always_inline)) inline
#else
    #define FORCE_INLINE inline
#endif

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

FORCE_INLINE void append_int(std::string& out, int64_t val) {
    if (val == 0) {
        out += '0';
        return;
    }
    if (val < 0) {
        out += '-';
        val = -val;
    }
    char buf[20];
    char* p = buf + 20;
    while (val > 0) {
        *--p = '0' + (val % 10);
        val /= 10;
    }
    out.append(p, buf + 20 - p);
}

FORCE_INLINE void escape_json_to(std::string& out, const std::string& s) {
    for (unsigned char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += HEX_DIGITS[(c >> 4) & 0xF];
                    out += HEX_DIGITS[c & 0xF];
                } else {
                    out += c;
                }
        }
    }
}

FORCE_INLINE void append_string_array(std::string& out, const std::vector<std::string>& items) {
    out += '[';
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        escape_json_to(out, items[i]);
        out += '"';
    }
    out += ']';
}

void append_result(std::string& buffer, const Language& language, const LineOptions& options,
                   const Settings& settings, const std::string& text) {
    switch (options.mode) {
        case Mode::Translate:
            buffer += ",\"translation\":\"";
            escape_json_to(buffer, language.translate(text, options.keep_formatting, settings));
            buffer += '"';
            break;
        case Mode::Search: {
            auto result = language.translate_search(text, settings);
            buffer += ",\"translated\":";
            append_string_array(buffer, result.translated);
            buffer += ",\"original\":";
            append_string_array(buffer, result.original);
            break;
        }
        case Mode::Applicable:
            buffer += ",\"applicable\":";
            buffer += language.is_applicable(text, options.strip_timezone, settings) ? "true" : "false";
            break;
    }
}

} // namespace

bool parse_mode(const std::string& value, Mode& mode) {
    if (value == "translate") { mode = Mode::Translate; return true; }
    if (value == "search") { mode = Mode::Search; return true; }
    if (value == "applicable") { mode = Mode::Applicable; return true; }
    return false;
}

std::string process_line(const Language& language, const LineOptions& options, const Settings& settings,
                         int64_t id, const std::string& line, std::string& error) {
    thread_local std::string buffer;
    buffer.clear();
    buffer.reserve(512);
    error.clear();

    buffer += "{\"id\":";
    append_int(buffer, id);
    buffer += ",\"input\":\"";
    escape_json_to(buffer, line);
    buffer += '"';
    size_t header = buffer.size();

    try {
        std::string text = settings.normalize ? normalize_unicode(line) : line;
        append_result(buffer, language, options, settings, text);
    } catch (const std::exception& e) {
        error = e.what();
        buffer.resize(header);
        buffer += ",\"error\":\"";
        escape_json_to(buffer, error);
        buffer += '"';
    }

    buffer += '}';
    return buffer;
}

} // namespace datelang
