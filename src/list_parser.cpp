#include "storekit/storage/object_store.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace storekit {

// ============================================================================
// XML parsing helpers for listing responses (avoids regex for better reliability)
// ============================================================================

namespace xml {
namespace {

// Find the value between <tag>value</tag>. Empty optional if either tag is missing.
std::optional<std::string> get_element(const std::string& xml, const std::string& tag) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag);
    if (start == std::string::npos) return std::nullopt;
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return std::nullopt;

    return xml.substr(start, end - start);
}

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

// Find all occurrences of <tag>...</tag>. Sets unterminated when an opening
// tag has no matching close.
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag,
                                        bool& unterminated) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";
    unterminated = false;

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) {
            unterminated = true;
            break;
        }

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

// Append code point cp as UTF-8. False for NUL, surrogates and values past
// U+10FFFF, none of which a character reference may name.
bool append_utf8(std::string& out, uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return true;
}

// Decode XML entities (basic set used by S3, plus numeric references)
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            result += s[i++];
            continue;
        }
        if (s.compare(i, 4, "&lt;") == 0) {
            result += '<';
            i += 4;
        } else if (s.compare(i, 4, "&gt;") == 0) {
            result += '>';
            i += 4;
        } else if (s.compare(i, 5, "&amp;") == 0) {
            result += '&';
            i += 5;
        } else if (s.compare(i, 6, "&quot;") == 0) {
            result += '"';
            i += 6;
        } else if (s.compare(i, 6, "&apos;") == 0) {
            result += '\'';
            i += 6;
        } else if (s.compare(i, 2, "&#") == 0 && s.find(';', i) != std::string::npos) {
            size_t semi = s.find(';', i);
            bool hex = i + 2 < s.size() && (s[i + 2] == 'x' || s[i + 2] == 'X');
            size_t digits = i + (hex ? 3 : 2);
            uint32_t code = 0;
            auto [ptr, ec] = std::from_chars(s.data() + digits, s.data() + semi, code, hex ? 16 : 10);
            if (ec == std::errc() && ptr == s.data() + semi && append_utf8(result, code)) {
                i = semi + 1;
            } else {
                // Malformed or not a valid code point, keep as-is
                result += s[i++];
            }
        } else {
            // Unknown entity, keep as-is
            result += s[i++];
        }
    }

    return result;
}

}  // namespace
}  // namespace xml

namespace {

// ISO 8601 as returned by S3: 2023-12-15T14:30:00.000Z. Any number of
// fractional digits is accepted; precision beyond nanoseconds is dropped.
bool parse_last_modified(const std::string& date_str,
                         std::chrono::system_clock::time_point& out) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int consumed = 0;
    if (sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%d%n",
               &year, &month, &day, &hour, &min, &sec, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || min < 0 || min > 59 || sec < 0 || sec > 60) {
        return false;
    }

    const char* p = date_str.c_str() + consumed;
    int64_t fraction_ns = 0;
    if (*p == '.') {
        ++p;
        int digits = 0;
        for (; *p >= '0' && *p <= '9'; ++p, ++digits) {
            if (digits < 9) {
                fraction_ns = fraction_ns * 10 + (*p - '0');
            }
        }
        if (digits == 0) {
            return false;
        }
        for (int scale = digits; scale < 9; ++scale) {
            fraction_ns *= 10;
        }
    }
    if (p[0] != 'Z' || p[1] != '\0') {
        return false;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = 0;
    // Convert to time_t (UTC)
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(tt) +
          std::chrono::duration_cast<std::chrono::system_clock::duration>(
              std::chrono::nanoseconds(fraction_ns));
    return true;
}

bool parse_size(const std::string& size_str, uint64_t& out) {
    if (size_str.empty()) return false;
    auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), out);
    return ec == std::errc() && ptr == size_str.data() + size_str.size();
}

}  // namespace

ListResult parse_list_response(const std::string& body) {
    ListResult result;

    size_t root = body.find("<ListBucketResult");
    if (root == std::string::npos) {
        result.error = StorageError::parse("Response is not a ListBucketResult document");
        return result;
    }
    if (body.find("</ListBucketResult>", root) == std::string::npos) {
        result.error = StorageError::parse("Unterminated ListBucketResult element");
        return result;
    }

    auto truncated = xml::get_element(body, "IsTruncated");
    result.truncated = truncated && *truncated == "true";

    bool unterminated = false;
    auto ranges = xml::find_elements(body, "Contents", unterminated);
    if (unterminated) {
        result.error = StorageError::parse("Unterminated Contents element");
        return result;
    }

    result.entries.reserve(ranges.size());
    for (const auto& range : ranges) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);

        ListEntry entry;

        auto key = xml::get_element(content, "Key");
        if (!key) {
            result.error = StorageError::parse("Contents entry without a Key");
            result.entries.clear();
            return result;
        }
        entry.key = xml::decode_entities(*key);

        if (auto size_str = xml::get_element(content, "Size")) {
            if (!parse_size(*size_str, entry.size)) {
                result.error = StorageError::parse("Invalid Size for " + entry.key + ": " + *size_str);
                result.entries.clear();
                return result;
            }
        }

        if (auto date_str = xml::get_element(content, "LastModified")) {
            if (!parse_last_modified(*date_str, entry.last_modified)) {
                result.error = StorageError::parse("Invalid LastModified for " + entry.key + ": " + *date_str);
                result.entries.clear();
                return result;
            }
        }

        result.entries.push_back(std::move(entry));
    }

    return result;
}

}  // namespace storekit
