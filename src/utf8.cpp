#include "utf8.hpp"

namespace reviewer {

namespace {

const char* kReplacement = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at `i`, or 0 (RFC 3629: no overlongs, no surrogates).
size_t sequence_length(const std::string& s, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char c = byte(i);
    if (c < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) return 0;
    }
    return len;
}

} // namespace

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    // Back up to the lead byte of the character that straddles the cut
    size_t cut = length;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) --cut;
    return str.substr(0, cut);
}

bool is_valid_utf8(const std::string& str) {
    for (size_t i = 0; i < str.size();) {
        size_t len = sequence_length(str, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::string to_valid_utf8(const std::string& str) {
    if (is_valid_utf8(str)) return str;

    std::string out;
    out.reserve(str.size() + 16);
    for (size_t i = 0; i < str.size();) {
        size_t len = sequence_length(str, i);
        if (len == 0) {
            out += kReplacement;
            ++i;
        } else {
            out.append(str, i, len);
            i += len;
        }
    }
    return out;
}

void make_valid_utf8(nlohmann::json& j) {
    if (j.is_string()) {
        auto& s = j.get_ref<std::string&>();
        if (!is_valid_utf8(s)) s = to_valid_utf8(s);
    } else if (j.is_array()) {
        for (auto& item : j) make_valid_utf8(item);
    } else if (j.is_object()) {
        bool bad_key = false;
        for (auto it = j.begin(); it != j.end(); ++it) {
            make_valid_utf8(it.value());
            if (!is_valid_utf8(it.key())) bad_key = true;
        }
        if (!bad_key) return;
        nlohmann::json fixed = nlohmann::json::object();
        for (auto it = j.begin(); it != j.end(); ++it) fixed[to_valid_utf8(it.key())] = std::move(it.value());
        j = std::move(fixed);
    }
}

} // namespace reviewer
