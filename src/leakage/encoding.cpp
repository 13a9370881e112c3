/*
 * taintguard C++17 - Reversible Encoding Decoders Implementation
 */
#include <taintguard/leakage/encoding.hpp>
#include <taintguard/core/logger.hpp>

#include <cctype>
#include <cstdint>
#include <cstring>

namespace taintguard {

// ============================================================================
// Helpers
// ============================================================================

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_hex(char c) {
    return hex_value(c) >= 0;
}

int base64_value(char c, bool url_safe) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (url_safe) {
        if (c == '-') return 62;
        if (c == '_') return 63;
    } else {
        if (c == '+') return 62;
        if (c == '/') return 63;
    }
    return -1;
}

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '+' || c == '/' || c == '-' || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool append_utf8(uint32_t cp, std::string& out) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
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

struct NamedEntity {
    const char* name;
    uint32_t code_point;
};

const NamedEntity NAMED_ENTITIES[] = {
    {"amp", '&'},
    {"lt", '<'},
    {"gt", '>'},
    {"quot", '"'},
    {"apos", '\''},
    {"nbsp", 0xA0},
    {"sol", '/'},
    {"colon", ':'},
    {"commat", '@'},
    {"period", '.'},
    {"hyphen", '-'},
    {"lowbar", '_'},
    {nullptr, 0}
};

} // anonymous namespace

// ============================================================================
// Decoders
// ============================================================================

bool decode_base64(const std::string& in, std::string& out) {
    size_t len = in.size();
    size_t padding = 0;
    while (len > 0 && in[len - 1] == '=') {
        --len;
        ++padding;
    }
    if (len == 0 || padding > 2) return false;

    bool has_std = false;
    bool has_url = false;
    for (size_t i = 0; i < len; ++i) {
        char c = in[i];
        if (c == '+' || c == '/') has_std = true;
        else if (c == '-' || c == '_') has_url = true;
    }
    if (has_std && has_url) return false;

    if (len % 4 == 1) return false;
    if (padding > 0 && (len + padding) % 4 != 0) return false;

    std::string result;
    result.reserve(len * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        int v = base64_value(in[i], has_url);
        if (v < 0) return false;
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    // Leftover bits of a canonical encoding are zero
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return false;
    }

    out.swap(result);
    return true;
}

bool decode_hex(const std::string& in, std::string& out) {
    size_t begin = 0;
    if (in.size() > 2 && in[0] == '0' && (in[1] == 'x' || in[1] == 'X')) {
        begin = 2;
    }
    size_t len = in.size() - begin;
    if (len == 0 || len % 2 != 0) return false;

    std::string result;
    result.reserve(len / 2);
    for (size_t i = begin; i < in.size(); i += 2) {
        int hi = hex_value(in[i]);
        int lo = hex_value(in[i + 1]);
        if (hi < 0 || lo < 0) return false;
        result += static_cast<char>((hi << 4) | lo);
    }
    out.swap(result);
    return true;
}

bool decode_percent(const std::string& in, std::string& out) {
    std::string result;
    result.reserve(in.size());
    bool decoded_any = false;

    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
            decoded_any = true;
        } else if (c == '+') {
            result += ' ';
            decoded_any = true;
        } else {
            result += c;
        }
    }
    if (!decoded_any) return false;
    out.swap(result);
    return true;
}

bool decode_escapes(const std::string& in, std::string& out) {
    std::string result;
    result.reserve(in.size());
    bool decoded_any = false;

    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c != '\\') {
            result += c;
            continue;
        }
        if (i + 1 >= in.size()) {
            return false;   // dangling backslash
        }
        char e = in[++i];
        switch (e) {
            case 'n': result += '\n'; break;
            case 't': result += '\t'; break;
            case 'r': result += '\r'; break;
            case '\\': result += '\\'; break;
            case '"': result += '"'; break;
            case '\'': result += '\''; break;
            case '/': result += '/'; break;
            case 'x': {
                if (i + 2 >= in.size()) return false;
                int hi = hex_value(in[i + 1]);
                int lo = hex_value(in[i + 2]);
                if (hi < 0 || lo < 0) return false;
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                break;
            }
            case 'u': {
                if (i + 4 >= in.size()) return false;
                uint32_t cp = 0;
                for (size_t k = 1; k <= 4; ++k) {
                    int v = hex_value(in[i + k]);
                    if (v < 0) return false;
                    cp = (cp << 4) | static_cast<uint32_t>(v);
                }
                if (!append_utf8(cp, result)) return false;
                i += 4;
                break;
            }
            default:
                if (e >= '0' && e <= '7') {
                    uint32_t value = static_cast<uint32_t>(e - '0');
                    size_t digits = 1;
                    while (digits < 3 && i + 1 < in.size() && in[i + 1] >= '0' && in[i + 1] <= '7') {
                        value = value * 8 + static_cast<uint32_t>(in[++i] - '0');
                        ++digits;
                    }
                    if (value > 0xFF) return false;
                    result += static_cast<char>(value);
                } else {
                    // Unknown escape: keep it verbatim
                    result += '\\';
                    result += e;
                    continue;
                }
                break;
        }
        decoded_any = true;
    }
    if (!decoded_any) return false;
    out.swap(result);
    return true;
}

bool decode_html_entities(const std::string& in, std::string& out) {
    std::string result;
    result.reserve(in.size());
    bool decoded_any = false;

    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '&') {
            result += in[i];
            continue;
        }
        size_t semi = in.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 12) {
            result += in[i];
            continue;
        }
        std::string body = in.substr(i + 1, semi - i - 1);
        if (body.empty()) {
            result += in[i];
            continue;
        }

        if (body[0] == '#') {
            bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
            size_t digits_at = hex ? 2 : 1;
            if (digits_at >= body.size()) return false;
            uint32_t cp = 0;
            for (size_t k = digits_at; k < body.size(); ++k) {
                char d = body[k];
                int v = hex ? hex_value(d) : ((d >= '0' && d <= '9') ? d - '0' : -1);
                if (v < 0) return false;
                cp = cp * (hex ? 16 : 10) + static_cast<uint32_t>(v);
                if (cp > 0x10FFFF) return false;
            }
            if (!append_utf8(cp, result)) return false;
            decoded_any = true;
            i = semi;
            continue;
        }

        bool named = false;
        for (const NamedEntity* ent = NAMED_ENTITIES; ent->name; ++ent) {
            if (body == ent->name) {
                append_utf8(ent->code_point, result);
                named = true;
                break;
            }
        }
        if (named) {
            decoded_any = true;
            i = semi;
        } else {
            result += in[i];
        }
    }
    if (!decoded_any) return false;
    out.swap(result);
    return true;
}

// ============================================================================
// EncodingScanner
// ============================================================================

EncodingScanner::EncodingScanner()
    : max_depth_(2)
    , min_encoded_length_(8) {}

EncodingScanner::EncodingScanner(int max_depth, size_t min_encoded_length)
    : max_depth_(max_depth)
    , min_encoded_length_(min_encoded_length) {}

std::vector<std::pair<size_t, size_t> > EncodingScanner::base64_spans(const std::string& text) const {
    std::vector<std::pair<size_t, size_t> > spans;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_base64_char(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_base64_char(text[i])) ++i;
        size_t body_len = i - start;
        size_t pad = 0;
        while (i < text.size() && text[i] == '=' && pad < 2) {
            ++i;
            ++pad;
        }
        if (body_len >= min_encoded_length_) {
            spans.push_back(std::make_pair(start, i));
        }
    }
    return spans;
}

std::vector<std::pair<size_t, size_t> > EncodingScanner::hex_spans(const std::string& text) const {
    std::vector<std::pair<size_t, size_t> > spans;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_hex(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_hex(text[i])) ++i;
        size_t len = i - start;
        if (len >= min_encoded_length_ && len % 2 == 0) {
            spans.push_back(std::make_pair(start, i));
        }
    }
    return spans;
}

std::vector<std::pair<size_t, size_t> > EncodingScanner::token_spans(const std::string& text) const {
    std::vector<std::pair<size_t, size_t> > spans;
    size_t i = 0;
    while (i < text.size()) {
        if (is_space(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i - start >= min_encoded_length_) {
            spans.push_back(std::make_pair(start, i));
        }
    }
    return spans;
}

namespace {

struct Attempt {
    const char* name;
    bool (*decode)(const std::string&, std::string&);
};

} // anonymous namespace

void EncodingScanner::extract_level(const std::string& text, size_t outer_start, size_t outer_end,
                                    const std::string& chain, int depth,
                                    std::vector<DecodedCandidate>& out, bool& truncated) const {
    std::vector<std::pair<std::pair<size_t, size_t>, Attempt> > attempts;

    std::vector<std::pair<size_t, size_t> > spans = base64_spans(text);
    for (size_t i = 0; i < spans.size(); ++i) {
        Attempt a = {"base64", &decode_base64};
        attempts.push_back(std::make_pair(spans[i], a));
    }
    spans = hex_spans(text);
    for (size_t i = 0; i < spans.size(); ++i) {
        Attempt a = {"hex", &decode_hex};
        attempts.push_back(std::make_pair(spans[i], a));
    }
    spans = token_spans(text);
    for (size_t i = 0; i < spans.size(); ++i) {
        const std::string token = text.substr(spans[i].first, spans[i].second - spans[i].first);
        if (token.find('%') != std::string::npos) {
            Attempt a = {"percent", &decode_percent};
            attempts.push_back(std::make_pair(spans[i], a));
        }
        if (token.find('\\') != std::string::npos) {
            Attempt a = {"escape", &decode_escapes};
            attempts.push_back(std::make_pair(spans[i], a));
        }
        if (token.find('&') != std::string::npos) {
            Attempt a = {"html", &decode_html_entities};
            attempts.push_back(std::make_pair(spans[i], a));
        }
    }

    size_t skipped = 0;
    for (size_t i = 0; i < attempts.size(); ++i) {
        if (out.size() >= MAX_CANDIDATES) {
            if (!truncated) {
                LOG_WARN("[Encoding] Candidate limit (%zu) reached, remaining spans not decoded",
                         static_cast<size_t>(MAX_CANDIDATES));
            }
            truncated = true;
            return;
        }

        size_t start = attempts[i].first.first;
        size_t end = attempts[i].first.second;
        const std::string encoded = text.substr(start, end - start);

        std::string decoded;
        if (!attempts[i].second.decode(encoded, decoded) || decoded.empty() || decoded == encoded) {
            ++skipped;
            continue;
        }

        DecodedCandidate cand;
        cand.start = depth == 1 ? start : outer_start;
        cand.end = depth == 1 ? end : outer_end;
        cand.encoding = chain.empty() ? std::string(attempts[i].second.name)
                                      : chain + ">" + attempts[i].second.name;
        cand.decoded = decoded;
        cand.depth = depth;
        out.push_back(cand);

        if (depth < max_depth_) {
            extract_level(cand.decoded, cand.start, cand.end, cand.encoding, depth + 1, out, truncated);
        }
    }

    if (skipped > 0) {
        LOG_DEBUG("[Encoding] depth %d: %zu decode attempts skipped", depth, skipped);
    }
}

std::vector<DecodedCandidate> EncodingScanner::extract(const std::string& text, bool* truncated) const {
    std::vector<DecodedCandidate> out;
    bool hit_limit = false;
    if (truncated) *truncated = false;
    if (max_depth_ <= 0 || text.size() < min_encoded_length_) {
        return out;
    }
    extract_level(text, 0, text.size(), "", 1, out, hit_limit);
    if (truncated) *truncated = hit_limit;
    return out;
}

} // namespace taintguard
