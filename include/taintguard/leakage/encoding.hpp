/*
 * taintguard C++17 - Reversible Encoding Decoders
 *
 * Finds spans of text that look like base64, hex, URL percent-encoding,
 * backslash escapes or HTML character references and decodes them, so the
 * registry can match secrets that were re-encoded before being emitted.
 *
 * Decoders never throw: a malformed input makes them return false and the
 * candidate is dropped.
 */
#ifndef taintguard_LEAKAGE_ENCODING_HPP
#define taintguard_LEAKAGE_ENCODING_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace taintguard {

// A decoded span of some source text
struct DecodedCandidate {
    size_t start;           // range of the encoded form in the outermost text
    size_t end;
    std::string encoding;   // "base64", "hex", "percent", "escape", "html", or a chain "base64>hex"
    std::string decoded;
    int depth;              // 1 for a direct decode, 2 for a decode of a decode, ...

    DecodedCandidate() : start(0), end(0), depth(1) {}
};

bool decode_base64(const std::string& in, std::string& out);
bool decode_hex(const std::string& in, std::string& out);
bool decode_percent(const std::string& in, std::string& out);
bool decode_escapes(const std::string& in, std::string& out);
bool decode_html_entities(const std::string& in, std::string& out);

class EncodingScanner {
public:
    EncodingScanner();
    EncodingScanner(int max_depth, size_t min_encoded_length);

    void set_max_depth(int depth) { max_depth_ = depth; }
    int max_depth() const { return max_depth_; }
    void set_min_encoded_length(size_t len) { min_encoded_length_ = len; }
    size_t min_encoded_length() const { return min_encoded_length_; }

    // All decodable spans of `text`, recursively up to max_depth. Nested
    // candidates report the range of their outermost ancestor. When more than
    // MAX_CANDIDATES spans decode, the rest are not examined and `truncated`
    // (if given) is set.
    std::vector<DecodedCandidate> extract(const std::string& text, bool* truncated = nullptr) const;

    static const size_t MAX_CANDIDATES = 512;

private:
    int max_depth_;
    size_t min_encoded_length_;

    void extract_level(const std::string& text, size_t outer_start, size_t outer_end,
                       const std::string& chain, int depth,
                       std::vector<DecodedCandidate>& out, bool& truncated) const;

    // Spans (start, end) of `text` worth a decode attempt, per encoding
    std::vector<std::pair<size_t, size_t> > base64_spans(const std::string& text) const;
    std::vector<std::pair<size_t, size_t> > hex_spans(const std::string& text) const;
    std::vector<std::pair<size_t, size_t> > token_spans(const std::string& text) const;
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_ENCODING_HPP
