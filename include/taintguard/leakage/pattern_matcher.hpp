/*
 * taintguard C++17 - Multi-Pattern Matching
 *
 * PatternMatcher: byte-level Aho-Corasick automaton. All literal fingerprints
 * of a session are compiled into one automaton so a scan costs one pass over
 * the text no matter how many entries are registered.
 *
 * RollingHash: polynomial hash over a fixed-size sliding window, used as a
 * cheap prefilter before a SHA-256 confirmation of hashed entries.
 *
 * Both are immutable after build() / construction and safe to share between
 * reader threads.
 */
#ifndef taintguard_LEAKAGE_PATTERN_MATCHER_HPP
#define taintguard_LEAKAGE_PATTERN_MATCHER_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>

namespace taintguard {

class PatternMatcher {
public:
    struct Hit {
        size_t pattern;     // index returned by add()
        size_t start;
        size_t end;
    };

    PatternMatcher();

    // Register a pattern; returns its index. Empty patterns are ignored and
    // return SIZE_MAX. Must be called before build().
    size_t add(const std::string& pattern);

    // Compute failure and output links. Further add() calls are rejected.
    void build();

    bool built() const { return built_; }
    size_t pattern_count() const { return lengths_.size(); }
    size_t node_count() const { return nodes_.size(); }

    // Every occurrence of every pattern, overlapping hits included, ordered
    // by end offset
    std::vector<Hit> find_all(const std::string& text) const;

private:
    struct Node {
        std::map<unsigned char, uint32_t> next;
        uint32_t fail;
        uint32_t output_link;           // nearest node on the failure chain with outputs
        std::vector<uint32_t> outputs;  // patterns ending exactly here

        Node() : fail(0), output_link(0) {}
    };

    std::vector<Node> nodes_;
    std::vector<size_t> lengths_;
    bool built_;

    uint32_t step(uint32_t state, unsigned char byte) const;
};

class RollingHash {
public:
    static const uint64_t MODULUS = 0x1FFFFFFFFFFFFFFFULL;   // 2^61 - 1

    // `base` must be odd and below MODULUS; callers draw it at random
    RollingHash(uint64_t base, size_t window);

    // Hash of a complete string (used at registration time)
    uint64_t hash(const char* data, size_t len) const;
    uint64_t hash(const std::string& s) const { return hash(s.data(), s.size()); }

    // Sliding-window driver: reset with the first window, then roll one byte
    uint64_t reset(const char* data);
    uint64_t roll(unsigned char outgoing, unsigned char incoming);

    size_t window() const { return window_; }
    uint64_t base() const { return base_; }

private:
    uint64_t base_;
    size_t window_;
    uint64_t top_power_;    // base^(window-1) mod MODULUS
    uint64_t current_;

    static uint64_t mul_mod(uint64_t a, uint64_t b);
    static uint64_t add_mod(uint64_t a, uint64_t b);
    static uint64_t sub_mod(uint64_t a, uint64_t b);
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_PATTERN_MATCHER_HPP
