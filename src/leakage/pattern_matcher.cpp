/*
 * taintguard C++17 - Multi-Pattern Matching Implementation
 */
#include <taintguard/leakage/pattern_matcher.hpp>
#include <taintguard/core/logger.hpp>

#include <queue>

namespace taintguard {

// ============================================================================
// PatternMatcher
// ============================================================================

PatternMatcher::PatternMatcher()
    : built_(false) {
    nodes_.push_back(Node());   // root
}

size_t PatternMatcher::add(const std::string& pattern) {
    if (built_) {
        LOG_WARN("[PatternMatcher] add() after build() ignored");
        return SIZE_MAX;
    }
    if (pattern.empty()) {
        return SIZE_MAX;
    }

    uint32_t state = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        unsigned char byte = static_cast<unsigned char>(pattern[i]);
        std::map<unsigned char, uint32_t>::const_iterator it = nodes_[state].next.find(byte);
        if (it != nodes_[state].next.end()) {
            state = it->second;
            continue;
        }
        uint32_t child = static_cast<uint32_t>(nodes_.size());
        nodes_.push_back(Node());
        nodes_[state].next[byte] = child;
        state = child;
    }

    size_t index = lengths_.size();
    lengths_.push_back(pattern.size());
    nodes_[state].outputs.push_back(static_cast<uint32_t>(index));
    return index;
}

void PatternMatcher::build() {
    if (built_) return;

    // BFS over the trie; a node's failure link is always shallower, so it is
    // final by the time the node is dequeued
    std::queue<uint32_t> queue;
    for (std::map<unsigned char, uint32_t>::const_iterator it = nodes_[0].next.begin();
         it != nodes_[0].next.end(); ++it) {
        nodes_[it->second].fail = 0;
        nodes_[it->second].output_link = 0;
        queue.push(it->second);
    }

    while (!queue.empty()) {
        uint32_t current = queue.front();
        queue.pop();

        for (std::map<unsigned char, uint32_t>::const_iterator it = nodes_[current].next.begin();
             it != nodes_[current].next.end(); ++it) {
            unsigned char byte = it->first;
            uint32_t child = it->second;
            queue.push(child);

            uint32_t fail = nodes_[current].fail;
            while (fail != 0 && nodes_[fail].next.find(byte) == nodes_[fail].next.end()) {
                fail = nodes_[fail].fail;
            }
            std::map<unsigned char, uint32_t>::const_iterator f = nodes_[fail].next.find(byte);
            uint32_t target = (f != nodes_[fail].next.end() && f->second != child) ? f->second : 0;

            nodes_[child].fail = target;
            nodes_[child].output_link = nodes_[target].outputs.empty()
                ? nodes_[target].output_link
                : target;
        }
    }

    built_ = true;
    LOG_DEBUG("[PatternMatcher] Built automaton: %zu patterns, %zu nodes",
              lengths_.size(), nodes_.size());
}

uint32_t PatternMatcher::step(uint32_t state, unsigned char byte) const {
    for (;;) {
        std::map<unsigned char, uint32_t>::const_iterator it = nodes_[state].next.find(byte);
        if (it != nodes_[state].next.end()) {
            return it->second;
        }
        if (state == 0) {
            return 0;
        }
        state = nodes_[state].fail;
    }
}

std::vector<PatternMatcher::Hit> PatternMatcher::find_all(const std::string& text) const {
    std::vector<Hit> hits;
    if (!built_ || lengths_.empty()) {
        return hits;
    }

    uint32_t state = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        state = step(state, static_cast<unsigned char>(text[i]));

        uint32_t node = nodes_[state].outputs.empty() ? nodes_[state].output_link : state;
        while (node != 0) {
            const std::vector<uint32_t>& outs = nodes_[node].outputs;
            for (size_t k = 0; k < outs.size(); ++k) {
                Hit hit;
                hit.pattern = outs[k];
                hit.end = i + 1;
                hit.start = hit.end - lengths_[outs[k]];
                hits.push_back(hit);
            }
            node = nodes_[node].output_link;
        }
    }
    return hits;
}

// ============================================================================
// RollingHash
// ============================================================================

RollingHash::RollingHash(uint64_t base, size_t window)
    : base_(base % MODULUS)
    , window_(window)
    , top_power_(1)
    , current_(0) {
    if (base_ < 2) base_ = 257;
    for (size_t i = 1; i < window_; ++i) {
        top_power_ = mul_mod(top_power_, base_);
    }
}

uint64_t RollingHash::mul_mod(uint64_t a, uint64_t b) {
    unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
    uint64_t lo = static_cast<uint64_t>(product & MODULUS);
    uint64_t hi = static_cast<uint64_t>(product >> 61);
    uint64_t r = lo + hi;
    while (r >= MODULUS) r -= MODULUS;
    return r;
}

uint64_t RollingHash::add_mod(uint64_t a, uint64_t b) {
    uint64_t r = a + b;
    if (r >= MODULUS) r -= MODULUS;
    return r;
}

uint64_t RollingHash::sub_mod(uint64_t a, uint64_t b) {
    return a >= b ? a - b : a + MODULUS - b;
}

uint64_t RollingHash::hash(const char* data, size_t len) const {
    uint64_t h = 0;
    for (size_t i = 0; i < len; ++i) {
        h = add_mod(mul_mod(h, base_), static_cast<unsigned char>(data[i]) + 1);
    }
    return h;
}

uint64_t RollingHash::reset(const char* data) {
    current_ = hash(data, window_);
    return current_;
}

uint64_t RollingHash::roll(unsigned char outgoing, unsigned char incoming) {
    current_ = sub_mod(current_, mul_mod(static_cast<uint64_t>(outgoing) + 1, top_power_));
    current_ = add_mod(mul_mod(current_, base_), static_cast<uint64_t>(incoming) + 1);
    return current_;
}

} // namespace taintguard
