/*
 * taintguard C++17 - Canary Tokens
 *
 * A canary is a per-session random marker spliced into the system prompt.
 * Seeing it (or its fixed prefix) in model output means the prompt leaked.
 */
#ifndef taintguard_LEAKAGE_CANARY_HPP
#define taintguard_LEAKAGE_CANARY_HPP

#include <string>
#include <cstdint>

namespace taintguard {

struct CanaryToken {
    std::string session_id;
    std::string token;
    int64_t created_at_ms;

    CanaryToken() : created_at_ms(0) {}
    bool valid() const { return !token.empty(); }
};

class Canary {
public:
    // Fixed, recognizable prefix shared by every token
    static const char* PREFIX;
    // Hex characters of randomness after the prefix (96 bits)
    static const size_t RANDOM_HEX_CHARS = 24;

    // New unguessable token for `session_id`. Returns an invalid token if the
    // system random generator fails.
    static CanaryToken generate(const std::string& session_id);

    // Instruction text to splice into the session's system prompt
    static std::string system_instruction(const CanaryToken& token);

    // Exact substring test
    static bool detect_in_output(const CanaryToken& token, const std::string& text);

    // Prefix test, for text whose session is unknown
    static bool contains_canary_pattern(const std::string& text);

    // Byte offset of the first prefix occurrence, or npos
    static size_t find_pattern(const std::string& text);

    // Extent of a prefix-led token starting at `pos` (prefix plus the
    // alphanumeric run that follows it)
    static size_t pattern_length(const std::string& text, size_t pos);
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_CANARY_HPP
