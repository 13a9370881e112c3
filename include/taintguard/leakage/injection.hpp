/*
 * taintguard C++17 - Prompt Injection Detector
 *
 * Screens user input before it reaches the agent. Built-in phrase lists are
 * matched case-insensitively; blocking phrases produce Blocked, suspicious
 * phrases produce Suspicious. Base64 blocks that decode to a blocking phrase
 * are Blocked as EncodingTrick.
 */
#ifndef taintguard_LEAKAGE_INJECTION_HPP
#define taintguard_LEAKAGE_INJECTION_HPP

#include <string>
#include <vector>
#include <mutex>
#include <cstddef>

namespace taintguard {

enum class InjectionVerdict {
    Clean,
    Suspicious,     // warn but allow
    Blocked
};

enum class InjectionCategory {
    RoleOverride,
    DataExtraction,
    DelimiterInjection,
    EncodingTrick,
    SafetyBypass
};

const char* to_string(InjectionVerdict verdict);
const char* to_string(InjectionCategory category);
bool parse_injection_category(const std::string& text, InjectionCategory& out);

struct InjectionMatch {
    InjectionCategory category;
    std::string pattern;
    bool is_blocking;
    size_t position;

    InjectionMatch() : category(InjectionCategory::RoleOverride), is_blocking(false), position(0) {}
};

struct InjectionResult {
    InjectionVerdict verdict;
    std::vector<InjectionMatch> matches;

    InjectionResult() : verdict(InjectionVerdict::Clean) {}

    // "role_override, data_extraction" (distinct, in match order)
    std::string categories() const;
};

class InjectionDetector {
public:
    // Shortest base64 run considered for decoding
    static const size_t MIN_ENCODED_LENGTH = 20;

    InjectionDetector();

    void set_detect_encoded(bool enabled) { detect_encoded_ = enabled; }
    bool detect_encoded() const { return detect_encoded_; }

    void add_blocking_pattern(const std::string& pattern, InjectionCategory category);
    void add_suspicious_pattern(const std::string& pattern, InjectionCategory category);

    InjectionResult scan(const std::string& input) const;

private:
    struct PhraseDef {
        std::string phrase;     // lowercase
        InjectionCategory category;
    };

    std::vector<PhraseDef> custom_blocking_;
    std::vector<PhraseDef> custom_suspicious_;
    bool detect_encoded_;
    mutable std::mutex custom_mutex_;

    bool check_encoded_payloads(const std::string& input, InjectionMatch& out) const;
};

} // namespace taintguard

#endif // taintguard_LEAKAGE_INJECTION_HPP
