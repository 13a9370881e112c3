/*
 * taintguard C++17 - Configuration
 *
 * JSON configuration document with dotted-key access:
 *   cfg.get_int("registry.max_entries_per_session", 1024)
 * resolves {"registry": {"max_entries_per_session": ...}}. A literal key
 * containing dots at the top level is also honoured.
 */
#ifndef taintguard_CORE_CONFIG_HPP
#define taintguard_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace taintguard {

class Config {
public:
    Config();

    // Load a JSON document from disk. Returns false (and logs) on I/O or
    // parse errors; the previous contents are kept in that case.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& default_val) const;
    bool has(const std::string& key) const;

    // Raw subtree access (null Json if missing)
    Json get_json(const std::string& key) const;

    // Overrides (creates intermediate objects as needed)
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& document() const { return doc_; }
    const std::string& source() const { return source_; }

private:
    Json doc_;
    std::string source_;

    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace taintguard

#endif // taintguard_CORE_CONFIG_HPP
