/*
 * taintguard C++17 - Configuration Implementation
 */
#include <taintguard/core/config.hpp>
#include <taintguard/core/logger.hpp>
#include <taintguard/core/utils.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace taintguard {

Config::Config() : doc_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        LOG_ERROR("[Config] Cannot open '%s'", path.c_str());
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("[Config] Invalid JSON in '%s'", path.c_str());
        return false;
    }
    source_ = path;
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_ERROR("[Config] Configuration must be a JSON object");
        return false;
    }
    doc_ = parsed;
    source_ = "<string>";
    return true;
}

const Json* Config::find(const std::string& key) const {
    // Literal top-level key wins ("audit.queue_capacity": 64)
    Json::const_iterator direct = doc_.find(key);
    if (direct != doc_.end()) {
        return &(*direct);
    }

    const Json* node = &doc_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &doc_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        long long parsed = strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("[Config] '%s' is not an integer, using default", key.c_str());
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
        if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    }
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_string()) {
        // "a,b,c" shorthand
        std::vector<std::string> out;
        std::vector<std::string> parts = split(v->get<std::string>(), ',');
        for (size_t i = 0; i < parts.size(); ++i) {
            std::string p = trim(parts[i]);
            if (!p.empty()) out.push_back(p);
        }
        return out;
    }
    if (!v->is_array()) return default_val;

    std::vector<std::string> out;
    for (const auto& item : *v) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

Json Config::get_json(const std::string& key) const {
    const Json* v = find(key);
    return v ? *v : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace taintguard
