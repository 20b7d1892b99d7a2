/*
 * Primus C++ - Configuration Implementation
 */
#include <primus/core/config.hpp>
#include <primus/core/logger.hpp>
#include <primus/core/utils.hpp>
#include <fstream>
#include <sstream>

namespace primus {

Config::Config() : root_(Json::object()) {}

bool Config::load(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "cannot open " + path;
        LOG_WARN("[Config] Cannot open '%s', using defaults", path.c_str());
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("[Config] Failed to parse '%s': %s", path.c_str(), last_error_.c_str());
        return false;
    }
    path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        last_error_ = "configuration must be a JSON object";
        return false;
    }
    root_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
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
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) *node = Json::object();
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return def;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_string()) {
        try { return std::stoll(v->get<std::string>()); }
        catch (const std::exception&) { return def; }
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return def;
}

Json Config::get_json(const std::string& key) const {
    const Json* v = find(key);
    return v ? *v : Json();
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace primus
