/*
 * Primus C++ - Configuration
 *
 * JSON configuration document with dotted-key access, e.g.
 *   cfg.get_string("memory.db_path", "")
 *   cfg.get_json("policy.grants")
 */
#ifndef primus_CORE_CONFIG_HPP
#define primus_CORE_CONFIG_HPP

#include <primus/core/json.hpp>
#include <string>
#include <cstdint>

namespace primus {

class Config {
public:
    Config();

    // Load a JSON file. On failure the current document is kept.
    bool load(const std::string& path);
    bool load_string(const std::string& text);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    // Returns a null Json when the key is missing
    Json get_json(const std::string& key) const;

    bool has(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_bool(const std::string& key, bool value);

    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);

    Json root_;
    std::string path_;
    std::string last_error_;
};

} // namespace primus

#endif // primus_CORE_CONFIG_HPP
