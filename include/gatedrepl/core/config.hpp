/*
 * gatedrepl C++ - Configuration
 *
 * JSON configuration file with dotted-key lookups:
 *   cfg.get_int("repl.max_steps", 5000000)
 * resolves {"repl": {"max_steps": ...}}. Missing or mistyped keys yield the
 * supplied default.
 */
#ifndef gatedrepl_CORE_CONFIG_HPP
#define gatedrepl_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace gatedrepl {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from a JSON file. Returns false (and keeps the previous data)
    // when the file is missing or malformed; error() describes why.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    // Raw subtree (null when missing)
    Json get_json(const std::string& key) const;

    void set(const std::string& key, const Json& value);

    const Json& data() const { return data_; }
    const std::string& error() const { return error_; }
    const std::string& path() const { return path_; }

private:
    const Json* lookup(const std::string& key) const;

    Json data_;
    std::string error_;
    std::string path_;
};

} // namespace gatedrepl

#endif // gatedrepl_CORE_CONFIG_HPP
