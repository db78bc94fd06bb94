/*
 * gatedrepl C++ - Configuration Implementation
 */
#include <gatedrepl/core/config.hpp>
#include <gatedrepl/core/logger.hpp>
#include <gatedrepl/core/utils.hpp>

namespace gatedrepl {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        error_ = "cannot read config file: " + path;
        LOG_WARN("[Config] %s", error_.c_str());
        return false;
    }
    if (!load_string(text)) {
        LOG_ERROR("[Config] %s (%s)", error_.c_str(), path.c_str());
        return false;
    }
    path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        error_ = "malformed JSON in config";
        return false;
    }
    if (!parsed.is_object()) {
        error_ = "config root must be a JSON object";
        return false;
    }
    data_ = parsed;
    error_.clear();
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    const Json* node = lookup(key);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_number()) return default_val;
    if (node->is_number_float()) return static_cast<int64_t>(node->get<double>());
    return node->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_number()) return default_val;
    return node->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = lookup(key);
    if (!node || !node->is_boolean()) return default_val;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_array(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = lookup(key);
    if (!node || !node->is_array()) return out;
    for (size_t i = 0; i < node->size(); ++i) {
        if ((*node)[i].is_string()) {
            out.push_back((*node)[i].get<std::string>());
        }
    }
    return out;
}

Json Config::get_json(const std::string& key) const {
    const Json* node = lookup(key);
    return node ? *node : Json();
}

void Config::set(const std::string& key, const Json& value) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    (*node)[parts.back()] = value;
}

} // namespace gatedrepl
