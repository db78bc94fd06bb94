/*
 * gatedrepl C++ - JSON type
 *
 * Single alias for nlohmann::json used across the project (tool params,
 * state-store values, namespace snapshots, configuration).
 */
#ifndef gatedrepl_CORE_JSON_HPP
#define gatedrepl_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace gatedrepl {

typedef nlohmann::json Json;

} // namespace gatedrepl

#endif // gatedrepl_CORE_JSON_HPP
