/*
 * taintguard C++17 - JSON type
 *
 * Tool arguments, configuration documents and audit records all travel as
 * nlohmann::json values.
 */
#ifndef taintguard_CORE_JSON_HPP
#define taintguard_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace taintguard {

typedef nlohmann::json Json;

} // namespace taintguard

#endif // taintguard_CORE_JSON_HPP
