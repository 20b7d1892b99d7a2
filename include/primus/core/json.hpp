/*
 * Primus C++ - JSON alias
 */
#ifndef primus_CORE_JSON_HPP
#define primus_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace primus {

typedef nlohmann::json Json;

} // namespace primus

#endif // primus_CORE_JSON_HPP
