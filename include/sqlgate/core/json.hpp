#ifndef sqlgate_CORE_JSON_HPP
#define sqlgate_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sqlgate {

typedef nlohmann::json Json;

// Keeps insertion order; used where output field order is part of the contract
typedef nlohmann::ordered_json OrderedJson;

} // namespace sqlgate

#endif // sqlgate_CORE_JSON_HPP
