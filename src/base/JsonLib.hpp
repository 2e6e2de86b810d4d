#ifndef __TB_JSON_LIB__
#define __TB_JSON_LIB__

#include <string>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace tb {
/**
 * @brief Serializes compactly. Shell output is not guaranteed to be UTF-8, so
 * invalid sequences are replaced instead of throwing.
 */
inline std::string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace tb

#endif  // __TB_JSON_LIB__
