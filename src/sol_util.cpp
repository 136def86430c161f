#include "sol_util.h"

#include <initializer_list>

namespace quire {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  // The base library can still reach the filesystem through these.
  for (char const *name : { "dofile", "loadfile", "load" }) { (*lua)[name] = sol::lua_nil; }
  return lua;
}

std::vector<std::string> sol_util_get_string_array(sol::table const &table,
                                                   std::string_view key,
                                                   std::string_view context) {
  auto const array{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!array) { return {}; }

  std::vector<std::string> result;
  for (size_t i{ 1 }, n{ array->size() }; i <= n; ++i) {
    sol::object const item{ (*array)[i] };
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

}  // namespace quire
