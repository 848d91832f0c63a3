#include "polyglot/suite/suite.hpp"

#include <algorithm>
#include <string_view>

namespace polyglot::suite {

auto Suite::FindEnvironment(std::string_view name) const
    -> const Environment* {
  auto it = std::ranges::find(environments, name, &Environment::name);
  return it == environments.end() ? nullptr : &*it;
}

auto Suite::FindScenario(std::string_view name) const -> const Scenario* {
  auto it = std::ranges::find(scenarios, name, &Scenario::name);
  return it == scenarios.end() ? nullptr : &*it;
}

}  // namespace polyglot::suite
