#pragma once

#include <argparse/argparse.hpp>

namespace polyglot::driver {

// Exit codes shared by every subcommand
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitTestFailure = 1;
inline constexpr int kExitError = 2;

auto RunCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace polyglot::driver
