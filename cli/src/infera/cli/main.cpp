#include "infera/cli/commands.hpp"
#include "infera/cli/parser/errors.hpp"
#include "infera/cli/parser/parse.hpp"

#include <fmt/format.h>
#include <infera/runtime.hpp>

#ifndef INFERA_VERSION
#define INFERA_VERSION "0.1.0"
#endif

int main(int argc, char **argv) {
  infera::memory::optional<Action> action;
  try {
    action = parse_argv(argc, argv);
  } catch (const ParseError &e) {
    fmt::print(stderr, "infera: {}\n", e.what());
    print_help(HelpScope::Global);
    return 2;
  }

  try {
    switch (action->kind()) {
    case ActionKind::Info:
      infera::diag::set_log_level(action->info().common.logLevel);
      return info(action->info());
    case ActionKind::Run:
      infera::diag::set_log_level(action->run().common.logLevel);
      return run(action->run());
    case ActionKind::Demo:
      infera::diag::set_log_level(action->demo().common.logLevel);
      return demo(action->demo());
    case ActionKind::Help:
      print_help(action->help().scope);
      return 0;
    case ActionKind::Version:
      fmt::print("infera {}\n", INFERA_VERSION);
      return 0;
    }
  } catch (const infera::runtime::LoadError &e) {
    fmt::print(stderr, "infera: failed to load model ({}): {}\n", e.kind(),
               e.what());
    return 1;
  } catch (const infera::runtime::RunError &e) {
    fmt::print(stderr, "infera: {}\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    fmt::print(stderr, "infera: {}\n", e.what());
    return 1;
  }
  return 1;
}
