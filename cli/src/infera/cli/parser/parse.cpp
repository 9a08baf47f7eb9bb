#include "infera/cli/parser/parse.hpp"
#include "infera/cli/parser/errors.hpp"

#include <charconv>
#include <fmt/format.h>
#include <span>
#include <string_view>

namespace {

using Args = std::span<const std::string_view>;

std::size_t parse_count(std::string_view option, std::string_view value) {
  std::size_t n = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw ParseError(fmt::format("--{} expects a number, got '{}'", option,
                                 value));
  }
  return n;
}

infera::diag::LogLevel parse_log_level(std::string_view value) {
  using infera::diag::LogLevel;
  if (value == "off") {
    return LogLevel::Off;
  }
  if (value == "error") {
    return LogLevel::Error;
  }
  if (value == "warn") {
    return LogLevel::Warn;
  }
  if (value == "info") {
    return LogLevel::Info;
  }
  if (value == "debug") {
    return LogLevel::Debug;
  }
  if (value == "trace") {
    return LogLevel::Trace;
  }
  throw ParseError(fmt::format("unknown log level '{}'", value));
}

// "1x3x224x224"
infera::Shape parse_shape(std::string_view text) {
  infera::Shape shape;
  while (true) {
    std::size_t x = text.find('x');
    std::string_view part = text.substr(0, x);
    std::int64_t d = 0;
    auto [ptr, ec] =
        std::from_chars(part.data(), part.data() + part.size(), d);
    if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size() ||
        d < 0) {
      throw ParseError(fmt::format("invalid shape '{}'", text));
    }
    shape.push_back(d);
    if (x == std::string_view::npos) {
      break;
    }
    text.remove_prefix(x + 1);
  }
  return shape;
}

// name=path or name=path:shape
InputArg parse_input(std::string_view arg) {
  std::size_t eq = arg.find('=');
  if (eq == std::string_view::npos || eq == 0 || eq + 1 == arg.size()) {
    throw ParseError(
        fmt::format("expected input as name=file[:shape], got '{}'", arg));
  }
  InputArg input{.name = infera::memory::string(arg.substr(0, eq)),
                 .path = {},
                 .shape = {}};
  std::string_view rest = arg.substr(eq + 1);
  std::size_t colon = rest.rfind(':');
  if (colon != std::string_view::npos) {
    input.shape = parse_shape(rest.substr(colon + 1));
    rest = rest.substr(0, colon);
  }
  input.path = infera::memory::string(rest);
  return input;
}

std::string_view option_value(Args args, std::size_t &i) {
  if (i + 1 >= args.size()) {
    throw ParseError(fmt::format("{} expects a value", args[i]));
  }
  return args[++i];
}

bool is_help(std::string_view arg) { return arg == "-h" || arg == "--help"; }

// Returns false if the argument is not a common option.
bool parse_common(Args args, std::size_t &i, CommonOptions &common) {
  std::string_view arg = args[i];
  if (arg == "--threads" || arg == "-j") {
    common.threads = parse_count("threads", option_value(args, i));
    return true;
  }
  if (arg == "--log-level") {
    common.logLevel = parse_log_level(option_value(args, i));
    return true;
  }
  return false;
}

Action parse_info(Args args) {
  InfoAction action;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (is_help(args[i])) {
      return HelpAction{HelpScope::Info};
    }
    if (parse_common(args, i, action.common)) {
      continue;
    }
    if (args[i].starts_with("-")) {
      throw ParseError(fmt::format("unknown option '{}'", args[i]));
    }
    if (!action.model.empty()) {
      throw ParseError(fmt::format("unexpected argument '{}'", args[i]));
    }
    action.model = infera::memory::string(args[i]);
  }
  if (action.model.empty()) {
    throw ParseError("missing model file");
  }
  return action;
}

Action parse_run(Args args) {
  RunAction action;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (is_help(arg)) {
      return HelpAction{HelpScope::Run};
    }
    if (parse_common(args, i, action.common)) {
      continue;
    }
    if (arg == "--timing") {
      action.timing = true;
    } else if (arg == "--verbose") {
      action.verbose = true;
    } else if (arg == "--output-dir" || arg == "-o") {
      action.outputDir = infera::memory::string(option_value(args, i));
    } else if (arg == "--output") {
      action.outputs.emplace_back(option_value(args, i));
    } else if (arg.starts_with("-")) {
      throw ParseError(fmt::format("unknown option '{}'", arg));
    } else if (action.model.empty()) {
      action.model = infera::memory::string(arg);
    } else {
      action.inputs.push_back(parse_input(arg));
    }
  }
  if (action.model.empty()) {
    throw ParseError("missing model file");
  }
  return action;
}

Action parse_demo(Args args) {
  DemoAction action;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (is_help(args[i])) {
      return HelpAction{HelpScope::Demo};
    }
    if (parse_common(args, i, action.common)) {
      continue;
    }
    if (args[i] == "--save") {
      action.save = infera::memory::string(option_value(args, i));
      continue;
    }
    throw ParseError(fmt::format("unexpected argument '{}'", args[i]));
  }
  return action;
}

} // namespace

Action parse_argv(int argc, char **argv) {
  infera::memory::vector<std::string_view> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  if (args.empty()) {
    return HelpAction{HelpScope::Global};
  }

  const std::string_view cmd = args.front();
  Args rest{args.begin() + 1, args.end()};
  if (cmd == "info") {
    return parse_info(rest);
  }
  if (cmd == "run") {
    return parse_run(rest);
  }
  if (cmd == "demo") {
    return parse_demo(rest);
  }
  if (cmd == "help" || is_help(cmd)) {
    return HelpAction{HelpScope::Global};
  }
  if (cmd == "version" || cmd == "--version") {
    return Action::version();
  }
  if (cmd.starts_with("-")) {
    throw ParseError(fmt::format("expected command, found option '{}'", cmd));
  }
  throw ParseError(fmt::format("unknown command '{}'", cmd));
}

void print_help(HelpScope scope) {
  switch (scope) {
  case HelpScope::Global:
    fmt::print("usage: infera <command> [options]\n"
                 "\n"
                 "commands:\n"
                 "  info <model.ifx>                  print the model signature\n"
                 "  run <model.ifx> name=file...      run the model on raw f32 "
                 "inputs\n"
                 "  demo                              build and run a small "
                 "example model\n"
                 "  version\n"
                 "\n"
                 "common options:\n"
                 "  -j, --threads <n>     worker threads (default: all cores)\n"
                 "  --log-level <level>   off|error|warn|info|debug|trace\n");
    break;
  case HelpScope::Info:
    fmt::print("usage: infera info <model.ifx>\n");
    break;
  case HelpScope::Run:
    fmt::print(
        "usage: infera run <model.ifx> name=file[:shape]... [options]\n"
        "\n"
        "Inputs are raw little-endian f32 files. The shape defaults to the\n"
        "declared one and is required for symbolic dimensions, e.g.\n"
        "  infera run net.ifx input=img.bin:1x3x224x224\n"
        "\n"
        "options:\n"
        "  -o, --output-dir <dir>   write each output to <dir>/<name>.bin\n"
        "  --output <name>          only compute this output (repeatable)\n"
        "  --timing                 log per-operator timings\n"
        "  --verbose                log every node's shapes\n");
    break;
  case HelpScope::Demo:
    fmt::print("usage: infera demo [--save <model.ifx>]\n");
    break;
  }
}
