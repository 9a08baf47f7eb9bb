#pragma once

#include "infera/diag/logging.hpp"
#include "infera/memory/container/optional.hpp"
#include "infera/memory/container/string.hpp"
#include "infera/memory/container/vector.hpp"
#include "infera/tensor/Shape.hpp"

#include <cstddef>
#include <variant>

struct InputArg {
  infera::memory::string name;
  infera::memory::string path;
  // Overrides the declared shape, required for symbolic inputs.
  infera::memory::optional<infera::Shape> shape;
};

struct CommonOptions {
  std::size_t threads = 0;
  infera::diag::LogLevel logLevel = infera::diag::LogLevel::Warn;
};

struct InfoAction {
  infera::memory::string model;
  CommonOptions common;
};

struct RunAction {
  infera::memory::string model;
  infera::memory::vector<InputArg> inputs;
  infera::memory::optional<infera::memory::string> outputDir;
  infera::memory::vector<infera::memory::string> outputs;
  bool timing = false;
  bool verbose = false;
  CommonOptions common;
};

struct DemoAction {
  infera::memory::optional<infera::memory::string> save;
  CommonOptions common;
};

enum class HelpScope { Global, Info, Run, Demo };

struct HelpAction {
  HelpScope scope = HelpScope::Global;
};

enum class ActionKind { Info, Run, Demo, Help, Version };

class Action {
public:
  Action(InfoAction a) noexcept : m_value(std::move(a)) {}
  Action(RunAction a) noexcept : m_value(std::move(a)) {}
  Action(DemoAction a) noexcept : m_value(std::move(a)) {}
  Action(HelpAction a) noexcept : m_value(std::move(a)) {}

  static Action version() noexcept { return Action{VersionTag{}}; }

  ActionKind kind() const noexcept {
    return static_cast<ActionKind>(m_value.index());
  }

  const InfoAction &info() const { return std::get<InfoAction>(m_value); }
  const RunAction &run() const { return std::get<RunAction>(m_value); }
  const DemoAction &demo() const { return std::get<DemoAction>(m_value); }
  const HelpAction &help() const { return std::get<HelpAction>(m_value); }

private:
  struct VersionTag {};

  explicit Action(VersionTag) noexcept : m_value(VersionTag{}) {}

  // Same order as ActionKind.
  std::variant<InfoAction, RunAction, DemoAction, HelpAction, VersionTag>
      m_value;
};
