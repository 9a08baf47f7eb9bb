#include "infera/cli/commands.hpp"
#include "infera/cli/io/files.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <infera/runtime.hpp>

static std::string describe(const infera::runtime::ModelIo &io) {
  std::string dtype =
      io.dtype ? fmt::format("{}", *io.dtype) : std::string("?");
  if (!io.shape) {
    return fmt::format("{} [*]", dtype);
  }
  return fmt::format("{} [{}]", dtype, fmt::join(*io.shape, ", "));
}

int info(const InfoAction &action) {
  auto bytes = read_file(action.model);
  auto model = infera::runtime::load_model(bytes);
  const auto &meta = model->metadata();
  const auto &graph = model->graph();

  fmt::print("model:     {}\n", action.model);
  fmt::print("format:    {}\n", meta.formatVersion);
  if (!meta.producer.empty()) {
    fmt::print("producer:  {} {}\n", meta.producer, meta.producerVersion);
  }
  if (!meta.description.empty()) {
    fmt::print("about:     {}\n", meta.description);
  }
  fmt::print("operators: {} in {} levels\n", graph.nodeCount(),
             model->plan().levelCount());
  fmt::print("values:    {} (max {} live)\n", graph.valueCount(),
             model->plan().maxLiveSet());
  fmt::print("inputs:\n");
  for (const auto &io : model->inputs()) {
    fmt::print("  {:<24} {}\n", io.name, describe(io));
  }
  fmt::print("outputs:\n");
  for (const auto &io : model->outputs()) {
    fmt::print("  {:<24} {}\n", io.name, describe(io));
  }

  infera::memory::vector<std::size_t> histogram(infera::OpKindCount, 0);
  for (const auto &node : graph.nodes()) {
    ++histogram[static_cast<std::size_t>(node.op.kind())];
  }
  fmt::print("operator kinds:\n");
  for (std::size_t k = 0; k < histogram.size(); ++k) {
    if (histogram[k] != 0) {
      fmt::print("  {:<24} {}\n", infera::OpKindNames[k], histogram[k]);
    }
  }
  return 0;
}
