#include "infera/cli/commands.hpp"
#include "infera/cli/io/files.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <infera/kernels/Kernel.hpp>
#include <infera/runtime.hpp>
#include <stdexcept>

static infera::Shape resolve_shape(const infera::runtime::ModelIo &io,
                                   const InputArg &arg) {
  if (arg.shape) {
    return *arg.shape;
  }
  if (!io.shape) {
    throw std::runtime_error(fmt::format(
        "input '{}' has no declared shape, pass {}=file:<shape>", io.name,
        io.name));
  }
  infera::Shape shape;
  for (const auto &d : *io.shape) {
    if (!d.isFixed()) {
      throw std::runtime_error(fmt::format(
          "input '{}' has symbolic dimensions, pass {}=file:<shape>", io.name,
          io.name));
    }
    shape.push_back(d.size);
  }
  return shape;
}

static void print_preview(const infera::memory::string &name,
                          const infera::Tensor &t) {
  constexpr std::size_t Preview = 8;
  const std::size_t n =
      std::min<std::size_t>(Preview, static_cast<std::size_t>(t.numel()));
  std::string values = infera::visit_dtype(t.dtype(), [&](auto tag) {
    using T = decltype(tag);
    auto v = t.values<T>().first(n);
    if constexpr (std::is_same_v<T, float>) {
      return fmt::format("{}", fmt::join(v, ", "));
    } else {
      infera::memory::vector<int> widened(v.begin(), v.end());
      return fmt::format("{}", fmt::join(widened, ", "));
    }
  });
  fmt::print("{} {}: [{}{}]\n", name, t.info(), values,
             static_cast<std::size_t>(t.numel()) > n ? ", ..." : "");
}

int run(const RunAction &action) {
  auto bytes = read_file(action.model);
  infera::runtime::ModelHandle model = infera::runtime::load_model(bytes);

  infera::runtime::Binding inputs;
  for (const InputArg &arg : action.inputs) {
    const auto declared = model->inputs();
    auto it = std::find_if(declared.begin(), declared.end(),
                           [&](const auto &io) { return io.name == arg.name; });
    if (it == declared.end()) {
      throw std::runtime_error(
          fmt::format("model has no input named '{}'", arg.name));
    }
    infera::Shape shape = resolve_shape(*it, arg);
    auto values = read_f32(arg.path);
    inputs.emplace(arg.name, infera::Tensor::from<float>(std::move(shape),
                                                         values));
  }

  infera::kernels::WorkerPool::configureGlobal(action.common.threads);
  infera::runtime::Executor executor(model);
  infera::runtime::RunOptions options{
      .timing = action.timing,
      .verbose = action.verbose,
      .outputs = action.outputs,
  };
  infera::runtime::RunStats stats;
  infera::runtime::Binding outputs = executor.run(inputs, options, &stats);

  for (const auto &[name, tensor] : outputs) {
    print_preview(name, tensor);
    if (action.outputDir) {
      if (tensor.dtype() != infera::TensorDataType::Float32) {
        const std::array<const infera::Tensor *, 1> castInputs{&tensor};
        auto converted = infera::kernels::run(
            infera::Operator(infera::OpKind::Cast,
                             infera::CastAttrs{infera::TensorDataType::Float32}),
            castInputs, infera::kernels::WorkerPool::global());
        write_f32(fmt::format("{}/{}.bin", *action.outputDir, name),
                  converted[0].values<float>());
      } else {
        write_f32(fmt::format("{}/{}.bin", *action.outputDir, name),
                  tensor.values<float>());
      }
    }
  }
  INFERA_INFO("peak live tensors {}, {} allocations, {} reused",
              stats.peakLiveTensors, stats.allocations, stats.reuses);
  return 0;
}
