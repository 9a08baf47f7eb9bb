#include "infera/cli/commands.hpp"
#include "infera/cli/io/files.hpp"
#include "infera/ifx/ModelWriter.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <infera/runtime.hpp>

// image[1,3,4,4] -> Conv 3x3 -> Relu -> GlobalAveragePool -> Flatten ->
// Softmax
static infera::memory::vector<std::byte> build_demo_model() {
  using infera::graph::Dim;
  infera::ifx::ModelWriter writer;
  writer.setMetadata("infera demo", "1", "tiny convolutional classifier");

  auto image = writer.addInput(
      "image", infera::TensorDataType::Float32,
      {Dim::fixed(1), Dim::fixed(3), Dim::fixed(4), Dim::fixed(4)});

  infera::memory::vector<float> weights(3 * 3 * 3 * 3);
  for (std::size_t i = 0; i < weights.size(); ++i) {
    weights[i] = static_cast<float>(static_cast<int>(i % 7) - 3) * 0.05f;
  }
  auto w = writer.addConstant(
      "conv.weight", infera::Tensor::from<float>({3, 3, 3, 3}, weights));
  auto b = writer.addConstant(
      "conv.bias", infera::Tensor::from<float>({3}, {0.1f, -0.2f, 0.3f}));

  auto conv = writer.addValue("conv");
  auto relu = writer.addValue("relu");
  auto pooled = writer.addValue("pooled");
  auto features = writer.addValue("features");
  auto probs = writer.addValue("probs", infera::TensorDataType::Float32,
                               infera::graph::DimList{Dim::fixed(1),
                                                      Dim::fixed(3)});

  writer.addOperator("conv0", infera::Operator(infera::OpKind::Conv),
                     {image, w, b}, {conv});
  writer.addOperator("relu0", infera::Operator(infera::OpKind::Relu), {conv},
                     {relu});
  writer.addOperator("gap0",
                     infera::Operator(infera::OpKind::GlobalAveragePool),
                     {relu}, {pooled});
  writer.addOperator("flatten0",
                     infera::Operator(infera::OpKind::Flatten,
                                      infera::AxisAttrs{1}),
                     {pooled}, {features});
  writer.addOperator("softmax0",
                     infera::Operator(infera::OpKind::Softmax,
                                      infera::AxisAttrs{1}),
                     {features}, {probs});
  writer.addOutput(probs);
  return writer.finish();
}

int demo(const DemoAction &action) {
  auto bytes = build_demo_model();
  if (action.save) {
    write_file(*action.save, bytes);
    fmt::print("wrote {} ({} bytes)\n", *action.save, bytes.size());
  }

  infera::kernels::WorkerPool::configureGlobal(action.common.threads);
  infera::runtime::Executor executor(infera::runtime::load_model(bytes));

  infera::memory::vector<float> pixels(3 * 4 * 4);
  for (std::size_t i = 0; i < pixels.size(); ++i) {
    pixels[i] = static_cast<float>(i) / static_cast<float>(pixels.size());
  }
  infera::runtime::Binding inputs;
  inputs.emplace("image", infera::Tensor::from<float>({1, 3, 4, 4}, pixels));

  auto outputs = executor.run(inputs);
  const infera::Tensor &probs = outputs.at("probs");
  fmt::print("probs {}: [{:.4f}]\n", probs.info(),
             fmt::join(probs.values<float>(), ", "));
  return 0;
}
