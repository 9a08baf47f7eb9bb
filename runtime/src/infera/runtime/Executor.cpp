#include "infera/runtime/Executor.hpp"
#include "infera/diag/invalid_argument.hpp"
#include "infera/diag/invalid_state.hpp"
#include "infera/diag/logging.hpp"
#include "infera/kernels/Kernel.hpp"
#include "infera/kernels/errors.hpp"
#include "infera/tensor/TensorPool.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace infera::runtime {

Executor::Executor(ModelHandle model, ExecutorOptions options)
    : m_model(std::move(model)),
      m_pool(options.pool != nullptr ? options.pool
                                     : &kernels::WorkerPool::global()),
      m_parallelLevels(options.parallelLevels) {
  if (m_model == nullptr) {
    diag::invalid_argument("Executor requires a model");
  }
}

memory::vector<const Tensor *>
Executor::bindInputs(const Binding &inputs) const {
  const auto declared = m_model->inputs();
  for (const auto &[name, tensor] : inputs) {
    auto it = std::find_if(declared.begin(), declared.end(),
                           [&](const ModelIo &io) { return io.name == name; });
    if (it == declared.end()) {
      throw RunError::inputMismatch(
          name, fmt::format("'{}' is not an input of the model", name));
    }
  }

  struct Symbol {
    std::int64_t size;
    const memory::string *input;
  };
  std::map<memory::string, Symbol> symbols;

  memory::vector<const Tensor *> bound;
  bound.reserve(declared.size());
  for (const ModelIo &io : declared) {
    auto it = inputs.find(io.name);
    if (it == inputs.end()) {
      throw RunError::inputMismatch(
          io.name, fmt::format("input '{}' is not bound", io.name));
    }
    const Tensor &t = it->second;
    if (io.dtype && *io.dtype != t.dtype()) {
      throw RunError::inputMismatch(
          io.name, fmt::format("input '{}' expects {}, got {}", io.name,
                               *io.dtype, t.dtype()));
    }
    if (io.shape) {
      const graph::DimList &dims = *io.shape;
      if (dims.size() != t.rank()) {
        throw RunError::inputMismatch(
            io.name, fmt::format("input '{}' expects shape [{}], got {}",
                                 io.name, fmt::join(dims, ", "), t.shape()));
      }
      for (std::size_t d = 0; d < dims.size(); ++d) {
        const std::int64_t actual = t.dim(d);
        if (dims[d].isFixed()) {
          if (dims[d].size != actual) {
            throw RunError::inputMismatch(
                io.name,
                fmt::format("input '{}' expects shape [{}], got {} "
                            "(dimension {})",
                            io.name, fmt::join(dims, ", "), t.shape(), d));
          }
          continue;
        }
        if (dims[d].name.empty()) {
          continue;
        }
        auto [sym, inserted] =
            symbols.emplace(dims[d].name, Symbol{actual, &io.name});
        if (!inserted && sym->second.size != actual) {
          throw RunError::inputMismatch(
              io.name,
              fmt::format("dimension '{}' is {} in input '{}' but {} in "
                          "input '{}'",
                          dims[d].name, sym->second.size, *sym->second.input,
                          actual, io.name));
        }
      }
    }
    bound.push_back(&t);
  }
  return bound;
}

namespace {

struct NodeResult {
  memory::vector<Tensor> outputs;
  std::exception_ptr error;
  std::chrono::nanoseconds duration{0};
};

memory::string describe(memory::span<const Tensor *const> tensors) {
  memory::vector<memory::string> parts;
  parts.reserve(tensors.size());
  for (const Tensor *t : tensors) {
    parts.push_back(t == nullptr ? memory::string("-")
                                 : fmt::format("{}", t->info()));
  }
  return fmt::format("{}", fmt::join(parts, ", "));
}

memory::vector<Tensor> execute_node(const graph::OperatorNode &node,
                                    graph::NodeId id,
                                    memory::span<const Tensor *const> inputs,
                                    TensorPool &pool,
                                    kernels::WorkerPool &workers) {
  const OpKind kind = node.op.kind();
  try {
    memory::vector<kernels::ValueInfo> infos;
    infos.reserve(inputs.size());
    for (const Tensor *t : inputs) {
      infos.push_back(t != nullptr ? kernels::ValueInfo::of(*t)
                                   : kernels::ValueInfo::absent());
    }
    auto outInfos = kernels::infer(node.op, infos);
    if (!outInfos) {
      throw kernels::ShapeError(kind, "output shapes could not be inferred");
    }
    if (outInfos->size() != node.outputs.size()) {
      throw kernels::ShapeError(
          kind, fmt::format("produces {} outputs, node declares {}",
                            outInfos->size(), node.outputs.size()));
    }

    memory::vector<Tensor> outputs;
    outputs.reserve(outInfos->size());
    for (const TensorInfo &info : *outInfos) {
      outputs.push_back(pool.alloc(info));
    }
    kernels::KernelContext ctx{inputs, outputs, workers};
    kernels::kernel_for(kind).execute(node.op, ctx);
    return outputs;
  } catch (const std::exception &) {
    RunError error = RunError::fromException(*id, node.name, kind,
                                             std::current_exception());
    INFERA_ERROR("{}", error.what());
    throw error;
  }
}

void log_timings(const memory::vector<NodeTiming> &timings) {
  std::map<OpKind, std::chrono::nanoseconds> perOp;
  std::chrono::nanoseconds total{0};
  for (const NodeTiming &t : timings) {
    perOp[t.op] += t.duration;
    total += t.duration;
  }
  memory::vector<std::pair<OpKind, std::chrono::nanoseconds>> sorted(
      perOp.begin(), perOp.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto &a,
                                                    const auto &b) {
    return a.second > b.second;
  });
  INFERA_INFO("total {:.3f} ms over {} nodes", total.count() / 1e6,
              timings.size());
  for (const auto &[op, duration] : sorted) {
    INFERA_INFO("  {:<20} {:>10.3f} ms", op_name(op), duration.count() / 1e6);
  }
}

} // namespace

Binding Executor::run(const Binding &inputs, const RunOptions &options,
                      RunStats *stats) const {
  using clock = std::chrono::steady_clock;
  const graph::Graph &graph = m_model->graph();
  const ExecutionPlan &plan = m_model->plan();

  memory::vector<graph::ValueId> wanted;
  if (options.outputs.empty()) {
    wanted.assign(graph.outputs().begin(), graph.outputs().end());
  } else {
    for (const memory::string &name : options.outputs) {
      auto it = std::find_if(
          m_model->outputs().begin(), m_model->outputs().end(),
          [&](const ModelIo &io) { return io.name == name; });
      if (it == m_model->outputs().end()) {
        diag::invalid_argument(
            fmt::format("'{}' is not an output of the model", name));
      }
      wanted.push_back(it->value);
    }
  }

  memory::vector<const Tensor *> bound = bindInputs(inputs);

  TensorPool pool;
  memory::vector<const Tensor *> view(graph.valueCount(), nullptr);
  memory::vector<memory::optional<Tensor>> owned(graph.valueCount());
  for (std::size_t v = 0; v < graph.valueCount(); ++v) {
    const graph::ValueNode &value = graph.values()[v];
    if (value.isConstant()) {
      view[v] = &*value.constant;
    }
  }
  for (std::size_t i = 0; i < bound.size(); ++i) {
    view[*graph.inputs()[i]] = bound[i];
  }
  memory::vector<std::uint32_t> remaining(plan.consumerCounts().begin(),
                                          plan.consumerCounts().end());

  auto release = [&](graph::ValueId v, std::size_t &live) {
    pool.release(std::move(*owned[*v]));
    owned[*v].reset();
    view[*v] = nullptr;
    --live;
  };

  std::size_t live = 0;
  std::size_t peak = 0;
  memory::vector<NodeTiming> timings;

  for (std::size_t l = 0; l < plan.levelCount(); ++l) {
    const auto level = plan.level(l);
    INFERA_TRACE("level {}: {} nodes", l, level.size());
    memory::vector<NodeResult> results(level.size());

    auto runNode = [&](std::size_t i) {
      const graph::NodeId id = level[i];
      const graph::OperatorNode &node = graph.node(id);
      memory::vector<const Tensor *> ins;
      ins.reserve(node.inputs.size());
      for (const auto &in : node.inputs) {
        const Tensor *t = in ? view[**in] : nullptr;
        if (in && t == nullptr) {
          diag::invalid_state(fmt::format(
              "node {} '{}' reads value {} before it is available", *id,
              node.name, **in));
        }
        ins.push_back(t);
      }
      INFERA_TRACE("execute node {} '{}' ({})", *id, node.name,
                   node.op.kind());
      const auto start = clock::now();
      try {
        results[i].outputs = execute_node(node, id, ins, pool, *m_pool);
      } catch (const RunError &) {
        results[i].error = std::current_exception();
        return;
      }
      results[i].duration =
          std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() -
                                                               start);
      if (options.verbose) {
        memory::vector<const Tensor *> outs;
        for (const Tensor &t : results[i].outputs) {
          outs.push_back(&t);
        }
        INFERA_DEBUG("node {} '{}' ({}): [{}] -> [{}]", *id, node.name,
                     node.op.kind(), describe(ins), describe(outs));
      }
    };

    if (m_parallelLevels && level.size() > 1) {
      m_pool->parallelFor(level.size(), 1,
                          [&](std::size_t begin, std::size_t end) {
                            for (std::size_t i = begin; i < end; ++i) {
                              runNode(i);
                            }
                          });
    } else {
      for (std::size_t i = 0; i < level.size(); ++i) {
        runNode(i);
        if (results[i].error) {
          break;
        }
      }
    }

    // Lowest node index wins, independent of scheduling.
    for (const NodeResult &r : results) {
      if (r.error) {
        std::rethrow_exception(r.error);
      }
    }

    for (std::size_t i = 0; i < level.size(); ++i) {
      const graph::OperatorNode &node = graph.node(level[i]);
      for (std::size_t k = 0; k < node.outputs.size(); ++k) {
        const graph::ValueId out = node.outputs[k];
        owned[*out] = std::move(results[i].outputs[k]);
        view[*out] = &*owned[*out];
        ++live;
      }
      if (options.timing) {
        timings.push_back(NodeTiming{*level[i], node.name, node.op.kind(),
                                     results[i].duration});
        INFERA_INFO("node {:>4} {:<24} {:<18} {:>10.3f} ms", *level[i],
                    node.name, op_name(node.op.kind()),
                    results[i].duration.count() / 1e6);
      }
    }
    peak = std::max(peak, live);

    for (graph::NodeId id : level) {
      const graph::OperatorNode &node = graph.node(id);
      for (const auto &in : node.inputs) {
        if (in && --remaining[**in] == 0 && plan.isReleasable(*in)) {
          release(*in, live);
        }
      }
    }
    for (graph::NodeId id : level) {
      for (graph::ValueId out : graph.node(id).outputs) {
        if (plan.consumerCount(out) == 0 && plan.isReleasable(out)) {
          release(out, live);
        }
      }
    }
  }

  Binding outputs;
  for (graph::ValueId id : wanted) {
    const memory::string &name = graph.value(id).name;
    if (outputs.contains(name)) {
      continue;
    }
    if (owned[*id]) {
      outputs.emplace(name, std::move(*owned[*id]));
      owned[*id].reset();
    } else if (view[*id] != nullptr) {
      outputs.emplace(name, view[*id]->clone());
    } else {
      diag::invalid_state(
          fmt::format("output '{}' was not computed", name));
    }
  }

  if (options.timing) {
    std::stable_sort(timings.begin(), timings.end(),
                     [](const NodeTiming &a, const NodeTiming &b) {
                       return a.duration > b.duration;
                     });
    log_timings(timings);
  }
  if (stats != nullptr) {
    stats->peakLiveTensors = peak;
    stats->allocations = pool.allocationCount();
    stats->reuses = pool.reuseCount();
    stats->timings = std::move(timings);
  }
  return outputs;
}

} // namespace infera::runtime
