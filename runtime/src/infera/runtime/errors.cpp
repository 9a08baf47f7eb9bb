#include "infera/runtime/errors.hpp"
#include "infera/kernels/errors.hpp"

#include <fmt/format.h>
#include <new>

namespace infera::runtime {

RunError RunError::fromException(std::size_t node, memory::string nodeName,
                                 OpKind op, std::exception_ptr error) {
  auto failure = [&](bool shapeError, const char *what,
                     memory::optional<std::size_t> dimension =
                         memory::nullopt) {
    auto msg =
        fmt::format("node {} '{}' ({}) failed: {}", node, nodeName, op, what);
    return kernelFailure(node, nodeName, op, shapeError, msg, dimension);
  };

  try {
    std::rethrow_exception(error);
  } catch (const kernels::ShapeError &e) {
    return failure(true, e.what(), e.dimension());
  } catch (const kernels::KernelError &e) {
    return failure(false, e.what());
  } catch (const std::invalid_argument &e) {
    return failure(true, e.what());
  } catch (const std::bad_alloc &) {
    return failure(false, "out of memory");
  } catch (const std::exception &e) {
    return failure(false, e.what());
  }
}

} // namespace infera::runtime
