#pragma once

#include "infera/diag/logging.hpp"
#include "infera/kernels/WorkerPool.hpp"
#include "infera/kernels/errors.hpp"
#include "infera/runtime/Executor.hpp"
#include "infera/runtime/Options.hpp"
#include "infera/runtime/errors.hpp"
#include "infera/runtime/model.hpp"
#include "infera/tensor/Tensor.hpp"
