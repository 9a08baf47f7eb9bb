#include "infera/tensor/TensorPool.hpp"
#include <gtest/gtest.h>

using namespace infera;

TEST(tensor_pool, fresh_allocation) {
  TensorPool pool;
  Tensor t = pool.alloc(TensorDataType::Float32, {4, 4});
  EXPECT_EQ(t.shape(), (Shape{4, 4}));
  EXPECT_EQ(pool.allocationCount(), 1u);
  EXPECT_EQ(pool.reuseCount(), 0u);
}

TEST(tensor_pool, released_buffer_is_reused) {
  TensorPool pool;
  Tensor a = pool.alloc(TensorDataType::Float32, {16});
  const std::byte *storage = a.bytes();
  pool.release(std::move(a));
  EXPECT_EQ(pool.freeCount(), 1u);

  // Same byte size, different dtype and shape.
  Tensor b = pool.alloc(TensorDataType::Int32, {4, 4});
  EXPECT_EQ(b.bytes(), storage);
  EXPECT_EQ(pool.reuseCount(), 1u);
  EXPECT_EQ(pool.freeCount(), 0u);
}

TEST(tensor_pool, smaller_request_reuses_up_to_twice) {
  TensorPool pool;
  pool.release(pool.alloc(TensorDataType::Float32, {100}));
  Tensor t = pool.alloc(TensorDataType::Float32, {60});
  EXPECT_EQ(pool.reuseCount(), 1u);
  EXPECT_EQ(t.numel(), 60);
}

TEST(tensor_pool, much_smaller_request_allocates) {
  TensorPool pool;
  pool.release(pool.alloc(TensorDataType::Float32, {100}));
  Tensor t = pool.alloc(TensorDataType::Float32, {10});
  EXPECT_EQ(pool.reuseCount(), 0u);
  EXPECT_EQ(pool.allocationCount(), 2u);
  EXPECT_EQ(pool.freeCount(), 1u);
}

TEST(tensor_pool, larger_request_allocates) {
  TensorPool pool;
  pool.release(pool.alloc(TensorDataType::Float32, {8}));
  Tensor t = pool.alloc(TensorDataType::Float32, {9});
  EXPECT_EQ(pool.reuseCount(), 0u);
}

TEST(tensor_pool, best_fit) {
  TensorPool pool;
  Tensor big = pool.alloc(TensorDataType::Uint8, {120});
  Tensor small = pool.alloc(TensorDataType::Uint8, {64});
  const std::byte *smallStorage = small.bytes();
  pool.release(std::move(big));
  pool.release(std::move(small));
  Tensor t = pool.alloc(TensorDataType::Uint8, {60});
  EXPECT_EQ(t.bytes(), smallStorage);
}

TEST(tensor_pool, borrowed_tensors_are_not_pooled) {
  TensorPool pool;
  const float data[4] = {};
  pool.release(Tensor::borrow(TensorDataType::Float32, {4}, data));
  EXPECT_EQ(pool.freeCount(), 0u);
}
