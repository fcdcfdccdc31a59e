#include "util/AllocPool.hpp"

#include "util/Asserts.hpp"

#include <algorithm>
#include <bit>
#include <new>
#include <type_traits>

namespace util {

namespace detail {

template <int N>
int get_block_index(pool_index_t i) {
  return std::max(0, 64 - N - std::countl_zero(uint64_t(i)));
}

}  // namespace detail

template <typename T, int N>
AllocPool<T, N>::AllocPool() {
  static_assert(std::is_trivially_destructible_v<T>);
  blocks_[0] = new char[sizeof(T) * (1 << N)];
  blocks_[1] = new char[sizeof(T) * (1 << N)];
}

template <typename T, int N>
AllocPool<T, N>::~AllocPool() {
  for (int i = 0; i < kNumBlocks; ++i) {
    delete[] blocks_[i];
  }
}

template <typename T, int N>
void AllocPool<T, N>::clear() {
  std::unique_lock lock(mutex_);
  size_ = 0;
}

template <typename T, int N>
pool_index_t AllocPool<T, N>::alloc(int n) {
  uint64_t old_size = size_.fetch_add(n, std::memory_order_acq_rel);
  uint64_t new_size = old_size + n;

  int block_index = detail::get_block_index<N>(new_size - 1);
  add_blocks_if_necessary(block_index);
  for (uint64_t i = old_size; i < new_size; ++i) {
    new (&(*this)[i]) T();
  }
  return old_size;
}

template <typename T, int N>
T& AllocPool<T, N>::operator[](pool_index_t i) {
  DEBUG_ASSERT(i >= 0, "Index out of bounds: {}", i);
  int block_index = detail::get_block_index<N>(i);
  int64_t offset = block_index == 0 ? i : (i - std::bit_floor(uint64_t(i)));

  T* block = reinterpret_cast<T*>(blocks_[block_index]);
  return block[offset];
}

template <typename T, int N>
const T& AllocPool<T, N>::operator[](pool_index_t i) const {
  DEBUG_ASSERT(i >= 0 && uint64_t(i) < size(), "Index out of bounds: {}", i);
  int block_index = detail::get_block_index<N>(i);
  int64_t offset = block_index == 0 ? i : (i - std::bit_floor(uint64_t(i)));

  const T* block = reinterpret_cast<const T*>(blocks_[block_index]);
  return block[offset];
}

template <typename T, int N>
void AllocPool<T, N>::defragment(const boost::dynamic_bitset<>& used_indices) {
  uint64_t n = size();
  RELEASE_ASSERT(used_indices.size() == n, "defragment() bitset size mismatch ({} != {})",
                 used_indices.size(), n);

  uint64_t w = 0;
  for (uint64_t r = 0; r < n; ++r) {
    if (used_indices[r]) {
      if (r != w) {
        (*this)[w] = (*this)[r];
      }
      ++w;
    }
  }
  size_ = w;
}

template <typename T, int N>
void AllocPool<T, N>::add_blocks_if_necessary(int block_index) {
  if (block_index >= num_blocks_.load(std::memory_order_acquire)) {
    std::unique_lock lock(mutex_);
    int num_blocks = num_blocks_.load(std::memory_order_relaxed);
    while (num_blocks <= block_index) {
      blocks_[num_blocks] = new char[sizeof(T) * (uint64_t(1) << (N + num_blocks - 1))];
      ++num_blocks;
    }
    num_blocks_.store(num_blocks, std::memory_order_release);
  }
}

}  // namespace util
