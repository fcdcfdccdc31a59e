#pragma once

#include <boost/dynamic_bitset.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace util {

using pool_index_t = int64_t;

/*
 * An AllocPool is a thread-safe pool of memory that supports single or block alloc() calls. Each
 * alloc() call returns a pool_index_t that can be used to access the allocated memory via
 * operator[]. Elements are default-constructed on allocation.
 *
 * The block-growing part of alloc() is mutex-protected, while operator[] is lockfree. Addresses are
 * stable: an element never moves except during defragment().
 *
 * AllocPool does NOT support free() calls. Memory is reclaimed in bulk via clear() or
 * defragment(), both of which require that no other thread is accessing the pool.
 *
 * The underlying implementation relies on an array of blocks of type T[]. The first two blocks are
 * of size 2^N, and each subsequent block is twice the size of the previous block.
 */
template <typename T, int N = 10>
class AllocPool {
 public:
  AllocPool();
  AllocPool(const AllocPool&) = delete;
  AllocPool& operator=(const AllocPool&) = delete;
  ~AllocPool();

  void clear();
  pool_index_t alloc(int n);
  T& operator[](pool_index_t i);
  const T& operator[](pool_index_t i) const;
  uint64_t size() const { return size_.load(std::memory_order_acquire); }

  /*
   * Compacts the pool so that only the elements i with used_indices[i] set remain, preserving
   * their relative order. Element at index i moves to index used_indices.count() restricted to
   * [0, i). Callers are responsible for remapping any stored indices.
   */
  void defragment(const boost::dynamic_bitset<>& used_indices);

 private:
  void add_blocks_if_necessary(int block_index);

  static constexpr int kNumBlocks = 64 - N;
  using Block = char*;

  std::atomic<uint64_t> size_ = 0;
  std::atomic<int> num_blocks_ = 2;
  mutable std::mutex mutex_;
  Block blocks_[kNumBlocks] = {};
};

}  // namespace util

#include "inline/util/AllocPool.inl"
