/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PRIORITY_QUEUE_HPP
#define PRIORITY_QUEUE_HPP

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HexPath {

/**
 * @brief Indexed binary min-heap with in-place priority updates
 *
 * Each item appears at most once. updatePriority() re-sifts the entry in
 * place, so no stale duplicates are ever left in the heap and pop() always
 * returns the item with the lowest current priority.
 *
 * @tparam T Item type (hashable, equality comparable)
 * @tparam Priority Key type ordered by Compare
 */
template <typename T, typename Priority, typename Compare = std::less<Priority>,
          typename Hash = std::hash<T>>
class PriorityQueue {
public:
  bool empty() const { return m_heap.empty(); }
  size_t size() const { return m_heap.size(); }

  bool contains(const T &item) const {
    return m_index.find(item) != m_index.end();
  }

  // Pushing an item that is already queued updates its priority instead
  void push(const T &item, const Priority &priority) {
    auto it = m_index.find(item);
    if (it != m_index.end()) {
      setPriorityAt(it->second, priority);
      return;
    }
    m_heap.push_back(Entry{item, priority});
    m_index.emplace(item, m_heap.size() - 1);
    siftUp(m_heap.size() - 1);
  }

  const T &top() const {
    if (m_heap.empty()) {
      throw std::out_of_range("PriorityQueue::top on empty queue");
    }
    return m_heap.front().item;
  }

  const Priority &topPriority() const {
    if (m_heap.empty()) {
      throw std::out_of_range("PriorityQueue::topPriority on empty queue");
    }
    return m_heap.front().priority;
  }

  T pop() {
    if (m_heap.empty()) {
      throw std::out_of_range("PriorityQueue::pop on empty queue");
    }
    T item = std::move(m_heap.front().item);
    m_index.erase(item);

    if (m_heap.size() > 1) {
      m_heap.front() = std::move(m_heap.back());
      m_heap.pop_back();
      m_index[m_heap.front().item] = 0;
      siftDown(0);
    } else {
      m_heap.pop_back();
    }
    return item;
  }

  // Returns false when the item is not queued
  bool updatePriority(const T &item, const Priority &priority) {
    auto it = m_index.find(item);
    if (it == m_index.end()) {
      return false;
    }
    setPriorityAt(it->second, priority);
    return true;
  }

  const Priority &priorityOf(const T &item) const {
    auto it = m_index.find(item);
    if (it == m_index.end()) {
      throw std::out_of_range("PriorityQueue::priorityOf unknown item");
    }
    return m_heap[it->second].priority;
  }

  void clear() {
    m_heap.clear();
    m_index.clear();
  }

  void reserve(size_t capacity) {
    m_heap.reserve(capacity);
    m_index.reserve(capacity);
  }

  // Heap order and index consistency; used by tests
  bool validateHeap() const {
    if (m_index.size() != m_heap.size()) {
      return false;
    }
    for (size_t i = 0; i < m_heap.size(); ++i) {
      auto it = m_index.find(m_heap[i].item);
      if (it == m_index.end() || it->second != i) {
        return false;
      }
      if (i > 0 && m_compare(m_heap[i].priority, m_heap[(i - 1) / 2].priority)) {
        return false;
      }
    }
    return true;
  }

private:
  struct Entry {
    T item;
    Priority priority;
  };

  void setPriorityAt(size_t position, const Priority &priority) {
    bool decreased = m_compare(priority, m_heap[position].priority);
    m_heap[position].priority = priority;
    if (decreased) {
      siftUp(position);
    } else {
      siftDown(position);
    }
  }

  void swapEntries(size_t a, size_t b) {
    std::swap(m_heap[a], m_heap[b]);
    m_index[m_heap[a].item] = a;
    m_index[m_heap[b].item] = b;
  }

  void siftUp(size_t position) {
    while (position > 0) {
      size_t parent = (position - 1) / 2;
      if (!m_compare(m_heap[position].priority, m_heap[parent].priority)) {
        break;
      }
      swapEntries(position, parent);
      position = parent;
    }
  }

  void siftDown(size_t position) {
    const size_t count = m_heap.size();
    while (true) {
      size_t smallest = position;
      size_t left = 2 * position + 1;
      size_t right = left + 1;
      if (left < count &&
          m_compare(m_heap[left].priority, m_heap[smallest].priority)) {
        smallest = left;
      }
      if (right < count &&
          m_compare(m_heap[right].priority, m_heap[smallest].priority)) {
        smallest = right;
      }
      if (smallest == position) {
        break;
      }
      swapEntries(position, smallest);
      position = smallest;
    }
  }

  std::vector<Entry> m_heap;
  std::unordered_map<T, size_t, Hash> m_index;
  Compare m_compare;
};

} // namespace HexPath

#endif // PRIORITY_QUEUE_HPP
