#include "work_queue.hpp"

#include <stdexcept>

namespace tessera {

work_queue::work_queue()
  : m_pending(0), m_closed(false) {
}

bool work_queue::push(const work_item &item) {
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_closed) {
      return false;
    }
    m_items.push_back(item);
    ++m_pending;
  }
  m_item_available.notify_one();
  return true;
}

boost::optional<work_item> work_queue::pop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_item_available.wait(lock, [this]() { return m_closed || !m_items.empty(); });

  if (m_closed) {
    return boost::none;
  }

  work_item item = m_items.front();
  m_items.pop_front();
  return item;
}

void work_queue::mark_done() {
  bool drained = false;
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_pending == 0) {
      throw std::logic_error("mark_done called more times than items were pushed.");
    }
    --m_pending;
    drained = (m_pending == 0);
  }
  if (drained) {
    m_drained.notify_all();
  }
}

void work_queue::await_drain() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_drained.wait(lock, [this]() { return m_closed || (m_pending == 0); });
}

void work_queue::close() {
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_closed = true;
    m_items.clear();
  }
  m_item_available.notify_all();
  m_drained.notify_all();
}

bool work_queue::closed() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_closed;
}

std::size_t work_queue::pending() const {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_pending;
}

} // namespace tessera
