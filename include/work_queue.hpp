#ifndef TESSERA_WORK_QUEUE_HPP
#define TESSERA_WORK_QUEUE_HPP

#include "render_request.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

namespace tessera {

/* Unbounded FIFO of work items shared between the thread
 * enumerating tiles and the render workers.
 *
 * Every pushed item, shutdown sentinels included, adds one to
 * the pending count and must be retired with exactly one call to
 * `mark_done` once it has been handled. `await_drain` waits for
 * the pending count to get back to zero.
 *
 * `close` is for aborting: it wakes everyone up, drops whatever
 * is still queued and makes `pop` return nothing from then on.
 */
class work_queue : public boost::noncopyable {
public:
  work_queue();

  // never blocks on capacity. returns false, without queueing
  // the item, if the queue has been closed.
  bool push(const work_item &item);

  // blocks until there is an item to hand out. returns none if
  // the queue has been closed.
  boost::optional<work_item> pop();

  // retire one previously popped item. throws std::logic_error
  // if there are no pending items.
  void mark_done();

  // blocks until every pushed item has been retired, or until
  // the queue is closed.
  void await_drain();

  void close();

  bool closed() const;
  std::size_t pending() const;

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_item_available, m_drained;
  std::deque<work_item> m_items;
  std::size_t m_pending;
  bool m_closed;
};

} // namespace tessera

#endif // TESSERA_WORK_QUEUE_HPP
