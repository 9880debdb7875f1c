#ifndef TESSERA_RENDER_WORKER_HPP
#define TESSERA_RENDER_WORKER_HPP

#include "geometry.hpp"
#include "projection.hpp"
#include "render_request.hpp"
#include "tile_renderer.hpp"
#include "work_queue.hpp"
#include "logging/logger.hpp"

#include <cstddef>
#include <memory>
#include <boost/noncopyable.hpp>

namespace tessera {

// what happened to the tiles a worker (or the whole pipeline)
// has seen.
struct render_stats {
  render_stats() : rendered(0), skipped(0), failed(0) {}

  render_stats &operator+=(const render_stats &other);

  std::size_t total() const { return rendered + skipped + failed; }

  // tiles which were rendered and saved.
  std::size_t rendered;
  // tiles which already existed on disk.
  std::size_t skipped;
  // tiles whose render threw an exception.
  std::size_t failed;
};

/* Takes render requests off the queue until it gets a shutdown
 * sentinel, rendering each tile which doesn't already exist.
 *
 * Each worker owns its renderer and projection, and shares
 * nothing but the queue with the other workers.
 */
class render_worker : public boost::noncopyable {
public:
  enum class state { running, stopped };

  // `max_zoom` is the highest zoom which requests will have.
  //
  // if `stop_on_error` is false, a failed render is logged and
  // counted, and the worker carries on with the next tile. if it
  // is true, the queue is closed and the exception propagates
  // out of `run`.
  render_worker(work_queue &queue,
                std::unique_ptr<tile_renderer> renderer,
                unsigned int max_zoom,
                unsigned int tile_size,
                bool stop_on_error,
                logging::logger &log);

  // process requests until told to shut down, or until the queue
  // is closed.
  render_stats run();

  // the longitude / latitude extent of a tile.
  bounding_box tile_bbox(const tile_coord &tile) const;

  state current_state() const { return m_state; }

private:
  void handle(const render_request &req);
  void render(const render_request &req);

  work_queue &m_queue;
  std::unique_ptr<tile_renderer> m_renderer;
  const google_projection m_projection;
  const unsigned int m_tile_size;
  const bool m_stop_on_error;
  logging::logger &m_log;
  state m_state;
  render_stats m_stats;
};

} // namespace tessera

#endif // TESSERA_RENDER_WORKER_HPP
