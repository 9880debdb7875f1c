#include "render_worker.hpp"

#include <exception>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/system/error_code.hpp>

namespace bfs = boost::filesystem;

namespace tessera {

namespace {

// sizes of the blank tiles which some styles produce over empty
// areas. only used to annotate debug output, since it depends on
// the format and encoder.
bool looks_empty(const std::string &path) {
  boost::system::error_code ec;
  const boost::uintmax_t size = bfs::file_size(path, ec);
  if (ec) {
    return false;
  }
  return (size == 103) || (size == 126) || (size == 222);
}

} // anonymous namespace

render_stats &render_stats::operator+=(const render_stats &other) {
  rendered += other.rendered;
  skipped += other.skipped;
  failed += other.failed;
  return *this;
}

render_worker::render_worker(work_queue &queue,
                             std::unique_ptr<tile_renderer> renderer,
                             unsigned int max_zoom,
                             unsigned int tile_size,
                             bool stop_on_error,
                             logging::logger &log)
  : m_queue(queue), m_renderer(std::move(renderer)),
    m_projection(max_zoom + 1, tile_size), m_tile_size(tile_size),
    m_stop_on_error(stop_on_error), m_log(log),
    m_state(state::running) {
}

render_stats render_worker::run() {
  while (m_state == state::running) {
    boost::optional<work_item> item = m_queue.pop();

    // the queue was closed, and nobody is waiting for us to
    // retire anything.
    if (!item) {
      m_state = state::stopped;
      break;
    }

    const render_request *req = boost::get<render_request>(&*item);
    if (req == nullptr) {
      m_queue.mark_done();
      m_state = state::stopped;
      break;
    }

    handle(*req);
  }

  return m_stats;
}

bounding_box render_worker::tile_bbox(const tile_coord &tile) const {
  // bottom-left and top-right corners in pixels.
  const pixel_point p0(double(tile.x) * m_tile_size, double(tile.y + 1) * m_tile_size);
  const pixel_point p1(double(tile.x + 1) * m_tile_size, double(tile.y) * m_tile_size);

  const geo_point l0 = m_projection.to_geo(p0, tile.z);
  const geo_point l1 = m_projection.to_geo(p1, tile.z);

  return bounding_box(l0.lon, l0.lat, l1.lon, l1.lat);
}

void render_worker::handle(const render_request &req) {
  try {
    render(req);

  } catch (const std::exception &e) {
    ++m_stats.failed;
    LOG_ERROR(m_log, boost::format("(%1% : %2%) render failed: %3%")
              % req.name % req.tile % e.what());

    if (m_stop_on_error) {
      m_state = state::stopped;
      m_queue.mark_done();
      // wake up everyone else, so that the error gets reported
      // without waiting for the rest of the tiles.
      m_queue.close();
      throw;
    }
  }

  m_queue.mark_done();
}

void render_worker::render(const render_request &req) {
  bool exists = false;

  if (bfs::is_regular_file(req.path)) {
    exists = true;
    ++m_stats.skipped;

  } else {
    const bounding_box box = m_renderer->forward(tile_bbox(req.tile));
    m_renderer->render(box, req.path);
    ++m_stats.rendered;
  }

  if (m_log.enabled(logging::severity::debug)) {
    const bool empty = looks_empty(req.path);
    m_log.log(logging::severity::debug, boost::format("%1%") % m_renderer->scale_denominator());
    m_log.log(logging::severity::debug, boost::format("(%1% : %2%, %3%, %4%, %5%, %6%)")
              % req.name % req.tile.z % req.tile.x % req.tile.y
              % (exists ? "exists" : "") % (empty ? "empty" : ""));
  }
}

} // namespace tessera
