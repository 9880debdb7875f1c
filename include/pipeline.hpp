#ifndef TESSERA_PIPELINE_HPP
#define TESSERA_PIPELINE_HPP

#include "geometry.hpp"
#include "render_worker.hpp"
#include "tile_renderer.hpp"
#include "logging/logger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace tessera {

/* Everything the pipeline needs to know about a run. This is
 * filled in from the command line, but there is nothing else
 * global: each component gets the values it needs from here.
 */
struct render_options {
  render_options();

  // mapnik XML style file.
  std::string map_file;
  // root of the {z}/{x}/{y}.{ext} tree.
  std::string tile_dir;
  // area to render, in longitude / latitude.
  bounding_box bbox;
  unsigned int min_zoom, max_zoom;
  // number of render workers.
  unsigned int threads;
  // tag for log messages.
  std::string name;
  unsigned int tile_size;
  // image format, and the file extension it's saved with.
  std::string format, extension;
  // if true, the first failed tile stops the whole run.
  bool stop_on_error;
};

// the file extension used for tiles in a particular format.
std::string extension_for_format(const std::string &format);

// thrown when the run is interrupted while tiles are still
// being queued.
struct pipeline_cancelled : public std::exception {
  virtual ~pipeline_cancelled() {}
  const char *what() const noexcept {
    return "Rendering was cancelled";
  }
};

/* Renders all the tiles covering `options.bbox` between the min
 * and max zoom levels, using `options.threads` workers which each
 * get their own renderer from `factory`.
 *
 * The `cancel` flag is checked before each tile is queued. If it
 * has been set, the queue is closed without waiting for the tiles
 * already queued, and `pipeline_cancelled` is thrown once the
 * workers have finished whatever they were in the middle of.
 *
 * Returns the combined statistics of all the workers. Exceptions
 * from workers are re-thrown after all the workers have been
 * joined.
 */
render_stats render_tiles(const render_options &options,
                          renderer_factory &factory,
                          logging::logger &log,
                          const std::atomic<bool> &cancel);

} // namespace tessera

#endif // TESSERA_PIPELINE_HPP
