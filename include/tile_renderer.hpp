#ifndef TESSERA_TILE_RENDERER_HPP
#define TESSERA_TILE_RENDERER_HPP

#include "geometry.hpp"

#include <memory>
#include <string>
#include <boost/noncopyable.hpp>

namespace tessera {

/* Interface for the per-worker rendering resources.
 *
 * A renderer bundles together the style, the transform from
 * longitude / latitude into the style's spatial reference system
 * and whatever else the rendering engine needs. None of this is
 * assumed to be thread-safe, so each worker gets its own.
 */
struct tile_renderer : public boost::noncopyable {
  virtual ~tile_renderer();

  // reproject a box in longitude / latitude into the spatial
  // reference system of the map.
  virtual bounding_box forward(const bounding_box &lonlat) const = 0;

  // render the area given by `box`, in the map's spatial
  // reference system, and save the image to `path`. throws if
  // the tile can't be rendered or saved.
  virtual void render(const bounding_box &box, const std::string &path) = 0;

  // scale denominator of the last render, for diagnostics.
  virtual double scale_denominator() const = 0;
};

/* Creates `tile_renderer` objects.
 *
 * Each worker calls `make_renderer` once, on its own thread,
 * before it starts taking work from the queue. Implementations
 * must therefore be safe to call concurrently.
 */
struct renderer_factory : public boost::noncopyable {
  virtual ~renderer_factory();

  virtual std::unique_ptr<tile_renderer> make_renderer() = 0;
};

} // namespace tessera

#endif // TESSERA_TILE_RENDERER_HPP
