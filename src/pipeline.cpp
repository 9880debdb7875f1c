#include "pipeline.hpp"
#include "tile_enumerator.hpp"
#include "work_queue.hpp"

#include <future>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>

namespace bfs = boost::filesystem;

namespace tessera {

namespace {

// thread function for a render worker. the renderer is created
// here, rather than by the caller, so that all of its resources
// belong to the thread which uses them.
render_stats worker_thread(work_queue &queue,
                           renderer_factory &factory,
                           const render_options &options,
                           logging::logger &log) {
  try {
    render_worker worker(queue, factory.make_renderer(),
                         options.max_zoom, options.tile_size,
                         options.stop_on_error, log);
    return worker.run();

  } catch (...) {
    // without this, nothing would retire this worker's sentinel
    // and the drain would never finish.
    queue.close();
    throw;
  }
}

} // anonymous namespace

render_options::render_options()
  : bbox(bounding_box::world()), min_zoom(1), max_zoom(1), threads(8),
    name("unknown"), tile_size(512), format("png"), extension("png"),
    stop_on_error(false) {
}

std::string extension_for_format(const std::string &format) {
  return boost::algorithm::starts_with(format, "png") ? "png" : format;
}

render_stats render_tiles(const render_options &options,
                          renderer_factory &factory,
                          logging::logger &log,
                          const std::atomic<bool> &cancel) {
  LOG_INFO(log, boost::format("render_tiles(%1%, %2%, %3%, %4%, %5%, %6%, %7%, %8%, %9%, %10%)")
           % options.map_file % options.bbox % options.min_zoom % options.max_zoom
           % options.threads % options.name % options.tile_size % options.format
           % options.tile_dir % options.extension);

  if (options.threads < 1) {
    throw std::invalid_argument("Number of render threads must be at least one.");
  }

  work_queue queue;
  std::vector<std::future<render_stats> > workers;
  bool cancelled = false;

  try {
    // if starting a thread fails part way through, the ones which
    // did start are waiting on the queue and must be shut down.
    for (unsigned int i = 0; i < options.threads; ++i) {
      workers.emplace_back(std::async(std::launch::async, &worker_thread,
                                      std::ref(queue), std::ref(factory),
                                      std::cref(options), std::ref(log)));
      LOG_INFO(log, boost::format("Started render thread %1%") % i);
    }

    bfs::create_directories(options.tile_dir);

    tile_enumerator tiles(options.bbox, options.min_zoom, options.max_zoom,
                          options.tile_size, options.tile_dir,
                          options.extension, options.name);

    render_request req;
    while (tiles.next(req)) {
      if (cancel.load()) {
        cancelled = true;
        break;
      }
      // if the push fails then a worker has given up, so stop
      // queueing and go and find out why.
      if (!queue.push(req)) {
        break;
      }
    }

    if (cancelled) {
      queue.close();

    } else {
      // one sentinel for each worker. if the queue has been closed
      // these are dropped and the drain returns immediately.
      for (unsigned int i = 0; i < options.threads; ++i) {
        queue.push(shutdown_sentinel());
      }
      queue.await_drain();
    }

  } catch (...) {
    // the workers can't be left running on a queue which is
    // about to go out of scope.
    queue.close();
    for (auto &fut : workers) {
      fut.wait();
    }
    throw;
  }

  // gather the results and exceptions from all the workers, but
  // don't stop gathering - we want to harvest all the errors and
  // join all the threads.
  render_stats stats;
  std::exception_ptr error;
  for (auto &fut : workers) {
    try {
      stats += fut.get();

    } catch (const std::exception &e) {
      if (!error) {
        error = std::current_exception();
      }
      LOG_ERROR(log, boost::format("Render thread stopped: %1%") % e.what());
    }
  }

  if (cancelled) {
    throw pipeline_cancelled();
  }

  if (error) {
    std::rethrow_exception(error);
  }

  LOG_INFO(log, boost::format("Rendered %1% tiles, %2% already existed, %3% failed.")
           % stats.rendered % stats.skipped % stats.failed);

  return stats;
}

} // namespace tessera
