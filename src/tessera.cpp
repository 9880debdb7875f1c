#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "config.h"
#include "mapnik_renderer.hpp"
#include "mbtiles.hpp"
#include "metadata.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include "logging/logger.hpp"

namespace bfs = boost::filesystem;

namespace {

/* Turns SIGINT / SIGTERM into a flag which the pipeline checks
 * while it's queueing tiles. A second signal exits straight away,
 * since renders already in progress can't be interrupted.
 */
struct interrupt_guard {
  explicit interrupt_guard(tessera::logging::logger &log)
    : m_log(log), m_signals(m_service), m_cancel(false) {

    m_signals.add(SIGINT);
    m_signals.add(SIGTERM);
    wait();
    m_thread = std::thread([this]() { m_service.run(); });
  }

  ~interrupt_guard() {
    m_service.stop();
    m_thread.join();
  }

  const std::atomic<bool> &cancel() const { return m_cancel; }

private:
  void wait() {
    m_signals.async_wait([this](const boost::system::error_code &ec, int signal_number) {
        if (ec) {
          return;
        }
        if (m_cancel.exchange(true)) {
          std::_Exit(EXIT_FAILURE);
        }
        LOG_WARNING(m_log, boost::format("Caught signal %1%, stopping. Signal again to "
                                         "exit immediately.") % signal_number);
        wait();
      });
  }

  tessera::logging::logger &m_log;
  boost::asio::io_service m_service;
  boost::asio::signal_set m_signals;
  std::atomic<bool> m_cancel;
  std::thread m_thread;
};

tessera::tileset_metadata make_metadata(const tessera::command_line &cmd) {
  tessera::tileset_metadata metadata = cmd.metadata;
  metadata.name = bfs::path(cmd.output).stem().string();
  metadata.format = cmd.render.extension;
  metadata.bounds = tessera::format_bounds(cmd.render.bbox);
  metadata.minzoom = (boost::format("%1%") % cmd.render.min_zoom).str();
  metadata.maxzoom = (boost::format("%1%") % cmd.render.max_zoom).str();
  return metadata;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  tessera::command_line cmd;

  try {
    if (!tessera::parse_command_line(argc, argv, cmd, std::cout)) {
      return EXIT_SUCCESS;
    }

  } catch (const tessera::options_error &e) {
    std::cerr << e.what() << "\n"
              << "Run `tessera --help` for the list of options.\n";
    return EXIT_FAILURE;
  }

  tessera::logging::stream_logger log(cmd.verbose ? tessera::logging::severity::debug
                                                  : tessera::logging::severity::info);

  // the MBTiles file must not already exist. check now, rather
  // than finding out after all the rendering has been done.
  if (bfs::exists(cmd.output)) {
    std::cerr << "Importing tiles into already-existing MBTiles is not yet supported\n";
    return EXIT_FAILURE;
  }

  try {
    if (cmd.clean && bfs::exists(cmd.render.tile_dir)) {
      LOG_INFO(log, boost::format("Removing existing tile directory %1%") % cmd.render.tile_dir);
      bfs::remove_all(cmd.render.tile_dir);
    }

    tessera::mapnik_renderer_options renderer_options;
    renderer_options.map_file = cmd.render.map_file;
    renderer_options.tile_size = cmd.render.tile_size;
    renderer_options.format = cmd.render.format;
    renderer_options.min_buffer_size = 128;

    tessera::mapnik_renderer_factory factory(renderer_options, cmd.fonts_dir,
                                             cmd.input_plugins_dir);

    tessera::render_stats stats;
    {
      interrupt_guard interrupt(log);
      stats = tessera::render_tiles(cmd.render, factory, log, interrupt.cancel());

      if (interrupt.cancel().load()) {
        throw tessera::pipeline_cancelled();
      }
    }

    if (stats.failed > 0) {
      std::cerr << "ERROR: " << stats.failed << " of " << stats.total()
                << " tiles failed to render, not creating " << cmd.output << ".\n";
      return EXIT_FAILURE;
    }

    const bfs::path metadata_file = bfs::path(cmd.render.tile_dir) / "metadata.json";
    tessera::write_metadata_json(make_metadata(cmd), metadata_file.string());

    tessera::disk_to_mbtiles(cmd.render.tile_dir, cmd.output, cmd.mbtiles, log);

  } catch (const tessera::pipeline_cancelled &) {
    std::cerr << "Ctrl-C detected, exiting...\n";
    return EXIT_FAILURE;

  } catch (const std::logic_error &e) {
    std::cerr << "Unable to render tiles: " << e.what() << "\n"
              << "This is a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;

  } catch (const std::exception &e) {
    std::cerr << "Unable to render tiles: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
