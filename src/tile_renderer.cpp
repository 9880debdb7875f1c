#include "tile_renderer.hpp"

namespace tessera {

tile_renderer::~tile_renderer() {
}

renderer_factory::~renderer_factory() {
}

} // namespace tessera
