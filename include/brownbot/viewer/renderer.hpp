#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <brownbot/config.hpp>
#include <brownbot/history.hpp>
#include <brownbot/sim_runner.hpp>

namespace brownbot {

struct RenderReport {
  PositionHistory history;        // always valid, even when export failed
  std::size_t frames_written = 0; // GIF frames or PNG files
  std::string artifact_path;      // GIF file or frames directory; empty if nothing saved
  std::string export_error;       // set when saving failed
};

// Presents one run. Each variant picks the driver policy it consumes:
// the offline renderer builds an artifact from a finished batch history, the
// live renderer is fed tick by tick by the real-time driver.
class Renderer {
public:
  virtual ~Renderer() = default;
  virtual const char* name() const = 0;
  virtual RenderReport render(Simulation& sim) = 0;
};

// The only place a Mode is mapped to a renderer.
std::unique_ptr<Renderer> make_renderer(const SimConfig& cfg);

} // namespace brownbot
