#include <brownbot/viewer/renderer.hpp>
#include <brownbot/viewer/live_renderer.hpp>
#include <brownbot/viewer/offline_renderer.hpp>

namespace brownbot {

std::unique_ptr<Renderer> make_renderer(const SimConfig& cfg) {
  switch (cfg.mode) {
    case Mode::Offline:
      return std::make_unique<OfflineRenderer>(OfflineOptions::from_config(cfg));
    case Mode::Realtime:
      return std::make_unique<LiveRenderer>(LiveOptions::from_config(cfg));
  }
  return nullptr;
}

} // namespace brownbot
