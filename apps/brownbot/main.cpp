#include <brownbot/app.hpp>

using namespace brownbot;

int main(int argc, char** argv) {
  App app(argc > 1 ? argv[1] : "config.yaml");
  return app.run();
}
