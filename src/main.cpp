#include "Engine/engine_loop.hpp"

// std
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char **argv) {
  const std::string spriteMetaPath = (argc > 1) ? argv[1] : "";

  try {
    lse::EngineLoop app{spriteMetaPath};
    app.run(240);
  } catch (const std::exception &e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
