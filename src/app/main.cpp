#include <iostream>

#include "hrec/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    // Services are created after parsing so that --config is honoured
    hrec::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
