#include "chatvault/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    chatvault::cli::App app;
    return app.run(argc, argv);
}
