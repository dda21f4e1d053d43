#include "efb/cli/app.hpp"

int main(int argc, char** argv) {
    efb::cli::App app;
    return app.run(argc, argv);
}
