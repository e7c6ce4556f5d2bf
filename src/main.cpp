#include "chatrelay/cli/app.hpp"

int main(int argc, char** argv) {
    chatrelay::cli::App app;
    return app.run(argc, argv);
}
