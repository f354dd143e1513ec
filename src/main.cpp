#include "cloudbrowser/cli/app.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        cloudbrowser::cli::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
