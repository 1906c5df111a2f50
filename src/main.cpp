#include <exception>
#include <filesystem>
#include <iostream>

#include "app/provision_app.hpp"

int main(int argc, char ** /*argv*/) {
    if (argc > 1) {
        std::cerr << "provision takes no arguments; ignoring them" << std::endl;
    }

    try {
        provision::ProvisionApp app(std::filesystem::current_path());
        return app.run();
    } catch (const std::exception &error) {
        std::cerr << "provision: " << error.what() << std::endl;
        return 1;
    }
}
