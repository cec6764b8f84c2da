#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "log/Registry.hpp"
#include "util/paths.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // Keep every test away from the real ~/.config/git-sync
        const auto home = fs::temp_directory_path() / ("gitsync-tests-" + std::to_string(getpid()));
        fs::create_directories(home);
        setenv("GITSYNC_HOME", home.c_str(), 1);

        gitsync::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize gitsync test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();

    std::error_code ec;
    fs::remove_all(gitsync::paths::getConfigDir(), ec);
    return rc;
}
