/**
 * @file test_host_main.cpp
 * @brief Isolated host for the test job types.
 */

#include "job/isolated_host.hpp"
#include "support/test_jobs.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    jobtier::JobRegistry registry;
    jobtier::test::register_test_jobs(registry);

    auto bundle = jobtier::find_bundle_argument(argc, argv);
    if (!bundle) {
        std::cerr << "usage: jobtier_test_host --run-job-bundle <path>\n";
        return static_cast<int>(jobtier::HostExit::BadBundle);
    }
    return jobtier::run_isolated_host(registry, *bundle);
}
