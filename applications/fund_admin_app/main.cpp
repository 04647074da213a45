#include <fundunit/app/fund_admin.hpp>
#include <fundunit/utils/config.hpp>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string config_file = argc > 1 ? argv[1] : "fundunit.conf";

    auto config = fundunit::utils::Config::instance();
    if (!config->load_from_file(config_file)) {
        std::cerr << "Failed to load configuration file " << config_file << std::endl;
        return 1;
    }

    return fundunit::app::run(*config, std::cout);
}
