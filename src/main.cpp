#include "core/cli.hpp"
#include "core/logger.hpp"

int main(int argc, char* argv[]) {
    int ret = CLI::run(argc, argv);
    Logger::shutdown();
    return ret;
}
