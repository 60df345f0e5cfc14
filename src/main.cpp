#include "core/cli.hpp"
#include "core/logging.hpp"

int main(int argc, char* argv[]) {
    int ret = CLI::run(argc, argv);
    Logging::shutdown();
    return ret;
}
