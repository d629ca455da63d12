#include "queue_simulator.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return QueueSimulator::runCommandLine(args, std::cin, std::cout, std::cerr);
}
