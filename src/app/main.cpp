#include <iostream>
#include "app/hook_runner.hpp"

int main() {
    // No flags, no environment: the hook is driven by standard input alone.
    return hookguard::app::run_hook(std::cin, std::cout, std::cerr);
}
