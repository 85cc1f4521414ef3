#include <iostream>

#include "app.hpp"

int main(int argc, char* argv[])
{
    return run_spicat(argc, argv, std::cout, std::cerr);
}
