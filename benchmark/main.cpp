#include <cstdlib>
#include <exception>
#include <iostream>

#include <celero/Celero.h>


int main(int argc, char* argv[]) {
    try {
        celero::Run(argc, argv);
    }
    catch (const std::exception& ex) {
        std::cerr << "taskstep_benchmark: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
