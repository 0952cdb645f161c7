#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return arcstream::cli::run(argc, argv);
}
