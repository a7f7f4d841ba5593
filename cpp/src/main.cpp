#include "tiergate/cli.hpp"

int main(int argc, char *argv[])
{
    return tiergate::cli::run(argc, argv);
}
