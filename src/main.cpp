#include "warden/cli.hpp"

int main(int argc, char *argv[])
{
    return warden::cli::run(argc, argv);
}
