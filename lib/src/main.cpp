#include "coregrid.hpp"

int main(int argc, char* argv[]) { return runCoreGridCli(argc, argv); }
