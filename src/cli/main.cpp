#include "cli/CliMain.hpp"

int main(int argc, char** argv)
{
  return estimap::EstimapCliMain(argc, argv);
}
