#include <iostream>
#include <string>
#include <vector>
#include "rdfc_conversion.h"


int main(int argc, char* argv[])
{
	const std::vector<std::string> args(argv + 1, argv + argc);
	return rdfc::run_conversion(args, std::cin, std::cout, std::cerr);
}
