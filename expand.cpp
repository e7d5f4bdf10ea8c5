/*****************************************************************************
  expand ABBREVIATION [CONTENT]

    Prints the abbreviation, then its markup (with CONTENT in the leaves).

  Exit codes:
    0 OK, 1 usage error, 2 parse failure;
    -1 runtime error, -2 other C++ exception, -9 unknown
 *****************************************************************************/

#include "abbrev.hpp"
#include "markup.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

//===========================================================================
int main(int argc, char** argv)
{
	using namespace Combitoy;

	try {
		std::string_view abbrev  = argc < 2 ? "" : argv[1];
		std::string_view content = argc < 3 ? "" : argv[2];

		if (abbrev.empty()) {
			std::cerr << "Usage: " << (argc ? argv[0] : "expand") << " ABBREVIATION [CONTENT]\n";
			return 1;
		}

		auto result = Abbrev::parse(abbrev);
		if (!result) {
			std::cerr << fmt::format("- Invalid abbreviation \"{}\": {}", abbrev, describe(result.failure(), abbrev)) << "\n";
			return 2;
		}

		std::cout << abbrev << "\n";
		std::cout << Markup::serialize(result.value(), content) << "\n";

	} catch(std::runtime_error& x) {
		std::cerr << x.what() << "\n";
		exit(-1);
	} catch(std::exception& x) {
		std::cerr << "- C++ runtime error: " << x.what() << "\n";
		exit(-2);
	} catch(...) {
		std::cerr << "- UNKNOWN ERROR(S)!...\n";
		exit(-9);
	}
}
