//
// Command line interface to the segmented stem profile model

// (c) 2024 Greg Johnson
// Greg Johnson Biometrics LLC
//

#include <fstream>
#include <iostream>
#include <exception>
#include <vector>

#include "provider.hpp"
#include "request.hpp"

int main( int argc, char **argv )
{
	//////////////////////////////////////////////////////////////////////////////////////////////////////

	// check to see if proper number arguments present
	if( argc < 2 )
	{
		std::cerr << "Command line requires at least 1 parameter, " << argc-1 << " supplied\n";
		std::cerr << "Usage:\nspm trees.csv [coefficients.csv]\nwhere coefficients.csv replaces the built-in coefficient table.\n";
		return -1;
	}

	// coefficient table: built-in reference rows unless a table file is given
	TABLE_PROVIDER coefficients = TABLE_PROVIDER::reference();
	if( argc > 2 )
	{
		std::string coef_filename{argv[2]};
		std::ifstream coef_file{coef_filename};
		if( !coef_file.is_open() )
		{
			std::cerr << "Did not find or could not open " << coef_filename << "\n";
			return -2;
		}

		try {
			coefficients = load_coefficients( coef_file );
		} catch( std::exception &e ) {
			std::cerr << "Could not read coefficient table from " << coef_filename << "\n" << e.what() << "\n";
			return -21;
		}
	}

	// attempt to open tree file
	std::string trees_filename{argv[1]};
	std::ifstream trees_file{trees_filename};
	if( !trees_file.is_open() )
	{
		std::cerr << "Did not find or could not open " << trees_filename << "\n";
		return -3;
	}

	//////////////////////////////////////////////////////////////////////////////////////////////////////
	// read and parse tree list file
	// format:
	// tree_id, region, species, dbh, ht, bark, h, d, lower, upper
	std::vector<STEM_REQUEST> requests;
	try {
		requests = read_requests( trees_file );
	} catch( std::exception &e ) {
		std::cerr << "Could not read tree list data from " << trees_filename << "\n" << e.what() << "\n";
		return -31;
	}

	trees_file.close();

	//////////////////////////////////////////////////////////////////////////////////////////////////////
	// estimate stem profile for each tree
	int skipped = process_requests( requests, coefficients, std::cout, std::cerr );
	if( skipped > 0 )
		std::cerr << skipped << " of " << requests.size() << " trees skipped\n";

	return 0;
}
