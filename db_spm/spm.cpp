//
// Command line interface to the segmented stem profile model with coefficient DB Access
//
// (c) 2024 Greg Johnson
// Greg Johnson Biometrics LLC
//

#include <fstream>
#include <iostream>
#include <exception>
#include <vector>

#include "otl_provider.hpp"
#include "request.hpp"

int main( int argc, char **argv )
{
	//////////////////////////////////////////////////////////////////////////////////////////////////////

	// check to see if proper number arguments present
	if( argc < 3 )
	{
		std::cerr << "Command line requires 2 parameters, " << argc-1 << " supplied\n";
		std::cerr << "Usage:\nspm segprofile.db trees.csv\n";
		return -1;
	}

	// attempt to open coefficient DB
	otl_connect db; // connect object

	try {
		otl_connect::otl_initialize(); // initialize ODBC environment
	} catch( std::exception &e ) {
		std::cerr << "could not initialize otl.\n";
		return -3;
	}

 	try {
		#ifdef __linux__
			std::string connect_string = std::string("DRIVER={SQLite3};Database=") + std::string(argv[1]) +
		 							 std::string(";LongNames=0;Timeout=1000;NoTXN=0;SyncPragma=NORMAL;StepAPI=0;");
		#else
			std::string connect_string = std::string("DRIVER={SQLite3 ODBC Driver};Database=") + std::string(argv[1]) +
									 std::string(";LongNames=0;Timeout=1000;NoTXN=0;SyncPragma=NORMAL;StepAPI=0;");
		#endif
		db.rlogon( connect_string.c_str() );
	} catch(otl_exception& p) { // intercept OTL exceptions
		std::cerr << p.msg <<"\n"; // print out error message
		std::cerr << p.stm_text <<"\n"; // print out SQL that caused the error
		std::cerr << p.sqlstate <<"\n"; // print out SQLSTATE message
		std::cerr << p.var_info <<"\n"; // print out the variable that caused the error
		return -4;
 	}

	// attempt to open tree file
	std::string trees_filename{argv[2]};
	std::ifstream trees_file{trees_filename};
	if( !trees_file.is_open() )
	{
		std::cerr << "Did not find or could not open " << trees_filename << "\n";
		return -5;
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
		return -51;
	}

	trees_file.close();

	//////////////////////////////////////////////////////////////////////////////////////////////////////
	// estimate stem profile for each tree, fetching coefficients from the DB
	OTL_PROVIDER coefficients( db );
	int skipped = 0;

	try {
		skipped = process_requests( requests, coefficients, std::cout, std::cerr );
	} catch(otl_exception& p) { // intercept OTL exceptions
		std::cerr << p.msg <<"\n"; // print out error message
		std::cerr << p.stm_text <<"\n"; // print out SQL that caused the error
		std::cerr << p.sqlstate <<"\n"; // print out SQLSTATE message
		std::cerr << p.var_info <<"\n"; // print out the variable that caused the error
		db.logoff();
		return -6;
	}

	if( skipped > 0 )
		std::cerr << skipped << " of " << requests.size() << " trees skipped\n";

	db.logoff();
	return 0;
}
