#ifndef UTILITY_HPP
#define UTILITY_HPP

#include <string>
#include <sstream>

// round to the given number of decimal places, halves away from zero
double round_to( double value, int places );

// read the next comma delimited field from a record
std::string get_string( std::istringstream &ss );
double get_double( std::istringstream &ss );
int get_int( std::istringstream &ss );

// strip leading and trailing whitespace
std::string trim( std::string const & str );

#endif
