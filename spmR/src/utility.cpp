
#include "utility.hpp"

#include <cmath>

double round_to( double value, int places )
{
    const double scale = std::pow( 10.0, places );
    return std::round( value * scale ) / scale;
}

std::string trim( std::string const & str )
{
    const auto first = str.find_first_not_of( " \t\r\n" );
    if( first == std::string::npos )
        return std::string();

    const auto last = str.find_last_not_of( " \t\r\n" );
    return str.substr( first, last - first + 1 );
}

std::string get_string( std::istringstream &ss )
{
    std::string value;
    std::getline( ss, value, ',' );
    return trim( value );
}

double get_double( std::istringstream &ss )
{
    std::string value;
    std::getline( ss, value, ',' );
    return std::stod( value );
}

int get_int( std::istringstream &ss )
{
    std::string value;
    std::getline( ss, value, ',' );
    return std::stoi( value );
}
