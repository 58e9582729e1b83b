// Coefficient providers
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include "provider.hpp"
#include "utility.hpp"

#include <sstream>
#include <stdexcept>

TABLE_PROVIDER TABLE_PROVIDER::reference()
{
    TABLE_PROVIDER table;

    for( auto &row : reference_regression_parms )
        table.add_regression( row.region, row.spp, bark_from_int( row.bark ), row.parms );

    for( auto &row : reference_segment_parms )
        table.add_segmentation( row.spp, bark_from_int( row.bark ), row.parms );

    for( auto &row : reference_weight_parms )
        table.add_weight( row.spp, row.parms );

    return table;
}

void TABLE_PROVIDER::add_regression( const std::string &region, const std::string &spp, BARK bark, const REGRESSION_PARMS &parms )
{
    regression[std::make_tuple( region, spp, bark_to_int( bark ) )] = parms;
}

void TABLE_PROVIDER::add_segmentation( const std::string &spp, BARK bark, const SEGMENT_PARMS &parms )
{
    segmentation[std::make_tuple( spp, bark_to_int( bark ) )] = parms;
}

void TABLE_PROVIDER::add_weight( const std::string &spp, const WEIGHT_PARMS &parms )
{
    weight[spp] = parms;
}

std::optional<REGRESSION_PARMS> TABLE_PROVIDER::find_regression( const std::string &region, const std::string &spp, BARK bark ) const
{
    auto it = regression.find( std::make_tuple( region, spp, bark_to_int( bark ) ) );
    if( it == regression.end() )
        return std::nullopt;

    return it->second;
}

std::optional<SEGMENT_PARMS> TABLE_PROVIDER::find_segmentation( const std::string &spp, BARK bark ) const
{
    auto it = segmentation.find( std::make_tuple( spp, bark_to_int( bark ) ) );
    if( it == segmentation.end() )
        return std::nullopt;

    return it->second;
}

std::optional<WEIGHT_PARMS> TABLE_PROVIDER::find_weight( const std::string &spp ) const
{
    auto it = weight.find( spp );
    if( it == weight.end() )
        return std::nullopt;

    return it->second;
}

TABLE_PROVIDER load_coefficients( std::istream &in )
{
    TABLE_PROVIDER table;

    // skip header record
    std::string line;
    std::getline( in, line );

    int line_no = 1;
    while( std::getline( in, line ) )
    {
        line_no++;
        if( trim( line ).empty() )
            continue;

        std::istringstream ss( line );
        std::string record = get_string( ss );

        try {
            if( record == "REG" )
            {
                std::string region = get_string( ss );
                std::string spp = get_string( ss );
                BARK bark = bark_from_int( get_int( ss ) );
                REGRESSION_PARMS p;
                p.reg4_a = get_double( ss );
                p.reg4_b = get_double( ss );
                p.reg17_a = get_double( ss );
                p.reg17_b = get_double( ss );
                table.add_regression( region, spp, bark, p );
            } else if( record == "SEG" ) {
                std::string spp = get_string( ss );
                BARK bark = bark_from_int( get_int( ss ) );
                SEGMENT_PARMS p;
                p.butt_r = get_double( ss );
                p.butt_c = get_double( ss );
                p.butt_e = get_double( ss );
                p.lstem_p = get_double( ss );
                p.ustem_b = get_double( ss );
                p.ustem_a = get_double( ss );
                table.add_segmentation( spp, bark, p );
            } else if( record == "WT" ) {
                std::string spp = get_string( ss );
                WEIGHT_PARMS p;
                p.tons_per_cuft = get_double( ss );
                table.add_weight( spp, p );
            } else {
                throw std::invalid_argument( "unknown record type '" + record + "'" );
            }
        } catch( std::exception &e ) {
            throw std::invalid_argument( "Malformed coefficient record on line " + std::to_string( line_no ) + ": " + e.what() );
        }
    }

    return table;
}
