// Tree requests processed by the command line and R interfaces
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include "request.hpp"
#include "utility.hpp"

#include <sstream>
#include <stdexcept>

std::vector<STEM_REQUEST> read_requests( std::istream &in )
{
    std::vector<STEM_REQUEST> requests;

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
        STEM_REQUEST r;

        try {
            r.tree_id = get_string( ss );
            r.region = get_string( ss );
            r.spp = get_string( ss );
            r.dbh = get_double( ss );
            r.ht = get_double( ss );
            r.bark = get_int( ss );
            r.h = get_double( ss );
            r.d = get_double( ss );
            r.lower = get_double( ss );
            r.upper = get_double( ss );
        } catch( std::exception &e ) {
            throw std::invalid_argument( "Could not read tree record on line " + std::to_string( line_no ) + ": " + e.what() );
        }

        requests.emplace_back( r );
    }

    return requests;
}

STEM_RESULT estimate( const STEM_REQUEST &request, const COEFFICIENT_PROVIDER &provider, HEIGHT_EXPONENT mode )
{
    STEM stem( request.region, request.spp, request.dbh, request.ht, request.bark );
    stem.resolve( provider );

    STEM_RESULT result;
    result.dib = stem.dbh_inside_bark();
    result.d17 = stem.dia_at_girard();
    result.dia_at_h = stem.estimate_diameter( request.h );
    result.ht_at_d = stem.estimate_height( request.d, mode );
    result.volume = stem.estimate_volume( request.lower, request.upper );
    result.weight = stem.estimate_weight( request.lower, request.upper );

    return result;
}

int process_requests( const std::vector<STEM_REQUEST> &requests, const COEFFICIENT_PROVIDER &provider,
                      std::ostream &out, std::ostream &err )
{
    int skipped = 0;

    out << "tree_id, species, bark, dib, d17, dia_at_h, ht_at_d, volume, weight\n";

    for( auto &r : requests )
    {
        try {
            auto e = estimate( r, provider );
            out << r.tree_id << ", " << r.spp << ", " << r.bark << ", " << e.dib << ", " << e.d17 << ", " <<
                   e.dia_at_h << ", " << e.ht_at_d << ", " << e.volume << ", " << e.weight << "\n";
        } catch( std::exception &e ) {
            err << "Skipping tree " << r.tree_id << "\n" << e.what() << "\n";
            skipped++;
        }
    }

    return skipped;
}
