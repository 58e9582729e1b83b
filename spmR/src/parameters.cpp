// Parameter data
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include "parameters.hpp"
#include "errors.hpp"

BARK bark_from_int( int bark )
{
    switch( bark ) {
        case 0: return BARK::OUTSIDE;
        case 1: return BARK::INSIDE;
    };

    throw INVALID_DIMENSION( "Invalid bark indicator (" + std::to_string( bark ) + "), expected 0 (outside) or 1 (inside)" );
}

int bark_to_int( BARK bark )
{
    return static_cast<int>( bark );
}

//                                  region        species         bark  reg4_a  reg4_b  reg17_a reg17_b
const std::vector<REGRESSION_ROW> reference_regression_parms = {
    { "deep south", "loblolly pine", 1, { -0.47, 0.91, 0.80, 0.59 } },
    { "deep south", "loblolly pine", 0, { -0.47, 0.91, 0.86, 0.52 } }
};

//                                species         bark  butt_r butt_c butt_e  lstem_p ustem_b ustem_a
const std::vector<SEGMENT_ROW> reference_segment_parms = {
    { "loblolly pine", 1, { 31.0, 0.2, 100.0, 6.5, 2.1113, 0.62 } },
    { "loblolly pine", 0, { 38.0, 0.3, 150.0, 7.2, 1.9,    0.6  } }
};

//                               species         tons/ft3
const std::vector<WEIGHT_ROW> reference_weight_parms = {
    { "loblolly pine", { 0.0275 } }
};
