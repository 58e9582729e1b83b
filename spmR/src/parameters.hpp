// Parameter data structures
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <string>
#include <vector>

constexpr double BREAST_HEIGHT = 4.5;       // feet
constexpr double GIRARD_HEIGHT = 17.3;      // feet
constexpr double CUFT_FACTOR = 0.005454154; // pi/576, inches squared x feet to cubic feet
constexpr double DEFAULT_TONS_PER_CUFT = 0.022;

enum class BARK {
    OUTSIDE = 0,
    INSIDE = 1
};

// convert an integer bark code, throws INVALID_DIMENSION for anything but 0 or 1
BARK bark_from_int( int bark );
int bark_to_int( BARK bark );

// dbh inside bark (Eq. 7) and diameter at Girard height (Eq. 10) regressions
struct REGRESSION_PARMS {
    double reg4_a;
    double reg4_b;
    double reg17_a;
    double reg17_b;
};

// segmented profile coefficients (Eq. 1)
struct SEGMENT_PARMS {
    double butt_r;
    double butt_c;
    double butt_e;
    double lstem_p;
    double ustem_b;
    double ustem_a;
};

struct WEIGHT_PARMS {
    double tons_per_cuft = DEFAULT_TONS_PER_CUFT;
};

struct REGRESSION_ROW {
    std::string region;
    std::string spp;
    int bark;
    REGRESSION_PARMS parms;
};

struct SEGMENT_ROW {
    std::string spp;
    int bark;
    SEGMENT_PARMS parms;
};

struct WEIGHT_ROW {
    std::string spp;
    WEIGHT_PARMS parms;
};

extern const std::vector<REGRESSION_ROW> reference_regression_parms;
extern const std::vector<SEGMENT_ROW> reference_segment_parms;
extern const std::vector<WEIGHT_ROW> reference_weight_parms;

#endif
