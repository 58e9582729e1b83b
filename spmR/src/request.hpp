// Tree requests processed by the command line and R interfaces
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "provider.hpp"
#include "stem.hpp"

struct STEM_REQUEST {
    std::string tree_id;
    std::string region = "deep south";
    std::string spp = "loblolly pine";
    double dbh = 16.0;      // inches
    double ht = 90.0;       // feet
    int bark = 1;           // 1 = inside bark, 0 = outside bark
    double h = 0.0;         // height for diameter estimate (feet)
    double d = 0.0;         // diameter for height estimate (inches)
    double lower = 0.0;     // volume interval (feet)
    double upper = 0.0;
};

struct STEM_RESULT {
    double dib;             // dbh inside bark
    double d17;             // diameter at Girard height
    double dia_at_h;
    double ht_at_d;
    double volume;          // cubic feet
    double weight;          // tons
};

// read tree requests from a csv stream with a header line:
// tree_id, region, species, dbh, ht, bark, h, d, lower, upper
// Throws std::invalid_argument naming the offending line.
std::vector<STEM_REQUEST> read_requests( std::istream &in );

// resolve and evaluate a single request, propagating any lookup or domain error
STEM_RESULT estimate( const STEM_REQUEST &request, const COEFFICIENT_PROVIDER &provider,
                      HEIGHT_EXPONENT mode = HEIGHT_EXPONENT::CORRECTED );

// evaluate each request and write csv results to out; failures are reported on err
// and the tree is skipped. Returns the number of trees skipped.
int process_requests( const std::vector<STEM_REQUEST> &requests, const COEFFICIENT_PROVIDER &provider,
                      std::ostream &out, std::ostream &err );

#endif
