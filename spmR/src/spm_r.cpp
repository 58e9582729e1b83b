// Interface between the segmented stem profile model and R
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include <Rcpp.h>

#include <string>
#include "request.hpp"

//' stem_profile() : estimate stem diameter, height, volume and weight with the Clark et al. segmented profile equations.
//'
//' @param region     : String  | Region, key into regression coefficients (e.g. 'deep south')
//' @param species    : String  | Species common name (e.g. 'loblolly pine')
//' @param dbh        : Numeric | diameter at breast height outside bark (inches)
//' @param ht         : Numeric | total height (feet), must exceed 17.3
//' @param bark       : Integer | 1 = inside bark, 0 = outside bark
//' @param h          : Numeric | height for the diameter estimate (feet)
//' @param d          : Numeric | diameter for the height estimate (inches)
//' @param lower      : Numeric | lower height of the volume interval (feet)
//' @param upper      : Numeric | upper height of the volume interval (feet)
//' @param legacy     : Integer | 1 = reproduce the x^1/r height inversion of earlier releases
//' @md
//'
//' @description
//' Evaluates each tree with the built-in coefficient table. Trees whose coefficients are
//' missing or whose estimates fall outside the domain of the equations are returned as NA
//' and the reason is written to the R error stream.
//'
//' @return
//' Returns a data.frame with the following variables:
//' \itemize{
//'     \item dib
//'     \item d17
//'     \item dia.at.h
//'     \item ht.at.d
//'     \item volume
//'     \item weight
//' }
//'
//' @export
// [[Rcpp::export]]
Rcpp::DataFrame stem_profile(
    Rcpp::StringVector   region,
    Rcpp::StringVector   species,
    Rcpp::NumericVector  dbh,
    Rcpp::NumericVector  ht,
    Rcpp::IntegerVector  bark,
    Rcpp::NumericVector  h,
    Rcpp::NumericVector  d,
    Rcpp::NumericVector  lower,
    Rcpp::NumericVector  upper,
    int                  legacy = 0 )
{
    auto n = dbh.size();

    // perform sanity checks (all tree vectors must be the same size and greater than 0)
    if( !( n > 0                    &&
           region.size() == n       &&
           species.size() == n      &&
           ht.size() == n           &&
           bark.size() == n         &&
           h.size() == n            &&
           d.size() == n            &&
           lower.size() == n        &&
           upper.size() == n ) )
    {
        Rcpp::stop( "stem_profile(): all tree vectors must have the same, non-zero length" );
    }

    std::streambuf* stderrbuf = std::cerr.rdbuf(Rcpp::Rcerr.rdbuf());

    const auto coefficients = TABLE_PROVIDER::reference();
    const auto mode = legacy == 1 ? HEIGHT_EXPONENT::LEGACY : HEIGHT_EXPONENT::CORRECTED;

    Rcpp::NumericVector gdib(n, NA_REAL);
    Rcpp::NumericVector gd17(n, NA_REAL);
    Rcpp::NumericVector gdia(n, NA_REAL);
    Rcpp::NumericVector ght(n, NA_REAL);
    Rcpp::NumericVector gvol(n, NA_REAL);
    Rcpp::NumericVector gwt(n, NA_REAL);

    for( R_xlen_t i = 0; i < n; i++ )
    {
        STEM_REQUEST r;
        r.tree_id = std::to_string( i + 1 );
        r.region = Rcpp::as<std::string>( region[i] );
        r.spp = Rcpp::as<std::string>( species[i] );
        r.dbh = dbh[i];
        r.ht = ht[i];
        r.bark = bark[i];
        r.h = h[i];
        r.d = d[i];
        r.lower = lower[i];
        r.upper = upper[i];

        try {
            auto e = estimate( r, coefficients, mode );
            gdib[i] = e.dib;
            gd17[i] = e.d17;
            gdia[i] = e.dia_at_h;
            ght[i] = e.ht_at_d;
            gvol[i] = e.volume;
            gwt[i] = e.weight;
        } catch( std::exception &e ) {
            std::cerr << "Exception in stem_profile() for tree " << r.tree_id << "\n" << e.what() << "\n";
        }
    }

    std::cerr.rdbuf(stderrbuf);

    return Rcpp::DataFrame::create(
        Rcpp::Named("dib") = gdib,
        Rcpp::Named("d17") = gd17,
        Rcpp::Named("dia.at.h") = gdia,
        Rcpp::Named("ht.at.d") = ght,
        Rcpp::Named("volume") = gvol,
        Rcpp::Named("weight") = gwt );
}
