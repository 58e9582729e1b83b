// Definition of stem class
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//
// Segmented stem profile, height, and volume equations from
// Clark, A. III, et al. Stem Profile Equations for Southern Tree Species
//

#ifndef STEM_HPP
#define STEM_HPP

#include <iostream>
#include <optional>
#include <string>

#include "errors.hpp"
#include "parameters.hpp"
#include "provider.hpp"

// exponent used when inverting the butt and lower stem sections
enum class HEIGHT_EXPONENT {
    CORRECTED = 0,  // x^(1/r)
    LEGACY    = 1   // x^1/r, as parsed by earlier releases
};

class STEM {
    public:
        STEM( std::string region_t = "deep south", std::string spp_t = "loblolly pine",
              double dbh_t = 16.0, double ht_t = 90.0, int bark_t = 1 );
        ~STEM() = default;

        // fetch coefficients; groups already resolved are kept, missing groups are retried.
        // Throws LOOKUP_ERROR naming the groups still missing.
        void resolve( const COEFFICIENT_PROVIDER &provider );

        // change tree dimensions and recompute derived diameters
        void set_dimensions( double dbh_t, double ht_t );

        // accessor functions
        const std::string &get_region() const { return region; };
        const std::string &get_spp() const { return spp; };
        BARK get_bark() const { return bark; };
        double get_dbh() const { return dbh; };
        double get_ht() const { return ht; };
        bool has_regression() const { return reg_p.has_value(); };
        bool has_segmentation() const { return seg_p.has_value(); };
        bool is_resolved() const { return has_regression() && has_segmentation(); };

        const REGRESSION_PARMS &get_regression() const;
        const SEGMENT_PARMS &get_segmentation() const;
        const WEIGHT_PARMS &get_weight() const { return wt_p; };

        // derived diameters, require regression coefficients
        double dbh_inside_bark() const;
        double dia_at_girard() const;

        // estimators, require regression and segmentation coefficients
        double estimate_diameter( double h ) const;
        double estimate_height( double d, HEIGHT_EXPONENT mode = HEIGHT_EXPONENT::CORRECTED ) const;
        double estimate_volume( double lower, double upper ) const;
        double estimate_weight( double lower, double upper ) const;

        std::string describe() const;

    private:
        // descriptors are fixed at construction, coefficients are keyed to them
        std::string region;     // geographic region, key into regression coefficients
        std::string spp;        // species common name
        BARK bark;              // diameters reported inside or outside bark
        double dbh;             // diameter at breast height outside bark (inches)
        double ht;              // total height (feet)

        std::optional<REGRESSION_PARMS> reg_p;
        std::optional<SEGMENT_PARMS> seg_p;
        WEIGHT_PARMS wt_p;
        bool _weight_found = false;

        // cached derived diameters, valid while reg_p is present
        double _dib = 0.0;
        double _d17 = 0.0;

        void validate_dimensions( double dbh_t, double ht_t ) const;
        void compute_derived();

        // combined terms shared by the height and volume equations
        struct PROFILE_TERMS {
            double D;
            double F;
            double G;
            double W;
            double X;
            double Y;
            double Z;
            double T;
        };
        PROFILE_TERMS profile_terms() const;
        double profile_dbh() const;
};

std::ostream &operator<<( std::ostream &os, const STEM &stem );

#endif
