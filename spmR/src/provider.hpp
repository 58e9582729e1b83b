// Coefficient providers
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#ifndef PROVIDER_HPP
#define PROVIDER_HPP

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <tuple>

#include "parameters.hpp"

// Resolves (region, species, bark) to coefficient groups.
// A missing row is reported as an empty optional, never as zeroed coefficients.
class COEFFICIENT_PROVIDER {
    public:
        virtual ~COEFFICIENT_PROVIDER() = default;

        virtual std::optional<REGRESSION_PARMS> find_regression( const std::string &region, const std::string &spp, BARK bark ) const = 0;
        virtual std::optional<SEGMENT_PARMS> find_segmentation( const std::string &spp, BARK bark ) const = 0;
        virtual std::optional<WEIGHT_PARMS> find_weight( const std::string &spp ) const = 0;
};

// In-memory coefficient table with exact string/integer matching
class TABLE_PROVIDER : public COEFFICIENT_PROVIDER {
    public:
        TABLE_PROVIDER() = default;

        // table populated with the compiled-in reference rows
        static TABLE_PROVIDER reference();

        void add_regression( const std::string &region, const std::string &spp, BARK bark, const REGRESSION_PARMS &parms );
        void add_segmentation( const std::string &spp, BARK bark, const SEGMENT_PARMS &parms );
        void add_weight( const std::string &spp, const WEIGHT_PARMS &parms );

        std::optional<REGRESSION_PARMS> find_regression( const std::string &region, const std::string &spp, BARK bark ) const override;
        std::optional<SEGMENT_PARMS> find_segmentation( const std::string &spp, BARK bark ) const override;
        std::optional<WEIGHT_PARMS> find_weight( const std::string &spp ) const override;

    private:
        std::map<std::tuple<std::string,std::string,int>, REGRESSION_PARMS> regression;
        std::map<std::tuple<std::string,int>, SEGMENT_PARMS> segmentation;
        std::map<std::string, WEIGHT_PARMS> weight;
};

// Read a coefficient table from a csv stream. The first line is a header; each record is
// tagged by its first field:
//      REG, region, species, bark, reg4_a, reg4_b, reg17_a, reg17_b
//      SEG, species, bark, butt_r, butt_c, butt_e, lstem_p, ustem_b, ustem_a
//      WT,  species, tons_per_cuft
// Throws std::invalid_argument for malformed records.
TABLE_PROVIDER load_coefficients( std::istream &in );

#endif
