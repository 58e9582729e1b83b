// Coefficient provider reading a segmented profile database through OTL/ODBC
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#ifndef OTL_PROVIDER_HPP
#define OTL_PROVIDER_HPP

#define OTL_ODBC      // Compile OTL 4.0/ODBC
#define OTL_CPP_20_ON
#define OTL_ODBC_LEGACY_RPC
#ifndef __linux__
	#define OTL_STRCAT_S(dest, dest_sz, src) strcat_s(dest, dest_sz, src)
	#define OTL_STRCPY_S(dest, dest_sz, src) strcpy_s(dest, dest_sz, src)
	#define OTL_STRNCPY_S(dest, dest_sz, src, count) strncpy_s(dest, dest_sz, src, count)
	#define OTL_SPRINTF_S sprintf_s
#else
	#define OTL_ODBC_UNIX // uncomment this line if UnixODBC is used
#endif

#include "otlv4.h"    // include the OTL 4.0 header file

#include "provider.hpp"

// Tables:
//      regcoeff( region, spp, bark, reg4_a, reg4_b, reg17_a, reg17_b )
//      segcoeff( spp, bark, butt_r, butt_c, butt_e, lstem_p, ustem_b, ustem_a )
//      wtcoeff( spp, tons_per_cuft )
// A query returning no row is a miss; otl_exception is left to the caller.
class OTL_PROVIDER : public COEFFICIENT_PROVIDER {
    public:
        explicit OTL_PROVIDER( otl_connect &db_t ) : db( db_t ) {};

        std::optional<REGRESSION_PARMS> find_regression( const std::string &region, const std::string &spp, BARK bark ) const override;
        std::optional<SEGMENT_PARMS> find_segmentation( const std::string &spp, BARK bark ) const override;
        std::optional<WEIGHT_PARMS> find_weight( const std::string &spp ) const override;

    private:
        otl_connect &db;
};

#endif
