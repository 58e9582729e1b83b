// Coefficient provider reading a segmented profile database through OTL/ODBC
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include "otl_provider.hpp"

std::optional<REGRESSION_PARMS> OTL_PROVIDER::find_regression( const std::string &region, const std::string &spp, BARK bark ) const
{
	otl_stream i( 1, "select REG4_A, REG4_B, REG17_A, REG17_B FROM regcoeff "
	                 "where REGION = :region<char[51]> and SPP = :spp<char[51]> and BARK = :bark<int>", db );

	i << region.c_str() << spp.c_str() << bark_to_int( bark );
	if( i.eof() )
		return std::nullopt;

	REGRESSION_PARMS p;
	i >> p.reg4_a >> p.reg4_b >> p.reg17_a >> p.reg17_b;
	return p;
}

std::optional<SEGMENT_PARMS> OTL_PROVIDER::find_segmentation( const std::string &spp, BARK bark ) const
{
	otl_stream i( 1, "select BUTT_R, BUTT_C, BUTT_E, LSTEM_P, USTEM_B, USTEM_A FROM segcoeff "
	                 "where SPP = :spp<char[51]> and BARK = :bark<int>", db );

	i << spp.c_str() << bark_to_int( bark );
	if( i.eof() )
		return std::nullopt;

	SEGMENT_PARMS p;
	i >> p.butt_r >> p.butt_c >> p.butt_e >> p.lstem_p >> p.ustem_b >> p.ustem_a;
	return p;
}

std::optional<WEIGHT_PARMS> OTL_PROVIDER::find_weight( const std::string &spp ) const
{
	otl_stream i( 1, "select TONS_PER_CUFT FROM wtcoeff where SPP = :spp<char[51]>", db );

	i << spp.c_str();
	if( i.eof() )
		return std::nullopt;

	WEIGHT_PARMS p;
	i >> p.tons_per_cuft;
	return p;
}
