// Implementation of stem class
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#include "stem.hpp"
#include "utility.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

// division that reports a zero denominator instead of producing inf or nan
static double divide( double num, double den, const char *term )
{
    if( den == 0.0 )
        throw DOMAIN_ERROR( std::string( "Division by zero in " ) + term );

    return num / den;
}

// invert x = y^n for the butt and lower stem height equations
static double invert_power( double base, double n, HEIGHT_EXPONENT mode, const char *term )
{
    if( mode == HEIGHT_EXPONENT::LEGACY )
        return divide( base, n, term );

    if( base < 0.0 )
    {
        std::ostringstream msg;
        msg << "Negative base (" << base << ") raised to 1/" << term;
        throw DOMAIN_ERROR( msg.str() );
    }

    return std::pow( base, divide( 1.0, n, term ) );
}

// STEM constructor
STEM::STEM( std::string region_t, std::string spp_t, double dbh_t, double ht_t, int bark_t ) :
    region( std::move( region_t ) ), spp( std::move( spp_t ) ), bark( bark_from_int( bark_t ) ), dbh( dbh_t ), ht( ht_t )
{
    validate_dimensions( dbh, ht );
}

void STEM::validate_dimensions( double dbh_t, double ht_t ) const
{
    if( !( dbh_t > 0.0 ) || !std::isfinite( dbh_t ) )
    {
        std::ostringstream msg;
        msg << "Invalid DBH (" << dbh_t << "), must be greater than 0";
        throw INVALID_DIMENSION( msg.str() );
    }

    // the lower and upper stem sections divide by ht - 17.3
    if( !( ht_t > GIRARD_HEIGHT ) || !std::isfinite( ht_t ) )
    {
        std::ostringstream msg;
        msg << "Invalid height (" << ht_t << "), must be greater than " << GIRARD_HEIGHT;
        throw INVALID_DIMENSION( msg.str() );
    }
}

void STEM::set_dimensions( double dbh_t, double ht_t )
{
    validate_dimensions( dbh_t, ht_t );
    dbh = dbh_t;
    ht = ht_t;
    compute_derived();
}

//////////////////////////////////////////////////////////////////////
//  Coefficients

void STEM::resolve( const COEFFICIENT_PROVIDER &provider )
{
    std::vector<std::string> missing;

    if( !reg_p )
    {
        reg_p = provider.find_regression( region, spp, bark );
        if( !reg_p )
            missing.emplace_back( "regression" );
    }

    if( !seg_p )
    {
        seg_p = provider.find_segmentation( spp, bark );
        if( !seg_p )
            missing.emplace_back( "segmentation" );
    }

    // weight falls back to DEFAULT_TONS_PER_CUFT when the species has no entry
    if( !_weight_found )
    {
        auto w = provider.find_weight( spp );
        _weight_found = w.has_value();
        wt_p = w ? *w : WEIGHT_PARMS{};
    }

    compute_derived();

    if( !missing.empty() )
    {
        std::string groups;
        for( auto &g : missing )
            groups += ( groups.empty() ? "" : ", " ) + g;

        throw LOOKUP_ERROR( "Could not retrieve " + groups + " coefficients for region \"" + region +
                            "\", species \"" + spp + "\", bark " + std::to_string( bark_to_int( bark ) ), missing );
    }
}

const REGRESSION_PARMS &STEM::get_regression() const
{
    if( !reg_p )
        throw UNRESOLVED_PARAMETERS( "Regression coefficients are required before calling this function" );

    return *reg_p;
}

const SEGMENT_PARMS &STEM::get_segmentation() const
{
    if( !seg_p )
        throw UNRESOLVED_PARAMETERS( "Segmented-profile coefficients are required before calling this function" );

    return *seg_p;
}

// Recompute cached dbh inside bark (Eq. 7) and diameter at 17.3 feet (Eq. 10)
void STEM::compute_derived()
{
    if( !reg_p )
        return;

    auto &r = *reg_p;
    _dib = round_to( r.reg4_a + r.reg4_b * dbh, 2 );
    _d17 = round_to( dbh * ( r.reg17_a + r.reg17_b * std::pow( GIRARD_HEIGHT / ht, 2.0 ) ), 2 );
}

double STEM::dbh_inside_bark() const
{
    get_regression();
    return _dib;
}

double STEM::dia_at_girard() const
{
    get_regression();
    return _d17;
}

// D in the profile equations: dbh inside bark for inside bark models, dbh otherwise
double STEM::profile_dbh() const
{
    double D = bark == BARK::INSIDE ? dbh_inside_bark() : dbh;
    if( D <= 0.0 )
    {
        std::ostringstream msg;
        msg << "Non-positive dbh inside bark (" << D << ") from regression coefficients";
        throw DOMAIN_ERROR( msg.str() );
    }

    return D;
}

STEM::PROFILE_TERMS STEM::profile_terms() const
{
    auto &s = get_segmentation();
    const double H = ht;

    PROFILE_TERMS t;
    t.D = profile_dbh();
    t.F = dia_at_girard();

    const double D2 = t.D * t.D;
    t.G = std::pow( 1.0 - BREAST_HEIGHT / H, s.butt_r );
    t.W = divide( s.butt_c + divide( s.butt_e, D2 * t.D, "e/D^3" ), 1.0 - t.G, "W = (c + e/D^3)/(1 - G)" );
    t.X = std::pow( 1.0 - BREAST_HEIGHT / H, s.lstem_p );
    t.Y = std::pow( 1.0 - GIRARD_HEIGHT / H, s.lstem_p );
    t.Z = divide( D2 - t.F * t.F, t.X - t.Y, "Z = (D^2 - F^2)/(X - Y)" );
    t.T = D2 - t.Z * t.X;

    return t;
}

//////////////////////////////////////////////////////////////////////
//  Estimators

// Stem diameter at height h (Eq. 1)
// At exactly 4.5 and 17.3 feet no section indicator is set and the result is 0.
double STEM::estimate_diameter( double h ) const
{
    auto &s = get_segmentation();
    const auto t = profile_terms();
    const double H = ht;

    if( !std::isfinite( h ) || h < 0.0 || h > H )
    {
        std::ostringstream msg;
        msg << "Invalid stem height (" << h << "), must be between 0 and " << H;
        throw INVALID_DIMENSION( msg.str() );
    }

    const double a = s.ustem_a;
    const double b = s.ustem_b;
    const double Hu = H - GIRARD_HEIGHT;

    // section indicators
    const int id_S = h < BREAST_HEIGHT ? 1 : 0;
    const int id_B = h > BREAST_HEIGHT && h < GIRARD_HEIGHT ? 1 : 0;
    const int id_T = h > GIRARD_HEIGHT ? 1 : 0;
    const int id_M = h < GIRARD_HEIGHT + a * Hu ? 1 : 0;

    double d1 = 0.0;
    double d2 = 0.0;
    double d3 = 0.0;

    if( id_S )
        d1 = t.D * t.D * ( 1.0 + t.W * ( std::pow( 1.0 - h / H, s.butt_r ) - t.G ) );

    if( id_B )
        d2 = t.D * t.D - t.Z * ( t.X - std::pow( 1.0 - h / H, s.lstem_p ) );

    if( id_T )
    {
        const double I = divide( h - GIRARD_HEIGHT, Hu, "(h - 17.3)/(H - 17.3)" );
        d3 = t.F * t.F * b * std::pow( I - 1.0, 2.0 );
        if( id_M )
            d3 += t.F * t.F * divide( 1.0 - b, a * a, "(1 - b)/a^2" ) * std::pow( a - I, 2.0 );
    }

    const double d_sq = d1 + d2 + d3;
    if( d_sq < 0.0 || !std::isfinite( d_sq ) )
    {
        std::ostringstream msg;
        msg << "Squared diameter (" << d_sq << ") at height " << h << " is not a non-negative number";
        throw DOMAIN_ERROR( msg.str() );
    }

    return round_to( std::sqrt( d_sq ), 2 );
}

// Stem height at diameter d (Eq. 2)
double STEM::estimate_height( double d, HEIGHT_EXPONENT mode ) const
{
    auto &s = get_segmentation();
    const auto t = profile_terms();
    const double H = ht;

    if( !std::isfinite( d ) || d < 0.0 )
    {
        std::ostringstream msg;
        msg << "Invalid stem diameter (" << d << "), must be a non-negative number";
        throw INVALID_DIMENSION( msg.str() );
    }

    const double a = s.ustem_a;
    const double b = s.ustem_b;
    const double d_sq = d * d;
    const double D_sq = t.D * t.D;
    const double F_sq = t.F * t.F;

    // section indicators
    const int id_S = d_sq >= D_sq ? 1 : 0;
    const int id_B = D_sq > d_sq && d_sq >= F_sq ? 1 : 0;
    const int id_T = F_sq > d_sq ? 1 : 0;
    const int id_M = d_sq > b * std::pow( a - 1.0, 2.0 ) * F_sq ? 1 : 0;

    double h1 = 0.0;
    double h2 = 0.0;
    double h3 = 0.0;

    if( id_S )
    {
        const double base = divide( d_sq / D_sq - 1.0, t.W, "W" ) + t.G;
        h1 = H * ( 1.0 - invert_power( base, s.butt_r, mode, "r" ) );
    }

    if( id_B )
    {
        const double base = t.X - divide( D_sq - d_sq, t.Z, "Z" );
        h2 = H * ( 1.0 - invert_power( base, s.lstem_p, mode, "p" ) );
    }

    if( id_T )
    {
        double Qa = b;
        double Qb = -2.0 * b;
        double Qc = b - divide( d_sq, F_sq, "d^2/F^2" );
        if( id_M )
        {
            Qa += divide( 1.0 - b, a * a, "(1 - b)/a^2" );
            Qb -= 2.0 * divide( 1.0 - b, a, "(1 - b)/a" );
            Qc += 1.0 - b;
        }

        const double disc = Qb * Qb - 4.0 * Qa * Qc;
        if( disc < 0.0 )
        {
            std::ostringstream msg;
            msg << "Negative discriminant (" << disc << ") solving upper stem height for diameter " << d;
            throw DOMAIN_ERROR( msg.str() );
        }

        h3 = GIRARD_HEIGHT + ( H - GIRARD_HEIGHT ) * divide( -Qb - std::sqrt( disc ), 2.0 * Qa, "2Qa" );
    }

    // diameters above the butt diameter at ground level invert to heights below 0
    const double height = round_to( h1 + h2 + h3, 2 );
    if( !std::isfinite( height ) || height < 0.0 || height > H )
    {
        std::ostringstream msg;
        msg << "Diameter " << d << " is outside the stem profile, height (" << height
            << ") not between 0 and " << H;
        throw DOMAIN_ERROR( msg.str() );
    }

    return height;
}

// Stem volume (cubic feet) between lower and upper heights (Eq. 3)
double STEM::estimate_volume( double lower, double upper ) const
{
    auto &s = get_segmentation();
    const auto t = profile_terms();
    const double H = ht;

    if( !std::isfinite( lower ) || !std::isfinite( upper ) || lower < 0.0 || upper < lower )
    {
        std::ostringstream msg;
        msg << "Invalid volume interval (" << lower << ", " << upper << ")";
        throw INVALID_DIMENSION( msg.str() );
    }

    const double a = s.ustem_a;
    const double b = s.ustem_b;
    const double r = s.butt_r;
    const double p = s.lstem_p;
    const double Hu = H - GIRARD_HEIGHT;

    // section limits
    const double L1 = std::max( lower, 0.0 );
    const double U1 = std::min( upper, BREAST_HEIGHT );
    const double L2 = std::max( lower, BREAST_HEIGHT );
    const double U2 = std::min( upper, GIRARD_HEIGHT );
    const double L3 = std::max( lower, GIRARD_HEIGHT );
    const double U3 = std::min( upper, H );

    // indicator variables
    const int i1 = lower < BREAST_HEIGHT ? 1 : 0;
    const int i2 = lower < GIRARD_HEIGHT ? 1 : 0;
    const int i3 = upper > BREAST_HEIGHT ? 1 : 0;
    const int i4 = upper > GIRARD_HEIGHT && lower < H ? 1 : 0;
    const int i5 = ( L3 - GIRARD_HEIGHT ) < a * Hu ? 1 : 0;
    const int i6 = ( U3 - GIRARD_HEIGHT ) < a * Hu ? 1 : 0;

    double v1 = 0.0;
    double v2 = 0.0;
    double v3 = 0.0;

    if( i1 )
        v1 = t.D * t.D * ( ( 1.0 - t.G * t.W ) * ( U1 - L1 ) +
                           t.W * divide( std::pow( 1.0 - L1 / H, r ) * ( H - L1 ) - std::pow( 1.0 - U1 / H, r ) * ( H - U1 ), r + 1.0, "r + 1" ) );

    if( i2 && i3 )
        v2 = t.T * ( U2 - L2 ) +
             t.Z * divide( std::pow( 1.0 - L2 / H, p ) * ( H - L2 ) - std::pow( 1.0 - U2 / H, p ) * ( H - U2 ), p + 1.0, "p + 1" );

    if( i4 )
    {
        const double Hu_sq = divide( 1.0, Hu * Hu, "1/(H - 17.3)^2" );
        const double lo = L3 - GIRARD_HEIGHT;
        const double up = U3 - GIRARD_HEIGHT;
        v3 = b * ( U3 - L3 ) - b * ( up * up - lo * lo ) / Hu +
             ( b / 3.0 ) * ( std::pow( up, 3.0 ) - std::pow( lo, 3.0 ) ) * Hu_sq;

        // merge point term, zero above a(H - 17.3)
        if( i5 || i6 )
        {
            const double m = ( 1.0 / 3.0 ) * divide( 1.0 - b, a * a, "(1 - b)/a^2" );
            v3 += i5 * m * std::pow( a * Hu - lo, 3.0 ) * Hu_sq -
                  i6 * m * std::pow( a * Hu - up, 3.0 ) * Hu_sq;
        }

        v3 *= t.F * t.F;
    }

    return round_to( CUFT_FACTOR * ( v1 + v2 + v3 ), 0 );
}

// Stem weight (tons) between lower and upper heights
double STEM::estimate_weight( double lower, double upper ) const
{
    return round_to( estimate_volume( lower, upper ) * wt_p.tons_per_cuft, 2 );
}

std::string STEM::describe() const
{
    std::ostringstream os;
    os << "< STEM(region=\"" << region << "\", spp=\"" << spp << "\", dbh=" << dbh << ", ht=" << ht
       << ", bark=" << bark_to_int( bark );

    if( reg_p )
        os << ", reg={reg4_a=" << reg_p->reg4_a << ", reg4_b=" << reg_p->reg4_b
           << ", reg17_a=" << reg_p->reg17_a << ", reg17_b=" << reg_p->reg17_b << "}";
    else
        os << ", reg=None";

    if( seg_p )
        os << ", seg={butt_r=" << seg_p->butt_r << ", butt_c=" << seg_p->butt_c << ", butt_e=" << seg_p->butt_e
           << ", lstem_p=" << seg_p->lstem_p << ", ustem_b=" << seg_p->ustem_b << ", ustem_a=" << seg_p->ustem_a << "}";
    else
        os << ", seg=None";

    os << ", tons_per_cuft=" << wt_p.tons_per_cuft << ")";
    return os.str();
}

std::ostream &operator<<( std::ostream &os, const STEM &stem )
{
    return os << stem.describe();
}
