// Exceptions raised by the stem profile model
//
// G.P. Johnson
// Greg Johnson Biometrics LLC
// (c) 2024
//

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// mathematical domain violation: zero denominator, negative radicand or discriminant
class DOMAIN_ERROR : public std::domain_error {
    public:
        explicit DOMAIN_ERROR( const std::string &what ) : std::domain_error( what ) {};
};

// invalid tree dimension, bark indicator or query argument
class INVALID_DIMENSION : public DOMAIN_ERROR {
    public:
        explicit INVALID_DIMENSION( const std::string &what ) : DOMAIN_ERROR( what ) {};
};

// one or more coefficient groups were not found by the provider
class LOOKUP_ERROR : public std::runtime_error {
    public:
        LOOKUP_ERROR( const std::string &what, std::vector<std::string> missing_t ) :
            std::runtime_error( what ), _missing( std::move( missing_t ) ) {};

        const std::vector<std::string> &missing() const { return _missing; };

    private:
        std::vector<std::string> _missing;
};

// an estimator was called before the coefficient group it needs was resolved
class UNRESOLVED_PARAMETERS : public std::logic_error {
    public:
        explicit UNRESOLVED_PARAMETERS( const std::string &what ) : std::logic_error( what ) {};
};

#endif
