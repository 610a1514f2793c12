#ifndef STRATA_UTILITIES_TEXT_H
#define STRATA_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <strata/core/exception.h>

namespace strata {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
STRATA_DEFINE_EXCEPTION(parsing_error)
STRATA_DEFINE_ERROR_INFO(string, expected_format)
STRATA_DEFINE_ERROR_INFO(string, parsed_text)
STRATA_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace strata

#endif
