#ifndef STRATA_UTILITIES_ERRORS_H
#define STRATA_UTILITIES_ERRORS_H

#include <strata/core/exception.h>

namespace strata {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
STRATA_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
STRATA_DEFINE_EXCEPTION(internal_check_failed)

} // namespace strata

#endif
