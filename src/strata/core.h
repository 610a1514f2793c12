#ifndef STRATA_CORE_H
#define STRATA_CORE_H

#include <strata/core/exception.h>
#include <strata/core/type_definitions.h>

#endif
