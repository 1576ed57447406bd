//
// Convenience header that includes all optval components.
//

#ifndef OPTVAL_ALL_H
#define OPTVAL_ALL_H

#include <optval/util/date_time.h>
#include <optval/util/errors.h>
#include <optval/types/scalar_types.h>
#include <optval/types/optional.h>
#include <optval/types/optional_catalog.h>
#include <optval/types/any_value.h>
#include <optval/types/any_optional.h>

#endif // OPTVAL_ALL_H
