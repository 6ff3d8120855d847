#ifndef CACHET_CORE_H
#define CACHET_CORE_H

#include <cachet/core/dynamic.hpp>
#include <cachet/core/exception.hpp>
#include <cachet/core/type_definitions.hpp>
#include <cachet/core/utilities.hpp>

#endif
