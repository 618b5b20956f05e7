/**
 * @file composite.cpp
 * @brief Composite decoder compilation unit.
 *
 * The struct, enum, union and optional-data helpers are templates and
 * live entirely in composite.hpp. This unit includes the header so it
 * is compiled in isolation as part of the library.
 *
 * @see include/xdrin/composite.hpp
 */

#include <xdrin/composite.hpp>
