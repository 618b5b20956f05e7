/**
 * @file array.cpp
 * @brief Array decoder compilation unit.
 *
 * read_fixed_array() and read_var_array() are parameterized by the
 * element type, so they live entirely in array.hpp. This unit includes
 * the header so it is compiled in isolation as part of the library.
 *
 * @see include/xdrin/array.hpp
 */

#include <xdrin/array.hpp>
