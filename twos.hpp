#ifndef TWOS_HPP
#define TWOS_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "errors.hpp"

// Widest rendering decimal_to_twos_complement will produce
#define MAX_BIT_SIZE 64

// Interprets a string of '0' and '1' as a two's-complement number
// whose width is the length of the string.
conv_error twos_complement_to_decimal(std::string const &binary, int32_t *decimal);

// Renders `decimal` as exactly `size` two's-complement bits.
// `size` must be between 1 and MAX_BIT_SIZE.
conv_error decimal_to_twos_complement(int32_t decimal, size_t size, std::string *binary);

bool fits_in_bits(int32_t decimal, size_t size);

#endif
