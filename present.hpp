#ifndef PRESENT_HPP
#define PRESENT_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "projection.hpp"

// Display strings for the conversions. Success and failure both come back
// as plain text, so anything that needs to tell them apart should call
// the typed functions instead.

std::string present_twos_complement_to_decimal(std::string const &binary);
std::string present_decimal_to_twos_complement(int32_t decimal, size_t size);
std::string present_cartesian(cartesian const &c, int precision);
std::string present_geodetic_to_cartesian(double lat, double lon, double height, int precision);
std::string present_utm_locator(utm_locator const &loc);
std::string present_utm_zone(double lat, double lon);

std::string display(conv_error const &err, std::string const &text);
std::string format_fixed(double d, int precision);

#endif
