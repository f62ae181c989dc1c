#include <stdio.h>
#include <string>
#include "present.hpp"
#include "twos.hpp"

std::string format_fixed(double d, int precision) {
	char buf[400];
	snprintf(buf, sizeof(buf), "%.*f", precision, d);
	return buf;
}

// The error message if there was one, otherwise `text`
std::string display(conv_error const &err, std::string const &text) {
	if (!err.ok()) {
		return err.message();
	}

	return text;
}

std::string present_twos_complement_to_decimal(std::string const &binary) {
	int32_t decimal = 0;
	conv_error err = twos_complement_to_decimal(binary, &decimal);
	return display(err, std::to_string(decimal));
}

std::string present_decimal_to_twos_complement(int32_t decimal, size_t size) {
	std::string binary;
	conv_error err = decimal_to_twos_complement(decimal, size, &binary);
	return display(err, binary);
}

std::string present_cartesian(cartesian const &c, int precision) {
	return format_fixed(c.x, precision) + " " + format_fixed(c.y, precision) + " " + format_fixed(c.z, precision);
}

std::string present_geodetic_to_cartesian(double lat, double lon, double height, int precision) {
	cartesian c;
	conv_error err = geodetic_to_cartesian_checked(lat, lon, height, &c);
	return display(err, present_cartesian(c, precision));
}

std::string present_utm_locator(utm_locator const &loc) {
	return "UTM Zone: " + loc.toString();
}

std::string present_utm_zone(double lat, double lon) {
	utm_locator loc;
	conv_error err = utm_zone_for(lat, lon, &loc);
	if (!err.ok()) {
		return err.message();
	}

	return present_utm_locator(loc);
}
