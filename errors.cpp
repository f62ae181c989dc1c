#include <stdio.h>
#include <math.h>
#include <string>
#include "errors.hpp"
#include "twos.hpp"

static std::string format_degrees(double d) {
	char buf[50];
	snprintf(buf, sizeof(buf), "%g", d);
	return buf;
}

bool conv_error::operator==(conv_error const &o) const {
	if (type != o.type) {
		return false;
	}

	switch (type) {
	case conv_ok:
	case conv_invalid_input:
	case conv_invalid_size:
	case conv_overflow:
		return true;

	case conv_parse_error:
	case conv_calculation_error:
		return detail == o.detail;

	case conv_invalid_latitude:
	case conv_invalid_longitude:
		// A rejected NaN still has to compare equal to itself
		return value == o.value || (isnan(value) && isnan(o.value));
	}

	return false;
}

std::string conv_error::message() const {
	switch (type) {
	case conv_ok:
		return "";

	case conv_invalid_input:
		return "Invalid input: Enter only 0s and 1s.";

	case conv_parse_error:
		return "Error: Failed to parse binary value: " + detail;

	case conv_invalid_size:
		if (value < 1) {
			return "Error: Size must be greater than 0.";
		}
		return "Error: Size must be at most " + std::to_string(MAX_BIT_SIZE) + ".";

	case conv_overflow:
		return "Error: Number does not fit in the specified size.";

	case conv_invalid_latitude:
		return "Error: Latitude " + format_degrees(value) + " is out of range";

	case conv_invalid_longitude:
		return "Error: Longitude " + format_degrees(value) + " is out of range";

	case conv_calculation_error:
		return "Error: " + detail;
	}

	return "Error: unknown error";
}

const char *conv_error::name() const {
	switch (type) {
	case conv_ok:
		return "ok";
	case conv_invalid_input:
		return "invalid_input";
	case conv_parse_error:
		return "parse_error";
	case conv_invalid_size:
		return "invalid_size";
	case conv_overflow:
		return "overflow";
	case conv_invalid_latitude:
		return "invalid_latitude";
	case conv_invalid_longitude:
		return "invalid_longitude";
	case conv_calculation_error:
		return "calculation_error";
	}

	return "unknown";
}

conv_error parse_error(std::string const &cause) {
	return conv_error(conv_parse_error, cause);
}

conv_error invalid_latitude(double latitude) {
	return conv_error(conv_invalid_latitude, latitude);
}

conv_error invalid_longitude(double longitude) {
	return conv_error(conv_invalid_longitude, longitude);
}

conv_error calculation_error(std::string const &message) {
	return conv_error(conv_calculation_error, message);
}
