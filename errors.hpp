#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>

enum conv_error_type {
	conv_ok,
	conv_invalid_input,
	conv_parse_error,
	conv_invalid_size,
	conv_overflow,
	conv_invalid_latitude,
	conv_invalid_longitude,
	conv_calculation_error,
};

// The outcome of a conversion. Which payload field is meaningful
// depends on the type: `value` for the coordinate range errors and
// the rejected width of an invalid size, `detail` for parse and
// calculation errors.
struct conv_error {
	conv_error_type type = conv_ok;
	double value = 0;
	std::string detail = "";

	conv_error() {
	}

	conv_error(conv_error_type t)
	    : type(t) {
	}

	conv_error(conv_error_type t, double v)
	    : type(t),
	      value(v) {
	}

	conv_error(conv_error_type t, std::string const &d)
	    : type(t),
	      detail(d) {
	}

	bool ok() const {
		return type == conv_ok;
	}

	bool operator==(conv_error const &o) const;
	bool operator!=(conv_error const &o) const {
		return !(*this == o);
	}

	std::string message() const;
	const char *name() const;
};

conv_error parse_error(std::string const &cause);
conv_error invalid_latitude(double latitude);
conv_error invalid_longitude(double longitude);
conv_error calculation_error(std::string const &message);

#endif
