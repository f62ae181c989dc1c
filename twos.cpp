#include <stdint.h>
#include <limits.h>
#include <string>
#include "twos.hpp"

static bool is_binary(std::string const &s) {
	if (s.size() == 0) {
		return false;
	}

	for (size_t i = 0; i < s.size(); i++) {
		if (s[i] != '0' && s[i] != '1') {
			return false;
		}
	}

	return true;
}

static void invert(std::string &bits) {
	for (size_t i = 0; i < bits.size(); i++) {
		if (bits[i] == '0') {
			bits[i] = '1';
		} else {
			bits[i] = '0';
		}
	}
}

// Adds one at the width of `bits`; a carry out of the top bit is dropped.
static void add_one(std::string &bits) {
	for (size_t i = bits.size(); i > 0; i--) {
		if (bits[i - 1] == '1') {
			bits[i - 1] = '0';
		} else {
			bits[i - 1] = '1';
			return;
		}
	}
}

static std::string unsigned_binary(unsigned long long magnitude, size_t size) {
	std::string out(size, '0');

	for (size_t i = size; i > 0 && magnitude != 0; i--) {
		if (magnitude & 1) {
			out[i - 1] = '1';
		}
		magnitude >>= 1;
	}

	return out;
}

conv_error twos_complement_to_decimal(std::string const &binary, int32_t *decimal) {
	if (!is_binary(binary)) {
		return conv_error(conv_invalid_input);
	}

	bool negative = binary[0] == '1';
	std::string digits = binary;
	if (negative) {
		invert(digits);
	}

	unsigned long long magnitude = 0;
	for (size_t i = 0; i < digits.size(); i++) {
		magnitude = magnitude * 2 + (digits[i] - '0');

		if (magnitude > INT32_MAX) {
			return parse_error("number too large to fit in a 32-bit signed integer");
		}
	}

	if (negative) {
		*decimal = (int32_t) (-(long long) magnitude - 1);
	} else {
		*decimal = (int32_t) magnitude;
	}

	return conv_error();
}

bool fits_in_bits(int32_t decimal, size_t size) {
	if (size == 0) {
		return false;
	}

	// Every 32-bit value is representable once the width reaches 32
	if (size >= 32) {
		return true;
	}

	long long max_positive = (1LL << (size - 1)) - 1;
	long long min_negative = -(1LL << (size - 1));

	return decimal <= max_positive && decimal >= min_negative;
}

conv_error decimal_to_twos_complement(int32_t decimal, size_t size, std::string *binary) {
	if (size < 1 || size > MAX_BIT_SIZE) {
		return conv_error(conv_invalid_size, (double) size);
	}

	if (!fits_in_bits(decimal, size)) {
		return conv_error(conv_overflow);
	}

	if (decimal >= 0) {
		*binary = unsigned_binary(decimal, size);
		return conv_error();
	}

	std::string bits = unsigned_binary((unsigned long long) (-(long long) decimal), size);
	invert(bits);
	add_one(bits);

	*binary = bits;
	return conv_error();
}
