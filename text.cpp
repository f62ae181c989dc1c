#include "text.hpp"
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <ctype.h>
#include <limits.h>
#include <math.h>

std::string trim(std::string const &s) {
	size_t start = 0;
	while (start < s.size() && isspace((unsigned char) s[start])) {
		start++;
	}

	size_t end = s.size();
	while (end > start && isspace((unsigned char) s[end - 1])) {
		end--;
	}

	return std::string(s, start, end - start);
}

std::vector<std::string> split_words(std::string const &s) {
	std::vector<std::string> out;
	size_t i = 0;

	while (i < s.size()) {
		while (i < s.size() && isspace((unsigned char) s[i])) {
			i++;
		}

		size_t start = i;
		while (i < s.size() && !isspace((unsigned char) s[i])) {
			i++;
		}

		if (i > start) {
			out.push_back(std::string(s, start, i - start));
		}
	}

	return out;
}

/**
 * Parses a base-10 integer, allowing surrounding whitespace.
 * Returns false, leaving `out` untouched, if any other text
 * is present or the value is outside the 32-bit range.
 */
bool parse_int32(std::string const &s, int32_t *out) {
	std::string t = trim(s);
	if (t.size() == 0) {
		return false;
	}

	char *err = NULL;
	errno = 0;
	long long ret = strtoll(t.c_str(), &err, 10);
	if (*err != '\0' || errno == ERANGE) {
		return false;
	}
	if (ret < INT32_MIN || ret > INT32_MAX) {
		return false;
	}

	*out = ret;
	return true;
}

bool parse_size(std::string const &s, size_t *out) {
	std::string t = trim(s);
	if (t.size() == 0 || t[0] == '-') {
		return false;
	}

	char *err = NULL;
	errno = 0;
	unsigned long long ret = strtoull(t.c_str(), &err, 10);
	if (*err != '\0' || errno == ERANGE || ret > SIZE_MAX) {
		return false;
	}

	*out = ret;
	return true;
}

bool parse_double(std::string const &s, double *out) {
	std::string t = trim(s);
	if (t.size() == 0) {
		return false;
	}

	char *err = NULL;
	double ret = strtod(t.c_str(), &err);
	if (*err != '\0' || !isfinite(ret)) {
		return false;
	}

	*out = ret;
	return true;
}
