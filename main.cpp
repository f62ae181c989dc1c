#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <getopt.h>
#include <string>
#include <vector>
#include "main.hpp"
#include "version.hpp"
#include "text.hpp"
#include "twos.hpp"
#include "projection.hpp"
#include "present.hpp"
#include "write_json.hpp"

char **av;
int quiet = 0;
int json_output = 0;
int precision = DEFAULT_PRECISION;
size_t bit_size = 32;

static const char *invalid_values = "Error: Please enter valid values.";
static const char *invalid_coordinates = "Error: Invalid input.";

int atoi_require(const char *s, const char *what) {
	int32_t ret;
	if (!parse_int32(s, &ret)) {
		fprintf(stderr, "%s: %s must be a number (got %s)\n", *av, what, s);
		exit(EXIT_FAILURE);
	}
	return ret;
}

size_t atosize_require(const char *s, const char *what) {
	size_t ret;
	if (!parse_size(s, &ret)) {
		fprintf(stderr, "%s: %s must be a non-negative number (got %s)\n", *av, what, s);
		exit(EXIT_FAILURE);
	}
	return ret;
}

int precision_require(const char *s, const char *what) {
	int p = atoi_require(s, what);
	if (p < 0 || p > MAX_PRECISION) {
		fprintf(stderr, "%s: %s must be between 0 and %d (got %s)\n", *av, what, MAX_PRECISION, s);
		exit(EXIT_FAILURE);
	}
	return p;
}

static std::string join(std::vector<std::string> const &fields) {
	std::string out;
	for (size_t i = 0; i < fields.size(); i++) {
		if (i != 0) {
			out.push_back(' ');
		}
		out.append(fields[i]);
	}
	return out;
}

static void warn(std::vector<std::string> const &fields, std::string const &message) {
	if (!quiet) {
		fprintf(stderr, "%s: %s: %s\n", *av, join(fields).c_str(), message.c_str());
	}
}

static json_record begin_record(std::vector<std::string> const &fields, bool ok, const char *name, std::string const &message) {
	json_record rec;
	rec.add_strings("input", fields);
	rec.add_bool("ok", ok);

	if (!ok) {
		rec.add_string("error", name);
		rec.add_string("message", message);
	}
	return rec;
}

// Input that never reached a conversion because it isn't a number
static bool reject(std::vector<std::string> const &fields, const char *message) {
	if (json_output) {
		printf("%s\n", begin_record(fields, false, "invalid_value", message).toString().c_str());
	} else {
		printf("%s\n", message);
	}

	warn(fields, message);
	return false;
}

// `text` is the plain rendering, `rec` the JSON one
static bool finish(std::vector<std::string> const &fields, conv_error const &err, std::string const &text, json_record const &rec) {
	if (json_output) {
		printf("%s\n", rec.toString().c_str());
	} else {
		printf("%s\n", display(err, text).c_str());
	}

	if (!err.ok()) {
		warn(fields, err.message());
	}
	return err.ok();
}

static bool to_decimal(std::string const &text) {
	std::vector<std::string> fields(1, text);

	int32_t decimal = 0;
	conv_error err = twos_complement_to_decimal(trim(text), &decimal);

	json_record rec = begin_record(fields, err.ok(), err.name(), err.message());
	if (err.ok()) {
		rec.add_signed("decimal", decimal);
	}
	return finish(fields, err, std::to_string(decimal), rec);
}

static bool to_binary(std::string const &text) {
	std::vector<std::string> fields(1, text);

	int32_t decimal;
	if (!parse_int32(text, &decimal)) {
		return reject(fields, invalid_values);
	}

	std::string binary;
	conv_error err = decimal_to_twos_complement(decimal, bit_size, &binary);

	json_record rec = begin_record(fields, err.ok(), err.name(), err.message());
	rec.add_signed("size", (long long) bit_size);
	if (err.ok()) {
		rec.add_string("binary", binary);
	}
	return finish(fields, err, binary, rec);
}

static bool to_xyz(std::vector<std::string> const &fields) {
	double lat, lon, height;
	if (fields.size() != 3 || !parse_double(fields[0], &lat) || !parse_double(fields[1], &lon) || !parse_double(fields[2], &height)) {
		return reject(fields, invalid_coordinates);
	}

	cartesian c;
	conv_error err = geodetic_to_cartesian_checked(lat, lon, height, &c);

	json_record rec = begin_record(fields, err.ok(), err.name(), err.message());
	if (err.ok()) {
		std::vector<double> xyz;
		xyz.push_back(c.x);
		xyz.push_back(c.y);
		xyz.push_back(c.z);
		rec.add_floats("xyz", xyz, precision);
	}
	return finish(fields, err, present_cartesian(c, precision), rec);
}

static bool to_utm_zone(std::vector<std::string> const &fields) {
	double lat, lon;
	if (fields.size() != 2 || !parse_double(fields[0], &lat) || !parse_double(fields[1], &lon)) {
		return reject(fields, invalid_coordinates);
	}

	utm_locator loc;
	conv_error err = utm_zone_for(lat, lon, &loc);

	json_record rec = begin_record(fields, err.ok(), err.name(), err.message());
	if (err.ok()) {
		rec.add_signed("zone", loc.zone);
		rec.add_string("band", std::string(1, loc.band));
		rec.add_string("utm", loc.toString());
	}
	return finish(fields, err, present_utm_locator(loc), rec);
}

static size_t mode_arity(convert_mode mode) {
	switch (mode) {
	case MODE_NONE:
		return 0;
	case MODE_TO_DECIMAL:
	case MODE_TO_BINARY:
		return 1;
	case MODE_TO_XYZ:
		return 3;
	case MODE_UTM_ZONE:
		return 2;
	}

	return 0;
}

static bool convert(convert_mode mode, std::vector<std::string> const &fields) {
	switch (mode) {
	case MODE_TO_DECIMAL:
		return to_decimal(fields[0]);
	case MODE_TO_BINARY:
		return to_binary(fields[0]);
	case MODE_TO_XYZ:
		return to_xyz(fields);
	case MODE_UTM_ZONE:
		return to_utm_zone(fields);
	case MODE_NONE:
		break;
	}

	fprintf(stderr, "%s: Internal error: no conversion selected\n", *av);
	exit(EXIT_FAILURE);
}

// One record per line. The single-value modes take every word on the
// line as a separate value; the coordinate modes want the whole line.
static bool convert_stream(convert_mode mode, FILE *fp) {
	bool ok = true;
	size_t arity = mode_arity(mode);
	char *line = NULL;
	size_t len = 0;

	while (getline(&line, &len, fp) >= 0) {
		std::vector<std::string> words = split_words(line);
		if (words.size() == 0) {
			continue;
		}

		if (arity == 1) {
			for (size_t i = 0; i < words.size(); i++) {
				ok &= convert(mode, std::vector<std::string>(1, words[i]));
			}
		} else {
			ok &= convert(mode, words);
		}

		fflush(stdout);
	}

	free(line);

	if (ferror(fp)) {
		fprintf(stderr, "%s: Error reading standard input: %s\n", *av, strerror(errno));
		exit(EXIT_FAILURE);
	}

	return ok;
}

void usage(char **argv) {
	fprintf(stderr, "Usage: %s [-b | -d [-s size] | -x [-p precision] | -u] [-j] [-q] [--] [value ...]\n", argv[0]);
	exit(EXIT_FAILURE);
}

void set_mode(convert_mode *mode, convert_mode to) {
	if (*mode != MODE_NONE && *mode != to) {
		fprintf(stderr, "%s: Only one of --to-decimal, --to-binary, --to-xyz, and --utm-zone can be used\n", *av);
		exit(EXIT_FAILURE);
	}
	*mode = to;
}

int main(int argc, char **argv) {
	extern int optind;
	extern char *optarg;
	int i;
	convert_mode mode = MODE_NONE;

	av = argv;

	const char *CONVKIT_PRECISION = getenv("CONVKIT_PRECISION");
	if (CONVKIT_PRECISION != NULL) {
		precision = precision_require(CONVKIT_PRECISION, "CONVKIT_PRECISION");
	}

	struct option long_options[] = {
		{"to-decimal", no_argument, 0, 'b'},
		{"to-binary", no_argument, 0, 'd'},
		{"to-xyz", no_argument, 0, 'x'},
		{"utm-zone", no_argument, 0, 'u'},
		{"size", required_argument, 0, 's'},
		{"precision", required_argument, 0, 'p'},
		{"json", no_argument, 0, 'j'},
		{"quiet", no_argument, 0, 'q'},
		{"version", no_argument, 0, 'v'},
		{0, 0, 0, 0},
	};

	std::string getopt_str;
	for (size_t lo = 0; long_options[lo].name != NULL; lo++) {
		if (long_options[lo].val > ' ') {
			getopt_str.push_back(long_options[lo].val);

			if (long_options[lo].has_arg == required_argument) {
				getopt_str.push_back(':');
			}
		}
	}

	while ((i = getopt_long(argc, argv, getopt_str.c_str(), long_options, NULL)) != -1) {
		switch (i) {
		case 0:
			break;

		case 'b':
			set_mode(&mode, MODE_TO_DECIMAL);
			break;

		case 'd':
			set_mode(&mode, MODE_TO_BINARY);
			break;

		case 'x':
			set_mode(&mode, MODE_TO_XYZ);
			break;

		case 'u':
			set_mode(&mode, MODE_UTM_ZONE);
			break;

		case 's':
			bit_size = atosize_require(optarg, "Bit size");
			break;

		case 'p':
			precision = precision_require(optarg, "Precision");
			break;

		case 'j':
			json_output = 1;
			break;

		case 'q':
			quiet = 1;
			break;

		case 'v':
			fprintf(stderr, "convkit %s\n", VERSION);
			exit(EXIT_SUCCESS);

		default:
			usage(argv);
		}
	}

	if (mode == MODE_NONE) {
		usage(argv);
	}

	bool ok = true;
	size_t arity = mode_arity(mode);

	if (optind == argc) {
		ok = convert_stream(mode, stdin);
	} else {
		if ((argc - optind) % arity != 0) {
			fprintf(stderr, "%s: Expected values in groups of %zu (got %d)\n", *av, arity, argc - optind);
			exit(EXIT_FAILURE);
		}

		for (int a = optind; a < argc; a += arity) {
			std::vector<std::string> fields(argv + a, argv + a + arity);
			ok &= convert(mode, fields);
		}
	}

	if (!ok) {
		return 1;
	}
	return 0;
}
