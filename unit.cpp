#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <math.h>
#include <limits>
#include <string>
#include "errors.hpp"
#include "twos.hpp"
#include "projection.hpp"
#include "present.hpp"
#include "text.hpp"
#include "write_json.hpp"

static int32_t decode(std::string const &s) {
	int32_t out = 12345;
	REQUIRE(twos_complement_to_decimal(s, &out).ok());
	return out;
}

static std::string encode(int32_t v, size_t size) {
	std::string out;
	REQUIRE(decimal_to_twos_complement(v, size, &out).ok());
	return out;
}

static conv_error encode_error(int32_t v, size_t size) {
	std::string out = "untouched";
	conv_error err = decimal_to_twos_complement(v, size, &out);
	REQUIRE(out == std::string("untouched"));
	return err;
}

TEST_CASE("Two's complement to decimal", "[twos]") {
	REQUIRE(decode("1101") == -3);
	REQUIRE(decode("0101") == 5);
	REQUIRE(decode("111") == -1);
	REQUIRE(decode("1") == -1);
	REQUIRE(decode("0") == 0);
	REQUIRE(decode("1000") == -8);
	REQUIRE(decode("0111") == 7);
	REQUIRE(decode("01111111111111111111111111111111") == 2147483647);
	REQUIRE(decode("10000000000000000000000000000000") == -2147483647 - 1);
	REQUIRE(decode("11111111111111111111111111111111") == -1);
}

TEST_CASE("Sign-extended binary longer than 32 bits", "[twos]") {
	REQUIRE(decode(std::string(40, '0') + "101") == 5);
	REQUIRE(decode(std::string(40, '1') + "011") == -5);
	REQUIRE(decode(std::string(64, '1')) == -1);
}

TEST_CASE("Binary input that is not binary", "[twos]") {
	int32_t out = 12345;

	REQUIRE(twos_complement_to_decimal("", &out) == conv_error(conv_invalid_input));
	REQUIRE(twos_complement_to_decimal("102", &out) == conv_error(conv_invalid_input));
	REQUIRE(twos_complement_to_decimal("abc", &out) == conv_error(conv_invalid_input));
	REQUIRE(twos_complement_to_decimal(" 101", &out) == conv_error(conv_invalid_input));
	REQUIRE(twos_complement_to_decimal("1 0", &out) == conv_error(conv_invalid_input));
	REQUIRE(out == 12345);
}

TEST_CASE("Binary magnitude beyond 32 bits", "[twos]") {
	int32_t out = 12345;

	conv_error err = twos_complement_to_decimal("0" + std::string(32, '1'), &out);
	REQUIRE(err.type == conv_parse_error);
	REQUIRE(err.detail.size() > 0);

	err = twos_complement_to_decimal("10" + std::string(32, '0'), &out);
	REQUIRE(err.type == conv_parse_error);

	// Valid digits, so it must not be reported as invalid input
	REQUIRE(err != conv_error(conv_invalid_input));
	REQUIRE(out == 12345);
}

TEST_CASE("Decimal to two's complement", "[twos]") {
	REQUIRE(encode(5, 8) == "00000101");
	REQUIRE(encode(-5, 8) == "11111011");
	REQUIRE(encode(0, 1) == "0");
	REQUIRE(encode(-1, 1) == "1");
	REQUIRE(encode(-1, 4) == "1111");
	REQUIRE(encode(2147483647, 32) == "01111111111111111111111111111111");
	REQUIRE(encode(-2147483647 - 1, 32) == "10000000000000000000000000000000");
	REQUIRE(encode(-3, 40) == std::string(38, '1') + "01");
	REQUIRE(encode(3, 40) == std::string(38, '0') + "11");
}

TEST_CASE("Bit size must be positive", "[twos]") {
	REQUIRE(encode_error(5, 0) == conv_error(conv_invalid_size));
	REQUIRE(encode_error(0, 0) == conv_error(conv_invalid_size));
}

TEST_CASE("Bit size has an upper limit", "[twos]") {
	REQUIRE(encode(5, MAX_BIT_SIZE) == std::string(MAX_BIT_SIZE - 3, '0') + "101");
	REQUIRE(encode(-1, MAX_BIT_SIZE) == std::string(MAX_BIT_SIZE, '1'));
	REQUIRE(decode(encode(std::numeric_limits<int32_t>::min(), MAX_BIT_SIZE)) == std::numeric_limits<int32_t>::min());

	REQUIRE(encode_error(5, MAX_BIT_SIZE + 1) == conv_error(conv_invalid_size));
	REQUIRE(encode_error(5, 1000000) == conv_error(conv_invalid_size));
	REQUIRE(encode_error(5, (size_t) -1) == conv_error(conv_invalid_size));
	REQUIRE(encode_error(5, (size_t) -1).message() == "Error: Size must be at most 64.");
	REQUIRE(encode_error(5, 0).message() == "Error: Size must be greater than 0.");
}

TEST_CASE("Very long binary input", "[twos]") {
	REQUIRE(decode(std::string(100000, '1')) == -1);
	REQUIRE(decode(std::string(100000, '0') + "101") == 5);
	REQUIRE(decode(std::string(100000, '1') + "011") == -5);

	int32_t out = 12345;
	REQUIRE(twos_complement_to_decimal("0" + std::string(100000, '1'), &out).type == conv_parse_error);
	REQUIRE(twos_complement_to_decimal(std::string(100000, '1') + "2", &out) == conv_error(conv_invalid_input));
	REQUIRE(out == 12345);
}

TEST_CASE("Bit size range boundaries", "[twos]") {
	for (size_t size = 1; size <= 31; size++) {
		int32_t max = (int32_t) ((1LL << (size - 1)) - 1);
		int32_t min = (int32_t) (-(1LL << (size - 1)));

		REQUIRE(encode(max, size).size() == size);
		REQUIRE(encode(min, size).size() == size);
		REQUIRE(encode_error(max + 1, size) == conv_error(conv_overflow));
		REQUIRE(encode_error(min - 1, size) == conv_error(conv_overflow));
	}

	REQUIRE(encode(std::numeric_limits<int32_t>::max(), 32).size() == 32);
	REQUIRE(encode(std::numeric_limits<int32_t>::min(), 32).size() == 32);
	REQUIRE(!fits_in_bits(1, 1));
	REQUIRE(fits_in_bits(-1, 1));
}

TEST_CASE("Decimal survives a trip through binary", "[twos]") {
	size_t sizes[] = {1, 2, 3, 7, 8, 9, 16};

	for (size_t s = 0; s < sizeof(sizes) / sizeof(sizes[0]); s++) {
		size_t size = sizes[s];
		int32_t max = (int32_t) ((1LL << (size - 1)) - 1);
		int32_t min = (int32_t) (-(1LL << (size - 1)));

		for (int32_t v = min; v <= max; v++) {
			std::string bits = encode(v, size);
			REQUIRE(bits.size() == size);
			REQUIRE(decode(bits) == v);
		}
	}

	int32_t samples[] = {std::numeric_limits<int32_t>::min(), -65536, -1, 0, 1, 123456789, std::numeric_limits<int32_t>::max()};
	for (size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); i++) {
		REQUIRE(decode(encode(samples[i], 32)) == samples[i]);
		REQUIRE(decode(encode(samples[i], 48)) == samples[i]);
	}
}

TEST_CASE("Geodetic to Cartesian", "[geodetic]") {
	cartesian c = geodetic_to_cartesian(0, 0, 0);
	REQUIRE(fabs(c.x - 6378137.0) < 1e-6);
	REQUIRE(fabs(c.y) < 1e-6);
	REQUIRE(fabs(c.z) < 1e-6);

	c = geodetic_to_cartesian(0, 90, 0);
	REQUIRE(fabs(c.x) < 1e-6);
	REQUIRE(fabs(c.y - 6378137.0) < 1e-6);
	REQUIRE(fabs(c.z) < 1e-6);

	c = geodetic_to_cartesian(0, 0, 1000);
	REQUIRE(fabs(c.x - 6379137.0) < 1e-6);

	// Polar radius b = a(1 - f)
	double b = WGS84_SEMI_MAJOR_AXIS * (1 - WGS84_FLATTENING);
	c = geodetic_to_cartesian(90, 0, 0);
	REQUIRE(fabs(c.x) < 1e-6);
	REQUIRE(fabs(c.z - b) < 1e-6);

	c = geodetic_to_cartesian(-90, 0, 0);
	REQUIRE(fabs(c.z + b) < 1e-6);
}

TEST_CASE("Geodetic to Cartesian takes any input", "[geodetic]") {
	cartesian c = geodetic_to_cartesian(0, 360, 0);
	REQUIRE(fabs(c.x - 6378137.0) < 1e-6);

	c = geodetic_to_cartesian(0, 180, 0);
	REQUIRE(fabs(c.x + 6378137.0) < 1e-6);

	c = geodetic_to_cartesian(100, 0, 0);
	REQUIRE(isfinite(c.x));
	REQUIRE(isfinite(c.z));
}

TEST_CASE("Checked geodetic to Cartesian", "[geodetic]") {
	cartesian c;
	REQUIRE(geodetic_to_cartesian_checked(45, 45, 100, &c).ok());

	cartesian expect = geodetic_to_cartesian(45, 45, 100);
	REQUIRE(c.x == expect.x);
	REQUIRE(c.y == expect.y);
	REQUIRE(c.z == expect.z);

	REQUIRE(geodetic_to_cartesian_checked(90.5, 0, 0, &c) == invalid_latitude(90.5));
	REQUIRE(geodetic_to_cartesian_checked(0, -180.5, 0, &c) == invalid_longitude(-180.5));
	REQUIRE(geodetic_to_cartesian_checked(95, 200, 0, &c) == invalid_latitude(95));
	REQUIRE(geodetic_to_cartesian_checked(NAN, 0, 0, &c).type == conv_invalid_latitude);
	REQUIRE(geodetic_to_cartesian_checked(0, NAN, 0, &c).type == conv_invalid_longitude);
	REQUIRE(geodetic_to_cartesian_checked(0, 0, INFINITY, &c).type == conv_calculation_error);
}

static utm_locator utm(double lat, double lon) {
	utm_locator loc;
	REQUIRE(utm_zone_for(lat, lon, &loc).ok());
	return loc;
}

TEST_CASE("UTM zone and latitude band", "[utm]") {
	REQUIRE(utm(40.0, -75.0) == utm_locator(18, 'T'));
	REQUIRE(utm(-33.0, 151.0) == utm_locator(56, 'H'));
	REQUIRE(utm(0, 0) == utm_locator(31, 'N'));
	REQUIRE(utm(-80, -180) == utm_locator(1, 'C'));
	REQUIRE(utm(83.999, 179.9) == utm_locator(60, 'X'));
	REQUIRE(utm(-0.0001, 0) == utm_locator(31, 'M'));
	REQUIRE(utm(51.5, -0.1).toString() == "30U");
}

TEST_CASE("UTM zone exceptions", "[utm]") {
	REQUIRE(utm(60.0, 5.0) == utm_locator(32, 'V'));
	REQUIRE(utm(60.0, 2.0) == utm_locator(31, 'V'));
	REQUIRE(utm(64.0, 5.0) == utm_locator(31, 'W'));

	REQUIRE(utm(72.0, 7.0) == utm_locator(31, 'X'));
	REQUIRE(utm(72.0, 9.0) == utm_locator(33, 'X'));
	REQUIRE(utm(72.0, 20.0) == utm_locator(33, 'X'));
	REQUIRE(utm(72.0, 21.0) == utm_locator(35, 'X'));
	REQUIRE(utm(72.0, 31.0) == utm_locator(35, 'X'));
	REQUIRE(utm(71.0, 7.0) == utm_locator(32, 'W'));
}

TEST_CASE("UTM zone 180 degrees wraps to zone 1", "[utm]") {
	REQUIRE(utm(0, 180) == utm_locator(1, 'N'));
	REQUIRE(utm(0, 179.999) == utm_locator(60, 'N'));
}

TEST_CASE("UTM out of range", "[utm]") {
	utm_locator loc(99, 'Z');

	REQUIRE(utm_zone_for(84.0, 15.0, &loc) == invalid_latitude(84.0));
	REQUIRE(utm_zone_for(-80.1, 15.0, &loc) == invalid_latitude(-80.1));
	REQUIRE(utm_zone_for(90.1, 0.0, &loc) == invalid_latitude(90.1));
	REQUIRE(utm_zone_for(0.0, 181.0, &loc) == invalid_longitude(181.0));
	REQUIRE(utm_zone_for(0.0, -180.5, &loc) == invalid_longitude(-180.5));

	// Latitude is reported before longitude
	REQUIRE(utm_zone_for(85.0, 181.0, &loc) == invalid_latitude(85.0));
	REQUIRE(utm_zone_for(NAN, 0, &loc).type == conv_invalid_latitude);

	REQUIRE(loc == utm_locator(99, 'Z'));
}

TEST_CASE("UTM stages check their own ranges", "[utm]") {
	unsigned zone = 0;
	REQUIRE(utm_zone_number(85, 15, &zone).ok());
	REQUIRE(zone == 33);
	REQUIRE(utm_zone_number(-90, 15, &zone).ok());
	REQUIRE(utm_zone_number(90.1, 15, &zone) == invalid_latitude(90.1));
	REQUIRE(utm_zone_number(0, 180.1, &zone) == invalid_longitude(180.1));

	char band = '?';
	REQUIRE(latitude_band(85, &band) == invalid_latitude(85));
	REQUIRE(band == '?');
}

TEST_CASE("Latitude bands skip I and O", "[utm]") {
	std::string seen;

	for (double lat = -80; lat < 84; lat += 0.25) {
		char band;
		REQUIRE(latitude_band(lat, &band).ok());
		REQUIRE(band != 'I');
		REQUIRE(band != 'O');
		REQUIRE(band >= 'C');
		REQUIRE(band <= 'X');

		if (seen.size() == 0 || seen[seen.size() - 1] != band) {
			seen.push_back(band);
		}
	}

	REQUIRE(seen == "CDEFGHJKLMNPQRSTUVWX");
}

TEST_CASE("Error equality and messages", "[errors]") {
	REQUIRE(conv_error() == conv_error(conv_ok));
	REQUIRE(conv_error().ok());
	REQUIRE(invalid_latitude(1) != invalid_latitude(2));
	REQUIRE(invalid_latitude(1) != invalid_longitude(1));
	REQUIRE(parse_error("a") != parse_error("b"));
	REQUIRE(invalid_latitude(NAN) == invalid_latitude(NAN));

	REQUIRE(conv_error(conv_invalid_input).message() == "Invalid input: Enter only 0s and 1s.");
	REQUIRE(conv_error(conv_invalid_size).message() == "Error: Size must be greater than 0.");
	REQUIRE(conv_error(conv_overflow).message() == "Error: Number does not fit in the specified size.");
	REQUIRE(invalid_latitude(84).message() == "Error: Latitude 84 is out of range");
	REQUIRE(invalid_longitude(181.5).message() == "Error: Longitude 181.5 is out of range");
	REQUIRE(calculation_error("bad").message() == "Error: bad");
	REQUIRE(parse_error("too big").message() == "Error: Failed to parse binary value: too big");
	REQUIRE(std::string(invalid_longitude(0).name()) == "invalid_longitude");
}

TEST_CASE("Presentation strings", "[present]") {
	REQUIRE(present_twos_complement_to_decimal("1101") == "-3");
	REQUIRE(present_twos_complement_to_decimal("12") == "Invalid input: Enter only 0s and 1s.");
	REQUIRE(present_decimal_to_twos_complement(-5, 8) == "11111011");
	REQUIRE(present_decimal_to_twos_complement(128, 8) == "Error: Number does not fit in the specified size.");
	REQUIRE(present_decimal_to_twos_complement(1, 0) == "Error: Size must be greater than 0.");
	REQUIRE(present_decimal_to_twos_complement(1, 65) == "Error: Size must be at most 64.");
	REQUIRE(present_geodetic_to_cartesian(0, 0, 0, 6) == "6378137.000000 0.000000 0.000000");
	REQUIRE(present_geodetic_to_cartesian(0, 90, 0, 2) == "0.00 6378137.00 0.00");
	REQUIRE(present_geodetic_to_cartesian(91, 0, 0, 6) == "Error: Latitude 91 is out of range");
	REQUIRE(present_utm_zone(40, -75) == "UTM Zone: 18T");
	REQUIRE(present_utm_zone(84, 15) == "Error: Latitude 84 is out of range");
	REQUIRE(display(conv_error(), "fine") == "fine");
	REQUIRE(display(conv_error(conv_overflow), "fine") == "Error: Number does not fit in the specified size.");
}

TEST_CASE("Command-line value parsing", "[text]") {
	REQUIRE(trim("  1101\n") == "1101");
	REQUIRE(trim("   ") == "");
	REQUIRE(split_words(" 40  -75\t0\n") == std::vector<std::string>({"40", "-75", "0"}));

	int32_t i = 0;
	REQUIRE(parse_int32(" -5 ", &i));
	REQUIRE(i == -5);
	REQUIRE(!parse_int32("2147483648", &i));
	REQUIRE(!parse_int32("5x", &i));
	REQUIRE(!parse_int32("", &i));

	size_t s = 0;
	REQUIRE(parse_size("8", &s));
	REQUIRE(s == 8);
	REQUIRE(!parse_size("-8", &s));

	double d = 0;
	REQUIRE(parse_double("40.5", &d));
	REQUIRE(d == 40.5);
	REQUIRE(!parse_double("north", &d));
	REQUIRE(!parse_double("nan", &d));
	REQUIRE(!parse_double("inf", &d));
	REQUIRE(!parse_double("-infinity", &d));
	REQUIRE(!parse_double("1e999", &d));
	REQUIRE(d == 40.5);
}

TEST_CASE("JSON records", "[json]") {
	json_record rec;
	rec.add_strings("input", std::vector<std::string>({"40", "-75"}));
	rec.add_bool("ok", true);
	rec.add_floats("xyz", std::vector<double>({1.5, INFINITY, NAN}), 2);
	rec.add_signed("zone", 18);
	rec.add_string("band", "T");

	REQUIRE(rec.toString() == "{\"input\": [\"40\", \"-75\"], \"ok\": true, \"xyz\": [1.50, null, null], \"zone\": 18, \"band\": \"T\"}");
	REQUIRE(json_record().toString() == "{}");
}

TEST_CASE("JSON string escaping", "[json]") {
	REQUIRE(json_quote("18T") == "\"18T\"");
	REQUIRE(json_quote("a\"b\\c") == "\"a\\\"b\\\\c\"");
	REQUIRE(json_quote(std::string("\x01\n\x1f", 3)) == "\"\\u0001\\u000a\\u001f\"");

	// Bytes above 0x7f are UTF-8 and pass through unchanged
	REQUIRE(json_quote("\xc3\xa9") == "\"\xc3\xa9\"");
	REQUIRE(json_quote(std::string("\xff", 1)) == std::string("\"\xff\"", 3));
}
