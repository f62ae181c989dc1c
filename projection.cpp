#include <stdio.h>
#include <string.h>
#include <math.h>
#include <string>
#include "projection.hpp"

static const char band_letters[] = "CDEFGHJKLMNPQRSTUVWX";

// https://en.wikipedia.org/wiki/Geographic_coordinate_conversion#From_geodetic_to_ECEF_coordinates
cartesian geodetic_to_cartesian(double lat, double lon, double height) {
	const double a = WGS84_SEMI_MAJOR_AXIS;
	const double f = WGS84_FLATTENING;
	const double e2 = 2 * f - f * f;

	double lat_rad = lat * M_PI / 180;
	double lon_rad = lon * M_PI / 180;

	double sin_lat = sin(lat_rad);
	double cos_lat = cos(lat_rad);

	// Prime vertical radius of curvature
	double n = a / sqrt(1 - e2 * sin_lat * sin_lat);

	return cartesian((n + height) * cos_lat * cos(lon_rad),
			 (n + height) * cos_lat * sin(lon_rad),
			 (n * (1 - e2) + height) * sin_lat);
}

conv_error geodetic_to_cartesian_checked(double lat, double lon, double height, cartesian *out) {
	// Written so that NaN fails the comparison
	if (!(lat >= -90 && lat <= 90)) {
		return invalid_latitude(lat);
	}
	if (!(lon >= -180 && lon <= 180)) {
		return invalid_longitude(lon);
	}

	cartesian c = geodetic_to_cartesian(lat, lon, height);
	if (!isfinite(c.x) || !isfinite(c.y) || !isfinite(c.z)) {
		char buf[100];
		snprintf(buf, sizeof(buf), "Cartesian position for height %g is not finite", height);
		return calculation_error(buf);
	}

	*out = c;
	return conv_error();
}

// MGRS bands are 8 degrees tall from 80S, except that X
// is stretched to 12 degrees to reach 84N.
conv_error latitude_band(double lat, char *band) {
	if (!(lat >= -80 && lat < 84)) {
		return invalid_latitude(lat);
	}

	size_t n = strlen(band_letters);
	size_t i = floor((lat + 80) / 8);
	if (i >= n) {
		i = n - 1;
	}

	*band = band_letters[i];
	return conv_error();
}

conv_error utm_zone_number(double lat, double lon, unsigned *zone) {
	if (!(lat >= -90 && lat <= 90)) {
		return invalid_latitude(lat);
	}
	if (!(lon >= -180 && lon <= 180)) {
		return invalid_longitude(lon);
	}

	// Southwest Norway
	if (lat > 55 && lat < 64 && lon > 2 && lon < 6) {
		*zone = 32;
		return conv_error();
	}

	// Svalbard
	if (lat > 71) {
		if (lon >= 6 && lon < 9) {
			*zone = 31;
			return conv_error();
		}
		if ((lon >= 9 && lon < 12) || (lon >= 18 && lon < 21)) {
			*zone = 33;
			return conv_error();
		}
		if ((lon >= 21 && lon < 24) || (lon >= 30 && lon < 33)) {
			*zone = 35;
			return conv_error();
		}
	}

	// 180 wraps around to zone 1
	*zone = ((long long) floor((lon + 180) / 6)) % 60 + 1;
	return conv_error();
}

conv_error utm_zone_for(double lat, double lon, utm_locator *out) {
	char band;
	conv_error err = latitude_band(lat, &band);
	if (!err.ok()) {
		return err;
	}

	unsigned zone;
	err = utm_zone_number(lat, lon, &zone);
	if (!err.ok()) {
		return err;
	}

	*out = utm_locator(zone, band);
	return conv_error();
}

std::string utm_locator::toString() const {
	return std::to_string(zone) + band;
}
