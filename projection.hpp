#ifndef PROJECTION_HPP
#define PROJECTION_HPP

#include <string>
#include "errors.hpp"

// WGS84
#define WGS84_SEMI_MAJOR_AXIS 6378137.0
#define WGS84_FLATTENING (1 / 298.257222101)

struct cartesian {
	double x = 0;
	double y = 0;
	double z = 0;

	cartesian() {
	}

	cartesian(double nx, double ny, double nz)
	    : x(nx),
	      y(ny),
	      z(nz) {
	}
};

struct utm_locator {
	unsigned zone = 0;
	char band = '\0';

	utm_locator() {
	}

	utm_locator(unsigned nzone, char nband)
	    : zone(nzone),
	      band(nband) {
	}

	bool operator==(utm_locator const &o) const {
		return zone == o.zone && band == o.band;
	}

	std::string toString() const;
};

// No range checking: any latitude, longitude, or height produces a triple.
cartesian geodetic_to_cartesian(double lat, double lon, double height);
conv_error geodetic_to_cartesian_checked(double lat, double lon, double height, cartesian *out);

conv_error latitude_band(double lat, char *band);
conv_error utm_zone_number(double lat, double lon, unsigned *zone);
conv_error utm_zone_for(double lat, double lon, utm_locator *out);

#endif
