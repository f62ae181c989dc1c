#ifndef MAIN_HPP
#define MAIN_HPP

#include <stddef.h>

enum convert_mode {
	MODE_NONE,
	MODE_TO_DECIMAL,
	MODE_TO_BINARY,
	MODE_TO_XYZ,
	MODE_UTM_ZONE,
};

extern char **av;
extern int quiet;
extern int json_output;
extern int precision;
extern size_t bit_size;

#define DEFAULT_PRECISION 6
#define MAX_PRECISION 17

#endif
