#ifndef VERSION_HPP
#define VERSION_HPP

#define VERSION "v1.2.0"

#endif
