#ifndef TEXT_HPP
#define TEXT_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

std::string trim(std::string const &s);
std::vector<std::string> split_words(std::string const &s);

bool parse_int32(std::string const &s, int32_t *out);
bool parse_size(std::string const &s, size_t *out);
// Finite values only: "inf" and "nan" are rejected
bool parse_double(std::string const &s, double *out);

#endif
