#ifndef WRITE_JSON_HPP
#define WRITE_JSON_HPP

#include <string>
#include <vector>

std::string json_quote(std::string const &s);

// One flat JSON object per converted input: scalar members plus
// arrays of strings or numbers, written on a single line.
struct json_record {
	std::string members = "";

	void add_string(std::string const &key, std::string const &value);
	void add_signed(std::string const &key, long long value);
	void add_bool(std::string const &key, bool value);
	void add_strings(std::string const &key, std::vector<std::string> const &values);
	void add_floats(std::string const &key, std::vector<double> const &values, int precision);

	std::string toString() const;

       private:
	void add(std::string const &key, std::string const &json);
};

#endif
