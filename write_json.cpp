#include <stdio.h>
#include <math.h>
#include <string>
#include <vector>
#include "write_json.hpp"

std::string json_quote(std::string const &s) {
	std::string out = "\"";

	for (size_t i = 0; i < s.size(); i++) {
		unsigned char ch = s[i];

		if (ch == '\\' || ch == '"') {
			out.push_back('\\');
			out.push_back(ch);
		} else if (ch < ' ') {
			char tmp[7];
			snprintf(tmp, sizeof(tmp), "\\u%04x", (unsigned) ch);
			out.append(tmp);
		} else {
			out.push_back(ch);
		}
	}

	out.push_back('"');
	return out;
}

void json_record::add(std::string const &key, std::string const &json) {
	if (members.size() != 0) {
		members.append(", ");
	}
	members.append(json_quote(key));
	members.append(": ");
	members.append(json);
}

void json_record::add_string(std::string const &key, std::string const &value) {
	add(key, json_quote(value));
}

void json_record::add_signed(std::string const &key, long long value) {
	add(key, std::to_string(value));
}

void json_record::add_bool(std::string const &key, bool value) {
	add(key, value ? "true" : "false");
}

void json_record::add_strings(std::string const &key, std::vector<std::string> const &values) {
	std::string out = "[";
	for (size_t i = 0; i < values.size(); i++) {
		if (i != 0) {
			out.append(", ");
		}
		out.append(json_quote(values[i]));
	}
	out.push_back(']');

	add(key, out);
}

// JSON has no spelling for infinity or NaN
void json_record::add_floats(std::string const &key, std::vector<double> const &values, int precision) {
	std::string out = "[";
	for (size_t i = 0; i < values.size(); i++) {
		if (i != 0) {
			out.append(", ");
		}

		if (!isfinite(values[i])) {
			out.append("null");
		} else {
			char buf[400];
			snprintf(buf, sizeof(buf), "%.*f", precision, values[i]);
			out.append(buf);
		}
	}
	out.push_back(']');

	add(key, out);
}

std::string json_record::toString() const {
	return "{" + members + "}";
}
