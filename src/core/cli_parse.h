#pragma once

#include <string>

#include "pixel_buffer.h"

namespace gearpix::core {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);

bool parse_int(const std::string& token, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_int_pair(const std::string& token, int& a, int& b);
bool parse_double_pair(const std::string& token, double& a, double& b);

// R,G,B or R,G,B,A with 0-255 channels; alpha defaults to 255.
bool parse_color(const std::string& value, Color& out);

} // namespace gearpix::core
