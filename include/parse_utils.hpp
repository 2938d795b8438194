#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "arg_parser.hpp"

// Parse an integer from a string.
// Format: decimal with optional '+' or '-'; surrounding whitespace is allowed, any other
// trailing character is rejected.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse an integer flag from the parser.
// Invalid input: missing flag, non-integer, or out-of-range sets ok=false and returns 0.
int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok);

// Parse a non-negative count written as decimal digits only.
// Surrounding whitespace is allowed. Anything else sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB or TB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Interpret a textual switch value. Empty, "1", "true", "yes" and "on" are true
// (case-insensitive); everything else is false.
bool parse_switch(const std::string& value);

// Split a comma separated list, trimming whitespace and dropping empty items.
std::vector<std::string> split_list(const std::string& value);

#endif // PARSE_UTILS_HPP
