#pragma once
#include <cstddef>
#include <string>

std::string sha256_string(const std::string& str);
// short_digest returns the first n hex chars of sha256_string(str).
std::string short_digest(const std::string& str, size_t n = 16);
