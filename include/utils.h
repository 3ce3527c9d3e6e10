#ifndef RELVER_UTILS_H_
#define RELVER_UTILS_H_

#include <string>
#include <vector>

std::vector<std::string> split(const std::string& str, const std::string& sep);

bool StartsWith(const std::string& str, const std::string& prefix);
bool EndsWith(const std::string& str, const std::string& suffix);

// Value of an environment variable, or `fallback` when unset.
std::string GetEnv(const char* name, const std::string& fallback = "");

#endif  // RELVER_UTILS_H_
