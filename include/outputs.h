#ifndef RELVER_OUTPUTS_H_
#define RELVER_OUTPUTS_H_

#include <string>

#include "resolver.h"

// One "key=value" line per result, in the order downstream jobs expect.
std::string FormatOutputs(const Resolution& resolution, const std::string& project);

void AppendOutputsFile(const std::string& fpath, const std::string& text);

#endif  // RELVER_OUTPUTS_H_
