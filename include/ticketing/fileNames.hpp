#pragma once

#include <string>
#include <vector>

namespace ts::ticketing {

// Reduces a remote file name to one safe path component.
std::string sanitizeFileName(const std::string& name);

// First occurrence keeps its name, the n-th becomes "stem(n).ext".
void disambiguateFileNames(std::vector<std::string>& names);

}
