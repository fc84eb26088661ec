#pragma once

#include <string>

namespace skipgate::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

}  // namespace skipgate::driver
