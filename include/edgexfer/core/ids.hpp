#pragma once

#include <string>

namespace edgexfer::core {

// Random (v4) UUID in canonical textual form. Thread safe.
std::string generate_uuid();

} // namespace edgexfer::core
