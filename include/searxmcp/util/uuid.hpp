#pragma once
#include <string>

namespace searxmcp::util
{

/// Random RFC 4122 version 4 identifier in canonical 8-4-4-4-12 form.
std::string generate_uuid4();

} // namespace searxmcp::util
