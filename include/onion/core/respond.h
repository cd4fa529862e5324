#pragma once

namespace onion::core {

class Context;

// Writes the finished context's status, headers and body to its transport.
// Does nothing when the context opted out or the response is no longer
// writable.
void respond(Context& ctx);

} // namespace onion::core
