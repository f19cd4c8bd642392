#pragma once

namespace zenmon::app {

// Effective uid 0. The SMU channel the library opens needs root.
bool running_as_root();

// One-line warning shown at startup when not root.
const char* privilege_warning();

} // namespace zenmon::app
