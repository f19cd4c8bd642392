#include "app/Privilege.hpp"
#include <unistd.h>

namespace zenmon::app {

bool running_as_root() { return ::geteuid() == 0; }

const char* privilege_warning() {
  return "needs root privileges to read sensor data (continuing, initialization will likely fail)";
}

} // namespace zenmon::app
