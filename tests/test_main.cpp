#include "minitest.hpp"

// Optional argv[1]: substring filter on test names.
int main(int argc, char** argv) {
  return mini::run_all(argc > 1 ? argv[1] : nullptr);
}
