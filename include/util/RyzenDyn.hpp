#pragma once
#include <string>
#include <vector>
#include "abi/RyzenAbi.hpp"

namespace zenmon::util {

// Runtime loader for libryzen_monitor.so (dlopen/dlsym).
// The sensing library is never linked at build time; a machine without it
// still gets a clean diagnostic instead of a loader failure.
class RyzenDyn {
public:
  RyzenDyn() = default;
  ~RyzenDyn();
  RyzenDyn(const RyzenDyn&) = delete;
  RyzenDyn& operator=(const RyzenDyn&) = delete;

  // Try each candidate in order; first one that opens and exports all four
  // entry points wins. Returns false with error() set otherwise.
  bool load(const std::vector<std::string>& candidates);

  bool loaded() const { return handle_ != nullptr; }
  const std::string& path() const { return path_; }
  const std::string& error() const { return error_; }

  // Thin forwarders; only valid when loaded().
  int init() const { return p_ryzen_init(); }
  void cleanup() const { p_ryzen_cleanup(); }
  int get_system_info(abi::system_data_t* sys) const { return p_ryzen_get_system_info(sys); }
  int read_data(abi::core_data_t* cores, int max_cores,
                abi::constraints_data_t* constraints, abi::memory_data_t* memory,
                abi::power_data_t* power, abi::graphics_data_t* graphics,
                abi::calculated_stats_t* stats) const {
    return p_ryzen_read_data(cores, max_cores, constraints, memory, power, graphics, stats);
  }

private:
  bool dlsym_all();
  void close();

  void* handle_{};
  std::string path_;
  std::string error_;

  abi::ryzen_init_fn            p_ryzen_init{};
  abi::ryzen_cleanup_fn         p_ryzen_cleanup{};
  abi::ryzen_get_system_info_fn p_ryzen_get_system_info{};
  abi::ryzen_read_data_fn       p_ryzen_read_data{};
};

// Directory holding the running executable ("" if unknown).
std::string executable_dir();

// True if `path` sits under one of the trusted library prefixes or `exe_dir`.
bool library_path_allowed(const std::string& path, const std::string& exe_dir);

// Search order: configured path (if allowed), next to the executable, then
// the bare soname for the dynamic linker's search path.
std::vector<std::string> library_candidates(const std::string& configured,
                                            const std::string& exe_dir);

} // namespace zenmon::util
