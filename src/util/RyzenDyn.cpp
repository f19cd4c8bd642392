#include "util/RyzenDyn.hpp"
#include <cstdio>
#include <dlfcn.h>
#include <limits.h>
#include <unistd.h>

namespace zenmon::util {

RyzenDyn::~RyzenDyn() { close(); }

void RyzenDyn::close() {
  if (handle_) { ::dlclose(handle_); handle_ = nullptr; }
  p_ryzen_init = nullptr;
  p_ryzen_cleanup = nullptr;
  p_ryzen_get_system_info = nullptr;
  p_ryzen_read_data = nullptr;
}

bool RyzenDyn::load(const std::vector<std::string>& candidates) {
  if (handle_) return true;
  error_.clear();
  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_) {
      const char* e = ::dlerror();
      error_ = e ? e : ("cannot open " + lib);
      continue;
    }
    if (!dlsym_all()) {
      close();
      continue;
    }
    path_ = lib;
    error_.clear();
    return true;
  }
  if (error_.empty()) error_ = "no library candidates";
  return false;
}

bool RyzenDyn::dlsym_all() {
  ::dlerror();
  auto L = [&](const char* sym) -> void* {
    void* p = ::dlsym(handle_, sym);
    if (!p) {
      const char* e = ::dlerror();
      error_ = e ? e : (std::string("missing symbol ") + sym);
    }
    return p;
  };
  p_ryzen_init            = reinterpret_cast<abi::ryzen_init_fn>(L("ryzen_init"));
  p_ryzen_cleanup         = reinterpret_cast<abi::ryzen_cleanup_fn>(L("ryzen_cleanup"));
  p_ryzen_get_system_info = reinterpret_cast<abi::ryzen_get_system_info_fn>(L("ryzen_get_system_info"));
  p_ryzen_read_data       = reinterpret_cast<abi::ryzen_read_data_fn>(L("ryzen_read_data"));
  // All four are required
  return p_ryzen_init && p_ryzen_cleanup && p_ryzen_get_system_info && p_ryzen_read_data;
}

std::string executable_dir() {
  char buf[PATH_MAX];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n <= 0) return {};
  std::string p(buf, static_cast<size_t>(n));
  auto slash = p.rfind('/');
  if (slash == std::string::npos) return {};
  return p.substr(0, slash);
}

bool library_path_allowed(const std::string& path, const std::string& exe_dir) {
  static const std::vector<std::string> allowed_prefixes = {
    "/usr/lib/", "/usr/lib64/", "/usr/local/lib/", "/usr/local/lib64/", "/opt/"
  };
  if (path.find("/../") != std::string::npos) return false;
  for (const auto& prefix : allowed_prefixes) {
    if (path.rfind(prefix, 0) == 0) return true;
  }
  if (!exe_dir.empty() && path.rfind(exe_dir + "/", 0) == 0) return true;
  return false;
}

std::vector<std::string> library_candidates(const std::string& configured,
                                            const std::string& exe_dir) {
  std::vector<std::string> candidates;
  if (!configured.empty()) {
    if (library_path_allowed(configured, exe_dir)) {
      candidates.emplace_back(configured);
    } else {
      std::fprintf(stderr, "zenmon: library path rejected (invalid prefix): %s\n", configured.c_str());
    }
  }
  if (!exe_dir.empty()) candidates.emplace_back(exe_dir + "/" + abi::kLibrarySoname);
  candidates.emplace_back(abi::kLibrarySoname);
  return candidates;
}

} // namespace zenmon::util
