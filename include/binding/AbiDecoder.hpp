#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <vector>
#include "abi/RyzenAbi.hpp"
#include "model/Telemetry.hpp"

namespace zenmon::binding {

// Decoders from raw library records (byte buffers laid out as in
// abi/RyzenAbi.hpp) into model values. Each returns false and leaves `out`
// untouched when the buffer is shorter than the record it should hold.

[[nodiscard]] bool decode_system_info(std::span<const std::byte> bytes, model::SystemInfo& out);

// Decodes `count` consecutive core_data_t records.
[[nodiscard]] bool decode_cores(std::span<const std::byte> bytes, int count,
                                std::vector<model::CoreReading>& out);

[[nodiscard]] bool decode_constraints(std::span<const std::byte> bytes, model::Constraints& out);
[[nodiscard]] bool decode_memory(std::span<const std::byte> bytes, model::MemoryInterface& out);
[[nodiscard]] bool decode_power(std::span<const std::byte> bytes, model::PowerRails& out);
[[nodiscard]] bool decode_graphics(std::span<const std::byte> bytes, model::Graphics& out);
[[nodiscard]] bool decode_stats(std::span<const std::byte> bytes, model::DerivedStats& out);

// Text field decoder: stops at the first NUL or at the end of the field.
[[nodiscard]] std::string decode_text(std::span<const std::byte> field);

template <typename T>
[[nodiscard]] std::span<const std::byte> record_bytes(const T& rec) {
  return std::as_bytes(std::span<const T, 1>(&rec, 1));
}

template <typename T>
[[nodiscard]] std::span<const std::byte> record_bytes(const std::vector<T>& recs) {
  return std::as_bytes(std::span<const T>(recs));
}

} // namespace zenmon::binding
