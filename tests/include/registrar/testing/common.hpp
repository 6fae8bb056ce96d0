#pragma once

#include <registrar/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace registrar::testing {

inline constexpr auto kAuthority = std::string_view{"authority"};
inline constexpr auto kIssuer = std::string_view{"issuer-a"};
inline constexpr auto kOtherIssuer = std::string_view{"issuer-b"};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace registrar::testing
