#pragma once

#include <cstdint>
#include <string_view>

namespace tandem {

// Which side of the exchanges a connection plays. It selects the order of the phases.
enum class Role : uint8_t {
  Server,  // read request, run service, write response
  Client   // run service, write request, read response
};

enum class Phase : uint8_t { HeadRead, ServiceRun, HeadWrite, Terminal };

constexpr Phase InitialPhase(Role role) noexcept { return role == Role::Server ? Phase::HeadRead : Phase::ServiceRun; }

constexpr std::string_view RoleToStr(Role role) noexcept { return role == Role::Server ? "server" : "client"; }

constexpr std::string_view PhaseToStr(Phase phase) noexcept {
  switch (phase) {
    case Phase::HeadRead:
      return "HeadRead";
    case Phase::ServiceRun:
      return "ServiceRun";
    case Phase::HeadWrite:
      return "HeadWrite";
    case Phase::Terminal:
      return "Terminal";
    default:
      return "Unknown";
  }
}

}  // namespace tandem
