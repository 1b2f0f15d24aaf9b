#pragma once

#include <cstdint>
#include <vector>

namespace tapevm {
enum class insType : uint8_t;
struct ExecError;
struct Machine;
struct ProfileInfo;

/// @brief Execute the instruction at `m.insPtr`. A finished machine is left as is.
/// @return ErrorKind::None on success. On failure the machine is left untouched and `insPtr`
/// still points at the faulting instruction.
ExecError step(Machine& m);

/// @brief Step until the instruction pointer runs off the end of the program or a step fails.
/// The first fault halts the run. A clean end with loops still open reports
/// UnmatchedLoopBegin with every open position. The output stream is flushed either way.
/// @param profile Optional; receives the executed instruction count and the elapsed time.
ExecError run(Machine& m, ProfileInfo* profile = nullptr);

/// @brief Static bracket validation. Reports the same bracket error `run` would report if no
/// other fault happened first, without executing anything.
ExecError checkLoops(const std::vector<insType>& program);
}  // namespace tapevm
