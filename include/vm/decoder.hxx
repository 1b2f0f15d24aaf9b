#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace tapevm {
enum class insType : uint8_t;

/// @brief Map one source byte to its instruction. Total: bytes outside `><+-[],.` become NOP.
insType decode(uint8_t byte);

/// @brief Decode a whole source buffer, one instruction per byte, in order.
std::vector<insType> decodeProgram(std::string_view source);

/// @brief Source character for an instruction. NOP encodes as a space.
char encode(insType op);
}  // namespace tapevm
