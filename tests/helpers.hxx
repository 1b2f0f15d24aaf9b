#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Decode and run `code` against string streams. `cellPtr` and `cells` receive the final
// data pointer and tape when given.
struct Captured {
    tapevm::ExecError err;
    std::string output;
};

inline Captured runCaptured(std::string_view code, const std::string& input = "",
                            std::size_t tapeSize = TAPEVM_TAPE_SIZE,
                            std::size_t* cellPtr = nullptr,
                            std::vector<std::uint8_t>* cells = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    tapevm::Machine m(tapevm::decodeProgram(code), tapeSize, in, out);
    Captured result;
    result.err = tapevm::run(m);
    result.output = out.str();
    if (cellPtr) *cellPtr = m.cellPtr;
    if (cells) *cells = m.cells;
    return result;
}
