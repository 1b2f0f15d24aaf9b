/*
    Tapevm - A bounds-checked brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define TAPEVM_TAPE_SIZE 30000
#define TAPEVM_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI.
#define TAPEVM_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace tapevm {

enum class insType : uint8_t {
    PTR_INC,
    PTR_DEC,
    ADD,
    SUB,
    JMP_BEG,
    JMP_END,
    RAD_CHR,
    PUT_CHR,
    NOP,
};

enum class ErrorKind : uint8_t {
    None,
    UnmatchedLoopBegin,
    UnmatchedLoopEnd,
    PointerOutOfBounds,
    NoInput,
};

enum class Bound : uint8_t { Below, Above };

struct ExecError {
    ErrorKind kind = ErrorKind::None;
    // Instruction index of the fault. Unused for UnmatchedLoopBegin.
    size_t position = 0;
    Bound bound = Bound::Below;
    // Still-open loop entries, bottom of the jump stack first.
    std::vector<size_t> openLoops{};

    explicit operator bool() const { return kind != ErrorKind::None; }
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

// Execution context for one program. Owns the tape and every cursor, so any
// number of machines can run side by side in one process. A zero tapeSize gets one cell.
struct Machine {
    explicit Machine(std::vector<insType> code, size_t tapeSize = TAPEVM_TAPE_SIZE,
                     std::istream& input = std::cin, std::ostream& output = std::cout);

    const std::vector<insType> program;
    std::vector<uint8_t> cells;
    size_t cellPtr = 0;
    size_t insPtr = 0;
    std::vector<size_t> jumpStack{};
    std::istream& in;
    std::ostream& out;

    bool finished() const { return insPtr >= program.size(); }
};

std::string describe(const ExecError& err);

}  // namespace tapevm

#include "vm/decoder.hxx"
#include "vm/executor.hxx"
