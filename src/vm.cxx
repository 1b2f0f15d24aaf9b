/*
    Tapevm - A bounds-checked brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "vm.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using tapevm::Bound;
using tapevm::ErrorKind;
using tapevm::ExecError;
using tapevm::insType;

tapevm::Machine::Machine(std::vector<insType> code, size_t tapeSize, std::istream& input,
                         std::ostream& output)
    : program(std::move(code)), cells(tapeSize ? tapeSize : 1, 0), in(input), out(output) {}

ExecError tapevm::step(Machine& m) {
    ExecError err;
    if (m.finished()) return err;
    switch (m.program[m.insPtr]) {
        case insType::PTR_INC:
            if (m.cellPtr + 1 >= m.cells.size()) {
                err.kind = ErrorKind::PointerOutOfBounds;
                err.position = m.insPtr;
                err.bound = Bound::Above;
                return err;
            }
            ++m.cellPtr;
            break;
        case insType::PTR_DEC:
            if (m.cellPtr == 0) {
                err.kind = ErrorKind::PointerOutOfBounds;
                err.position = m.insPtr;
                err.bound = Bound::Below;
                return err;
            }
            --m.cellPtr;
            break;
        case insType::ADD:
            ++m.cells[m.cellPtr];
            break;
        case insType::SUB:
            --m.cells[m.cellPtr];
            break;
        case insType::JMP_BEG:
            m.jumpStack.push_back(m.insPtr);
            break;
        case insType::JMP_END: {
            if (m.jumpStack.empty()) {
                err.kind = ErrorKind::UnmatchedLoopEnd;
                err.position = m.insPtr;
                return err;
            }
            const size_t begin = m.jumpStack.back();
            m.jumpStack.pop_back();
            // Resume at the '[' itself so the loop entry is pushed again.
            if (m.cells[m.cellPtr]) {
                m.insPtr = begin;
                return err;
            }
            break;
        }
        case insType::RAD_CHR: {
            const auto ch = m.in.get();
            if (ch == std::istream::traits_type::eof()) {
                err.kind = ErrorKind::NoInput;
                err.position = m.insPtr;
                return err;
            }
            m.cells[m.cellPtr] = static_cast<uint8_t>(ch);
            break;
        }
        case insType::PUT_CHR:
            m.out.put(static_cast<char>(m.cells[m.cellPtr]));
            break;
        case insType::NOP:
            break;
    }
    ++m.insPtr;
    return err;
}

ExecError tapevm::run(Machine& m, ProfileInfo* profile) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    ExecError err;
    while (!m.finished()) {
        err = step(m);
        if (err) break;
        if (profile) ++profile->instructions;
    }
    if (!err && !m.jumpStack.empty()) {
        err.kind = ErrorKind::UnmatchedLoopBegin;
        err.openLoops = m.jumpStack;
    }
    m.out.flush();
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return err;
}

std::string tapevm::describe(const ExecError& err) {
    std::ostringstream msg;
    switch (err.kind) {
        case ErrorKind::None:
            msg << "No error";
            break;
        case ErrorKind::UnmatchedLoopBegin: {
            msg << "The '['s at these indices are unmatched: [";
            for (size_t i = 0; i < err.openLoops.size(); ++i) {
                if (i) msg << ", ";
                msg << err.openLoops[i];
            }
            msg << ']';
            break;
        }
        case ErrorKind::UnmatchedLoopEnd:
            msg << "Unmatched ']' at character " << err.position;
            break;
        case ErrorKind::PointerOutOfBounds:
            msg << "Cell pointer moved "
                << (err.bound == Bound::Below ? "before start" : "beyond end")
                << " at character " << err.position;
            break;
        case ErrorKind::NoInput:
            msg << "No input given at character " << err.position;
            break;
    }
    return msg.str();
}
