/*
    Tapevm - A bounds-checked brainfuck interpreter
    Static loop validation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <utility>
#include <vector>

#include "vm.hxx"

// Every backward jump re-enters a balanced '[' ... ']' span, so the stack depth at each
// position is the same on every pass and a single linear scan finds the runtime's error.
tapevm::ExecError tapevm::checkLoops(const std::vector<insType>& program) {
    ExecError err;
    std::vector<size_t> stack;
    for (size_t i = 0; i < program.size(); ++i) {
        if (program[i] == insType::JMP_BEG) {
            stack.push_back(i);
        } else if (program[i] == insType::JMP_END) {
            if (stack.empty()) {
                err.kind = ErrorKind::UnmatchedLoopEnd;
                err.position = i;
                return err;
            }
            stack.pop_back();
        }
    }
    if (!stack.empty()) {
        err.kind = ErrorKind::UnmatchedLoopBegin;
        err.openLoops = std::move(stack);
    }
    return err;
}
