/*
    Tapevm - A bounds-checked brainfuck interpreter
    Instruction decoder
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/decoder.hxx"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "vm.hxx"

namespace {
using tapevm::insType;

constexpr std::array<insType, 256> decodeTable = []() {
    std::array<insType, 256> table{};
    table.fill(insType::NOP);
    table[static_cast<unsigned char>('>')] = insType::PTR_INC;
    table[static_cast<unsigned char>('<')] = insType::PTR_DEC;
    table[static_cast<unsigned char>('+')] = insType::ADD;
    table[static_cast<unsigned char>('-')] = insType::SUB;
    table[static_cast<unsigned char>('[')] = insType::JMP_BEG;
    table[static_cast<unsigned char>(']')] = insType::JMP_END;
    table[static_cast<unsigned char>(',')] = insType::RAD_CHR;
    table[static_cast<unsigned char>('.')] = insType::PUT_CHR;
    return table;
}();
}  // namespace

tapevm::insType tapevm::decode(uint8_t byte) { return decodeTable[byte]; }

std::vector<tapevm::insType> tapevm::decodeProgram(std::string_view source) {
    std::vector<insType> program;
    program.reserve(source.size());
    for (const char c : source) program.push_back(decode(static_cast<uint8_t>(c)));
    return program;
}

char tapevm::encode(insType op) {
    switch (op) {
        case insType::PTR_INC:
            return '>';
        case insType::PTR_DEC:
            return '<';
        case insType::ADD:
            return '+';
        case insType::SUB:
            return '-';
        case insType::JMP_BEG:
            return '[';
        case insType::JMP_END:
            return ']';
        case insType::RAD_CHR:
            return ',';
        case insType::PUT_CHR:
            return '.';
        case insType::NOP:
            break;
    }
    return ' ';
}
