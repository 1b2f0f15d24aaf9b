/*
    Tapevm - A bounds-checked brainfuck interpreter
    Source loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <string>

namespace tapevm {

/// @brief Read the complete, unfiltered program source at `path`.
/// Every byte is kept so that instruction positions match file offsets. The path is opened
/// exactly once, so named pipes and character devices are read like regular files.
/// @return false with `err` set to the operating system's message; `out` is left unchanged.
bool loadSource(const std::string& path, std::string& out, std::string& err);

}  // namespace tapevm
