/*
    Tapevm - A bounds-checked brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ansi.hxx"
#include "loader.hxx"
#include "vm.hxx"

namespace {
struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    bool dumpMemory = false;
    bool checkOnly = false;
    bool help = false;
    bool profile = false;
    std::size_t tapeSize = TAPEVM_TAPE_SIZE;
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.hasEval = true;
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc && !args.hasEval) {
            args.filename = argv[++i];
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-c") {
            args.checkOnly = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                std::cerr << "Tape size must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.tapeSize = static_cast<std::size_t>(parsed);
            }
        } else if (!arg.empty() && arg[0] != '-' && !args.hasEval &&
                   args.filename.empty()) {
            args.filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.help = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [file]\n"
              << "Options:\n"
              << "  -e <code>        Execute Brainfuck code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -c               Check loop brackets without running\n"
              << "  -dm              Dump memory after program\n"
              << "  -ts <size>       Tape size in cells (default " << TAPEVM_TAPE_SIZE << ")\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void reportError(std::string_view msg) {
    const bool color = tapevm::ansi::enabled(stderr);
    std::cerr << tapevm::ansi::paint(tapevm::ansi::red, color) << "ERROR:"
              << tapevm::ansi::paint(tapevm::ansi::reset, color) << ' ' << msg << std::endl;
}

void dumpMemory(const std::vector<uint8_t>& cells, size_t cellPtr) {
    if (cells.empty()) {
        std::cout << "Memory dump:\n<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    std::cout << "Memory dump:" << std::endl;
    for (size_t i = 0; i <= lastNonEmpty; ++i) {
        if (i == cellPtr) std::cout << '[';
        std::cout << +cells[i];
        if (i == cellPtr) std::cout << ']';
        std::cout << (i % 10 == 9 ? '\n' : ' ');
    }
    if (lastNonEmpty % 10 != 9) std::cout << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.tapeSize > TAPEVM_TAPE_MAX_BYTES) {
        reportError("Requested tape exceeds maximum allowed size (" +
                    std::to_string(TAPEVM_TAPE_MAX_BYTES >> 20) + " MiB)");
        return 1;
    }
    if (opts.tapeSize > TAPEVM_TAPE_WARN_BYTES) {
        const bool color = tapevm::ansi::enabled(stderr);
        std::cerr << tapevm::ansi::paint(tapevm::ansi::yellow, color) << "WARNING:"
                  << tapevm::ansi::paint(tapevm::ansi::reset, color) << " Tape allocation ~"
                  << (opts.tapeSize >> 20) << " MiB may exceed system memory" << std::endl;
    }
    if (opts.filename.empty() && !opts.hasEval) {
        std::cerr << "No program given; use -i <file> or -e <code>" << std::endl;
        printHelp(argv[0]);
        return 1;
    }

    std::string source;
    if (opts.hasEval) {
        source = opts.evalCode;
    } else {
        std::string err;
        if (!tapevm::loadSource(opts.filename, source, err)) {
            reportError(opts.filename + ": " + err);
            return 1;
        }
    }

    std::vector<tapevm::insType> program = tapevm::decodeProgram(source);
    if (opts.checkOnly) {
        tapevm::ExecError err = tapevm::checkLoops(program);
        if (err) {
            reportError(tapevm::describe(err));
            return 1;
        }
        std::cout << "No loop errors found" << std::endl;
        return 0;
    }

    tapevm::Machine machine(std::move(program), opts.tapeSize);
    tapevm::ProfileInfo prof;
    tapevm::ExecError err = tapevm::run(machine, opts.profile ? &prof : nullptr);
    if (err) {
        std::cout << std::endl;
        reportError(tapevm::describe(err));
    } else {
        const bool color = tapevm::ansi::enabled(stdout);
        std::cout << '\n'
                  << tapevm::ansi::paint(tapevm::ansi::green, color)
                  << "Successfully completed program" << tapevm::ansi::paint(tapevm::ansi::reset, color)
                  << std::endl;
    }
    if (opts.dumpMemory) dumpMemory(machine.cells, machine.cellPtr);
    if (opts.profile) {
        std::cout << "Instructions executed: " << prof.instructions << std::endl;
        std::cout << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return err ? 1 : 0;
}
