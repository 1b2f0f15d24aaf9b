// Spawns the interpreter directly (no shell) and captures stdout and stderr through a pipe.
// stdin is bound to /dev/null so reads see end of input.

#include <array>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

struct CliResult {
    std::string out;
    int status;
};

static CliResult run_cli(const std::vector<std::string>& extra) {
    std::vector<std::string> args{TAPEVM_EXE_PATH};
    args.insert(args.end(), extra.begin(), extra.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int pipefd[2];
    int rc = pipe(pipefd);
    assert(rc == 0);
    (void)rc;
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(pipefd[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }
    close(pipefd[1]);
    std::array<char, 256> buf{};
    std::string out;
    ssize_t n;
    while ((n = read(pipefd[0], buf.data(), buf.size())) > 0) {
        out.append(buf.data(), static_cast<size_t>(n));
    }
    close(pipefd[0]);
    int status = 0;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    return {out, WEXITSTATUS(status)};
}

static const std::string kDone = "\nSuccessfully completed program\n";

static void test_inline_success() {
    const std::string helloA = "++++++++[>++++++++<-]>+.";  // prints 'A'
    CliResult r = run_cli({"-e", helloA});
    assert(r.status == 0);
    assert(r.out == "A" + kDone);
}

static void test_empty_inline_program() {
    CliResult r = run_cli({"-e", ""});
    assert(r.status == 0);
    assert(r.out == kDone);

    const char* fname = "cli_empty.bf";
    { std::ofstream f(fname); }
    r = run_cli({fname});
    assert(r.status == 0);
    assert(r.out == kDone);
    std::remove(fname);
}

static void test_file_success() {
    const char* fname = "cli_program.bf";
    {
        std::ofstream f(fname);
        f << "print a bang: +++++++++++++++++++++++++++++++++.\n";
    }
    CliResult r = run_cli({fname});
    assert(r.status == 0);
    assert(r.out == "!" + kDone);
    r = run_cli({"-i", fname});
    assert(r.status == 0);
    assert(r.out == "!" + kDone);
    std::remove(fname);
}

static void test_run_errors() {
    CliResult r = run_cli({"-e", "]"});
    assert(r.status == 1);
    assert(r.out == "\nERROR: Unmatched ']' at character 0\n");

    r = run_cli({"-e", "[["});
    assert(r.status == 1);
    assert(r.out == "\nERROR: The '['s at these indices are unmatched: [0, 1]\n");

    r = run_cli({"-e", "<"});
    assert(r.status == 1);
    assert(r.out == "\nERROR: Cell pointer moved before start at character 0\n");

    r = run_cli({"-e", ">>", "-ts", "2"});
    assert(r.status == 1);
    assert(r.out == "\nERROR: Cell pointer moved beyond end at character 1\n");

    r = run_cli({"-e", ","});
    assert(r.status == 1);
    assert(r.out == "\nERROR: No input given at character 0\n");
}

static void test_check_only() {
    CliResult r = run_cli({"-c", "-e", "+[-]]"});
    assert(r.status == 1);
    assert(r.out == "ERROR: Unmatched ']' at character 4\n");

    r = run_cli({"-c", "-e", "+[>[-]<-]"});
    assert(r.status == 0);
    assert(r.out == "No loop errors found\n");
}

static void test_missing_file() {
    CliResult r = run_cli({"-i", "nofile.bf"});
    assert(r.status == 1);
    assert(r.out.rfind("ERROR: nofile.bf: ", 0) == 0);
}

static void test_dump_and_profile() {
    CliResult r = run_cli({"-e", "++>+++<", "-dm", "--profile"});
    assert(r.status == 0);
    assert(r.out.find(kDone + "Memory dump:\n[2] 3 \n") == 0);
    assert(r.out.find("Instructions executed: 7\n") != std::string::npos);
}

static void test_bad_tape_size() {
    CliResult r = run_cli({"-ts", "0", "-e", "+"});
    assert(r.status == 0);
    assert(r.out.find("Tape size must be a positive integer: 0") != std::string::npos);
    assert(r.out.find("Usage:") != std::string::npos);
}

int main() {
    test_inline_success();
    test_empty_inline_program();
    test_file_success();
    test_run_errors();
    test_check_only();
    test_missing_file();
    test_dump_and_profile();
    test_bad_tape_size();
    return 0;
}
