#include "sandbox/sandbox_executor.hpp"

#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace kestrel::sandbox {
namespace bp = boost::process::v1;
namespace {

bool WaitFor(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
             const SandboxExecutor::StopPredicate& should_stop, bool& stopped) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        if (should_stop && should_stop()) {
            stopped = true;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

// The shell leads its own process group, so signalling -pid reaches every
// command it started.
void Terminate(pid_t pid, int& status, bool& finished) {
    ::kill(-pid, SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < grace_deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid || waited < 0) {
            finished = waited == pid;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, &status, 0);
}

std::vector<std::string> SplitSegments(const std::string& command) {
    std::vector<std::string> segments;
    std::string current;
    for (const char c : command) {
        if (c == ';' || c == '|' || c == '&' || c == '\n' || c == '(' || c == ')' || c == '`') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);
    return segments;
}

std::vector<std::string> SplitWords(const std::string& segment) {
    std::vector<std::string> words;
    std::istringstream stream(segment);
    std::string word;
    while (stream >> word) {
        word.erase(std::remove(word.begin(), word.end(), '\''), word.end());
        word.erase(std::remove(word.begin(), word.end(), '"'), word.end());
        if (!word.empty()) {
            words.push_back(word);
        }
    }
    return words;
}

std::string ProgramName(const std::string& word) {
    const auto slash = word.rfind('/');
    return slash == std::string::npos ? word : word.substr(slash + 1);
}

bool IsRecursiveRm(const std::vector<std::string>& args) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--") {
            return false;
        }
        if (arg == "--recursive") {
            return true;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-' &&
            arg.find_first_of("rR") != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool IsDeletingFind(const std::vector<std::string>& args) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "-delete") {
            return true;
        }
        if ((args[i] == "-exec" || args[i] == "-execdir") && i + 1 < args.size() &&
            ProgramName(args[i + 1]) == "rm") {
            return true;
        }
    }
    return false;
}

// Inspects each simple command by its program name.
std::optional<std::string> CheckProgram(const std::vector<std::string>& words) {
    std::size_t start = 0;
    while (start < words.size() && (words[start] == "sudo" || words[start] == "env" ||
                                    words[start] == "nohup" || words[start] == "exec" ||
                                    words[start].find('=') != std::string::npos)) {
        ++start;
    }
    if (start >= words.size()) {
        return std::nullopt;
    }
    const std::vector<std::string> args(words.begin() + static_cast<std::ptrdiff_t>(start), words.end());
    const auto program = ProgramName(args.front());
    if (program == "kill" || program == "killall" || program == "pkill") {
        return program;
    }
    if (program == "rm" && IsRecursiveRm(args)) {
        return std::string("rm -r");
    }
    if (program == "find" && IsDeletingFind(args)) {
        return std::string("find -delete");
    }
    if (program == "shutdown" || program == "reboot" || program == "poweroff" || program == "halt") {
        return program;
    }
    if (program.rfind("mkfs", 0) == 0) {
        return std::string("mkfs");
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> SandboxExecutor::CheckCommandPolicy(const std::string& command) {
    for (const auto& segment : SplitSegments(command)) {
        if (auto matched = CheckProgram(SplitWords(segment))) {
            return matched;
        }
    }
    static const std::vector<std::string> kBlockedTokens = {
        "dd if=",
        ":(){:|:&};:",
        "sudo ",
        "chmod 777",
        "chown",
        "curl | sh",
        "wget | sh"
    };
    for (const auto& token : kBlockedTokens) {
        if (command.find(token) != std::string::npos) {
            return token;
        }
    }
    return std::nullopt;
}

ExecResult SandboxExecutor::Run(const std::string& command,
                                const std::string& working_dir,
                                std::chrono::seconds timeout,
                                const StopPredicate& should_stop) {
    ExecResult result{};
    if (const auto token = CheckCommandPolicy(command)) {
        result.blocked = true;
        result.output = "Error: command blocked by policy (" + *token + ")";
        utils::LogWarn("exec", "blocked", {{"pattern", *token}});
        return result;
    }
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1));
    const auto stdout_path = std::filesystem::temp_directory_path() / ("kestrel_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("kestrel_stderr_" + stamp + ".log");

    bp::environment env = boost::this_process::environment();

    try {
        bp::child child_process(
            "/bin/sh",
            "-c",
            command,
            env,
            bp::start_dir=working_dir,
            bp::std_in.close(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });

        const pid_t pid = child_process.id();
        int status = 0;
        bool stopped = false;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = WaitFor(pid, status, deadline, should_stop, stopped);
        if (!finished) {
            if (stopped) {
                result.stopped = true;
            } else {
                result.timed_out = true;
            }
            Terminate(pid, status, finished);
        }
        // The pid is reaped above; keep boost from waiting on it again.
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else if (result.exit_code == -1) {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
        utils::LogError("exec", "spawn failed", {{"error", ex.what()}});
    }

    std::ostringstream output_stream;
    std::ostringstream error_stream;
    auto read_file = [](const std::filesystem::path& path, std::ostringstream& target) {
        std::ifstream input(path);
        if (!input.is_open()) {
            return;
        }
        target << input.rdbuf();
    };
    read_file(stdout_path, output_stream);
    read_file(stderr_path, error_stream);
    result.output = output_stream.str();
    result.error += error_stream.str();

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace kestrel::sandbox
