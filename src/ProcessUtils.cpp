#include "ProcessUtils.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <functional>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace ProcessUtils {

std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath,
                const std::string& inputPath) {
    const int outFd = ::open(outputPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (outFd < 0) return -1;

    int inFd = -1;
    if (!inputPath.empty()) {
        inFd = ::open(inputPath.c_str(), O_RDONLY);
        if (inFd < 0) {
            ::close(outFd);
            return -1;
        }
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outFd);
        if (inFd >= 0) ::close(inFd);
        return -1;
    }

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }

        if (::dup2(outFd, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::close(outFd);
        if (inFd >= 0) {
            if (::dup2(inFd, STDIN_FILENO) < 0) {
                _exit(127);
            }
            ::close(inFd);
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(outFd);
    if (inFd >= 0) ::close(inFd);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string makeTempPath(const std::string& stem, const std::string& extension) {
    static std::atomic<unsigned long long> counter{0};
    const unsigned long long seq = counter.fetch_add(1);
    const std::string seed = stem + std::to_string(static_cast<long long>(::getpid())) +
                             std::to_string(static_cast<long long>(std::time(nullptr))) + std::to_string(seq);
    const auto hashed = static_cast<unsigned long long>(std::hash<std::string>{}(seed));
    const std::filesystem::path p = std::filesystem::temp_directory_path() /
                                    ("tabula_" + stem + "_" + std::to_string(hashed) + "_" + std::to_string(seq) + extension);
    return p.string();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile() {
    remove();
}

void TempFile::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
}

} // namespace ProcessUtils
