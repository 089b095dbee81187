#pragma once

#include <string>
#include <vector>

namespace ProcessUtils {

/**
 * @brief Resolves a bare command name against PATH. Empty when not found or not executable.
 */
std::string findExecutableInPath(const std::string& command);

/**
 * @brief Runs executable with args, stdout redirected into outputPath (truncated).
 * @param inputPath when non-empty, becomes the child's stdin.
 * @return child exit status, -1 when the child could not be started or did not exit normally.
 * @details stderr of the child is discarded.
 */
int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath,
                const std::string& inputPath = std::string());

/**
 * @brief Unique path in the system temp directory; the file is not created.
 */
std::string makeTempPath(const std::string& stem, const std::string& extension);

// Removes the file on destruction unless released.
class TempFile {
public:
    TempFile() = default;
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    const std::string& path() const noexcept { return path_; }
    bool empty() const noexcept { return path_.empty(); }

private:
    void remove() noexcept;
    std::string path_;
};

} // namespace ProcessUtils
