#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Write a file, creating parent directories as needed
void createTestFile(const fs::path& filePath, const std::string& content);

// Scratch project directory under the system temp dir, removed on destruction
class TempProject {
public:
    explicit TempProject(const std::string& name);
    ~TempProject();

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    // Write a file relative to the project root
    void write(const std::string& relativePath, const std::string& content) const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

// n lines of "line <i>"
std::string numberedLines(size_t count);
