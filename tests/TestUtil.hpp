// Helpers shared by the unit tests: scratch directories and small file I/O.
#pragma once
#include <string>

namespace openxfer {
namespace test {

// Fresh directory under the system temp dir, removed recursively on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& rel) const { return path_ + "/" + rel; }

private:
    std::string path_;
};

void writeFile(const std::string& path, const std::string& content);
std::string readFile(const std::string& path);
bool fileExists(const std::string& path);
// Regular files directly inside dir.
int countFiles(const std::string& dir);

} // namespace test
} // namespace openxfer
