#include "test_support.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace urgate {
namespace test {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "urgate-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    path_ = fs::canonical(buffer.data()).string();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string TempDir::make_dir(const std::string& relative) const {
    fs::path p = fs::path(path_) / relative;
    fs::create_directories(p);
    return p.string();
}

std::string TempDir::make_file(const std::string& relative, const std::string& content) const {
    fs::path p = fs::path(path_) / relative;
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    out << content;
    return p.string();
}

std::string TempDir::make_symlink(const std::string& relative, const std::string& target) const {
    fs::path p = fs::path(path_) / relative;
    fs::create_directories(p.parent_path());
    fs::create_symlink(target, p);
    return p.string();
}

SessionContext make_session(const std::string& root, bool read_only, bool write_only, bool no_lock) {
    SessionOptions options;
    options.read_only = read_only;
    options.write_only = write_only;
    options.no_lock = no_lock;
    options.restricted_root = root;
    return SessionContext::resolve(options);
}

} // namespace test
} // namespace urgate
