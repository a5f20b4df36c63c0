#include "path_validator.hpp"
#include "gate_error.hpp"
#include <glob.h>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace urgate {

namespace {

struct GlobGuard {
    glob_t result{};
    ~GlobGuard() { globfree(&result); }
};

std::string escape_glob(const std::string& literal) {
    std::string out;
    for (char c : literal) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

GateError violation(const std::string& subject, const std::string& detail) {
    return GateError(GateErrorCode::ConfinementViolation, detail, GateError::kNoPosition, subject);
}

} // namespace

PathValidator::PathValidator(const std::string& restricted_root, size_t max_glob_matches, bool verbose)
    : root_(restricted_root),
      root_slash_(restricted_root == "/" ? restricted_root : restricted_root + "/"),
      max_glob_matches_(max_glob_matches),
      verbose_(verbose) {
}

SafePath PathValidator::validate(const std::string& candidate) const {
    return confine(candidate, true);
}

SafePath PathValidator::validate_option_value(const std::string& value) const {
    return confine(value, false);
}

SafePath PathValidator::confine(const std::string& candidate, bool anchor_absolute) const {
    if (candidate.empty()) {
        throw violation(candidate, "empty path");
    }
    // Cheap first filter, before anything touches the filesystem
    if (has_dot_dot_component(candidate)) {
        throw violation(candidate, "parent reference in " + candidate);
    }

    std::string collapsed = collapse_separators(candidate);
    std::string anchored;
    if (collapsed.front() == '/') {
        anchored = (anchor_absolute && root_ != "/") ? root_ + collapsed : collapsed;
    } else {
        anchored = root_slash_ + collapsed;
    }

    std::string body = fs::path(anchored).lexically_normal().string();
    while (body.size() > 1 && body.back() == '/') {
        body.pop_back();
    }

    std::string resolved = resolve(body);
    if (!is_within(resolved, root_)) {
        throw violation(candidate, candidate + " resolves to " + resolved + " outside " + root_);
    }

    // Forwarded text keeps its "." components ("dir/.", the --relative "/./"
    // anchor); only the resolution key is normalized
    SafePath safe;
    safe.resolved = resolved;
    safe.forwarded = collapsed;
    if (anchor_absolute && safe.forwarded.front() == '/') {
        safe.forwarded.erase(0, 1);
        if (safe.forwarded.empty()) {
            safe.forwarded = ".";
        }
    }

    log(candidate + " -> " + safe.forwarded + " (" + safe.resolved + ")");
    return safe;
}

std::string PathValidator::resolve(const std::string& absolute_path) const {
    std::vector<fs::path> missing;
    fs::path current(absolute_path);
    std::error_code ec;

    while (true) {
        fs::file_status st = fs::symlink_status(current, ec);
        if (st.type() == fs::file_type::not_found) {
            fs::path parent = current.parent_path();
            if (parent == current || parent.empty()) {
                throw violation(absolute_path, "no existing ancestor for " + absolute_path);
            }
            missing.push_back(current.filename());
            current = parent;
            continue;
        }
        if (st.type() == fs::file_type::none) {
            throw violation(absolute_path, "cannot inspect " + current.string() + ": " + ec.message());
        }
        if (st.type() == fs::file_type::symlink) {
            fs::file_status target = fs::status(current, ec);
            if (target.type() == fs::file_type::not_found || target.type() == fs::file_type::none) {
                throw violation(absolute_path, "dangling symbolic link " + current.string());
            }
        }
        break;
    }

    fs::path canonical = fs::canonical(current, ec);
    if (ec) {
        throw violation(absolute_path, "cannot canonicalize " + current.string() + ": " + ec.message());
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        canonical /= *it;
    }
    return canonical.string();
}

std::vector<std::string> PathValidator::expand_glob(const std::string& raw_pattern,
                                                    const std::string& literal) const {
    if (!has_glob_meta(raw_pattern)) {
        return {literal};
    }
    if (has_dot_dot_component(literal)) {
        throw violation(literal, "parent reference in " + literal);
    }

    std::string relative = collapse_separators(raw_pattern);
    if (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    std::string pattern = escape_glob(root_slash_) + relative;

    GlobGuard guard;
    int rc = ::glob(pattern.c_str(), 0, nullptr, &guard.result);
    if (rc == GLOB_NOMATCH || rc == GLOB_ABORTED) {
        return {literal};
    }
    if (rc != 0) {
        throw violation(literal, "wildcard expansion failed for " + literal);
    }
    if (guard.result.gl_pathc > max_glob_matches_) {
        throw GateError(GateErrorCode::MalformedSyntax,
                        "wildcard " + literal + " expands beyond " + std::to_string(max_glob_matches_) + " entries",
                        GateError::kNoPosition, literal);
    }

    std::vector<std::string> matches;
    matches.reserve(guard.result.gl_pathc);
    for (size_t i = 0; i < guard.result.gl_pathc; ++i) {
        matches.push_back(strip_root(guard.result.gl_pathv[i]));
    }
    log(literal + " expanded to " + std::to_string(matches.size()) + " entries");
    return matches;
}

bool PathValidator::has_dot_dot_component(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (path.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

std::string PathValidator::collapse_separators(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

bool PathValidator::is_within(const std::string& canonical_path, const std::string& canonical_root) {
    if (canonical_root == "/") {
        return !canonical_path.empty() && canonical_path.front() == '/';
    }
    if (canonical_path == canonical_root) {
        return true;
    }
    return canonical_path.size() > canonical_root.size()
        && canonical_path.compare(0, canonical_root.size(), canonical_root) == 0
        && canonical_path[canonical_root.size()] == '/';
}

bool PathValidator::has_glob_meta(const std::string& raw) {
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\') {
            ++i;
            continue;
        }
        if (raw[i] == '*' || raw[i] == '?' || raw[i] == '[') {
            return true;
        }
    }
    return false;
}

std::string PathValidator::strip_root(const std::string& anchored) const {
    if (anchored == root_) {
        return ".";
    }
    if (anchored.compare(0, root_slash_.size(), root_slash_) == 0) {
        std::string rest = anchored.substr(root_slash_.size());
        return rest.empty() ? "." : rest;
    }
    return anchored;
}

void PathValidator::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[PathValidator] " << message << std::endl;
    }
}

} // namespace urgate
