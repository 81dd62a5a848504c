#include "lanshare/core/shared_path.hpp"

namespace lanshare {

namespace fs = std::filesystem;

Outcome<std::string> normalize_shared_path(const std::string& relative) {
    if (relative.empty()) {
        return Fail<std::string>(ErrorCode::Forbidden, "Empty path");
    }
    if (relative.find('\0') != std::string::npos) {
        return Fail<std::string>(ErrorCode::Forbidden, "Path contains NUL");
    }

    const fs::path requested(relative);
    if (requested.is_absolute() || requested.has_root_directory() || requested.has_root_name()) {
        return Fail<std::string>(ErrorCode::Forbidden, "Absolute path rejected: " + relative);
    }

    const fs::path normal = requested.lexically_normal();
    for (const auto& part : normal) {
        if (part == "..") {
            return Fail<std::string>(ErrorCode::Forbidden, "Path escapes the shared root: " + relative);
        }
    }

    std::string generic = normal.generic_string();
    while (!generic.empty() && generic.back() == '/') {
        generic.pop_back();
    }
    if (generic.empty() || generic == ".") {
        return Fail<std::string>(ErrorCode::Forbidden, "Path names the shared root itself: " + relative);
    }
    return Ok(std::move(generic));
}

Outcome<fs::path> resolve_shared_path(const fs::path& root, const std::string& relative) {
    auto normal = normalize_shared_path(relative);
    if (normal.is_error()) {
        return Err<fs::path>(normal.error());
    }
    return Ok(root / fs::path(normal.value()));
}

} // namespace lanshare
