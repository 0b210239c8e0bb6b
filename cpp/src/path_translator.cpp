#include "edashell/path_translator.hpp"
#include "edashell/errors.hpp"

#include <utility>

namespace edashell {
namespace core {

namespace {

bool is_ascii_letter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char to_lower_ascii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

char to_upper_ascii(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

[[noreturn]] void unsupported(std::string_view path, const char* why) {
    throw ToolError(ErrorKind::UnsupportedPath,
                    std::string("unsupported path '") + std::string(path) + "': " + why,
                    std::string(path));
}

} // namespace

PathTranslator::PathTranslator(std::string mountRoot) : mountRoot_(std::move(mountRoot)) {
    // "/mnt/" and "/mnt" are the same root; "" and "/" both mean drives sit at "/<letter>".
    while (!mountRoot_.empty() && mountRoot_.back() == '/') mountRoot_.pop_back();
}

bool PathTranslator::is_drive_path(std::string_view path) noexcept {
    if (path.size() < 2 || !is_ascii_letter(path[0]) || path[1] != ':') return false;
    return path.size() == 2 || path[2] == '\\' || path[2] == '/';
}

std::string PathTranslator::to_foreign(std::string_view nativePath) const {
    if (nativePath.empty()) unsupported(nativePath, "empty path");
    if (nativePath.size() >= 2 && (nativePath[0] == '\\' || nativePath[0] == '/')
        && (nativePath[1] == '\\' || nativePath[1] == '/')) {
        unsupported(nativePath, "network paths have no mount point");
    }
    if (nativePath.size() < 2 || nativePath[1] != ':') {
        unsupported(nativePath, "no volume designator");
    }
    if (!is_ascii_letter(nativePath[0])) {
        unsupported(nativePath, "volume designator is not a drive letter");
    }
    if (!is_drive_path(nativePath)) {
        unsupported(nativePath, "drive-relative paths cannot be mapped");
    }

    std::string out;
    out.reserve(mountRoot_.size() + nativePath.size() + 2);
    out += mountRoot_;
    out.push_back('/');
    out.push_back(to_lower_ascii(nativePath[0]));
    for (size_t i = 2; i < nativePath.size(); ++i) {
        const char c = nativePath[i];
        out.push_back(c == '\\' ? '/' : c);
    }
    return out;
}

std::string PathTranslator::to_native(std::string_view foreignPath) const {
    const std::string prefix = mountRoot_ + "/";
    if (foreignPath.size() < prefix.size() + 1
        || foreignPath.compare(0, prefix.size(), prefix) != 0) {
        unsupported(foreignPath, "outside the mount root");
    }

    const char drive = foreignPath[prefix.size()];
    if (!is_ascii_letter(drive)) {
        unsupported(foreignPath, "mount entry is not a drive letter");
    }
    const size_t rest = prefix.size() + 1;
    if (rest < foreignPath.size() && foreignPath[rest] != '/') {
        unsupported(foreignPath, "mount entry is not a drive letter");
    }

    std::string out;
    out.reserve(foreignPath.size());
    out.push_back(to_upper_ascii(drive));
    out.push_back(':');
    for (size_t i = rest; i < foreignPath.size(); ++i) {
        const char c = foreignPath[i];
        out.push_back(c == '/' ? '\\' : c);
    }
    return out;
}

} // namespace core
} // namespace edashell
