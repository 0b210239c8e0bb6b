#pragma once

#include <string>
#include <string_view>

namespace edashell {
namespace core {

/**
 * @brief Rewrites drive-letter paths ("D:\work\top.v") to the mount-point
 *        form seen inside the bridged environment ("/mnt/d/work/top.v")
 *        and back. Purely syntactic; never touches the filesystem.
 */
class PathTranslator {
public:
    explicit PathTranslator(std::string mountRoot = "/mnt");

    /// "D:\a\b" -> "<mountRoot>/d/a/b". Throws ToolError(UnsupportedPath).
    std::string to_foreign(std::string_view nativePath) const;

    /// "<mountRoot>/d/a/b" -> "D:\a\b". Throws ToolError(UnsupportedPath).
    std::string to_native(std::string_view foreignPath) const;

    /// True for absolute drive paths: a letter, ':', then nothing or a separator.
    static bool is_drive_path(std::string_view path) noexcept;

    const std::string& mount_root() const noexcept { return mountRoot_; }

private:
    std::string mountRoot_;
};

} // namespace core
} // namespace edashell
