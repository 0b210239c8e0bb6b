#pragma once

#include <string>
#include <utility>

namespace edashell {
namespace core {

/**
 * @brief A resolved tool executable. Produced by ToolLocator; never changes
 *        afterwards.
 */
class ToolHandle {
public:
    ToolHandle(std::string executable, bool requiresBridge, bool verified)
        : executable_(std::move(executable)),
          requiresBridge_(requiresBridge),
          verified_(verified) {}

    const std::string& executable() const noexcept { return executable_; }
    bool requires_bridge() const noexcept { return requiresBridge_; }
    bool verified() const noexcept { return verified_; }

private:
    std::string executable_;
    bool requiresBridge_;
    bool verified_;
};

} // namespace core
} // namespace edashell
