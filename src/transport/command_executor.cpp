#include "rft/transport/command_executor.hpp"

#include <spdlog/spdlog.h>

namespace rft::transport {

Result<void> ExecutorSession::open() {
    if (open_) {
        return Ok();
    }
    auto result = executor_->open();
    if (result.is_error()) {
        spdlog::error("Failed to open remote session: {}", result.error().message);
        return result;
    }
    open_ = true;
    spdlog::debug("Remote session opened");
    return Ok();
}

void ExecutorSession::close() {
    if (!open_) {
        return;
    }
    executor_->close();
    open_ = false;
    spdlog::debug("Remote session closed");
}

} // namespace rft::transport
