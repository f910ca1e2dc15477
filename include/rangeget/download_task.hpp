#pragma once

#include "progress.hpp"
#include "transfer_result.hpp"

#include <memory>

namespace rangeget {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Blocks until the file is complete, the job failed or it was cancelled.
    virtual TransferResult run() = 0;
    // Safe to call from any thread, including before run().
    virtual void cancel() = 0;

    [[nodiscard]] virtual Progress getProgress() const = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool hasError() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace rangeget
