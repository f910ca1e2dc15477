#pragma once

#include "download_task.hpp"
#include "http_transport.hpp"
#include "transfer_job.hpp"

#include <memory>

namespace rangeget {

// Downloads one resource with parallel range requests, falling back to a
// single sequential request when the server does not accept ranges.
class RangeDownloader final : public DownloadTask {
public:
    explicit RangeDownloader(TransferJob job, ProgressObserver observer = {});
    RangeDownloader(TransferJob job, HttpTransportPtr transport, ProgressObserver observer = {});
    ~RangeDownloader() override;

    TransferResult run() override;
    void cancel() override;

    [[nodiscard]] Progress getProgress() const override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool hasError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangeget
