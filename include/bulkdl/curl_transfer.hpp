#pragma once

#include "http_client.hpp"
#include "transfer.hpp"

#include <memory>

namespace bulkdl {

// Streams one GET response body to output_dir/<resolved name> through the shared client.
class CurlTransfer final : public Transfer {
public:
    explicit CurlTransfer(std::shared_ptr<const HttpClient> client);
    ~CurlTransfer() override;

    TransferResult fetch(const Task& task, ProgressSink& sink) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulkdl
