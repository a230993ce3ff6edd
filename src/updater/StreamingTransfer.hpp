#pragma once

#include "ProgressEvents.hpp"
#include "ScratchStorage.hpp"
#include "TransferStrategy.hpp"

#include <memory>

namespace updater
{

// Primary strategy: the transport writes the body straight into scratch
// storage and publishes progress on the shared event registry.
class StreamingTransfer final : public ITransferStrategy
{
public:
    StreamingTransfer(std::shared_ptr<utils::IHttpClient> http, ScratchStorage storage,
                      std::shared_ptr<IProgressEvents> events, utils::SessionConfig session);

    const char* name() const override { return "streaming"; }

    bool transfer(const TransferRequest& request, std::string& outLocation, UpdateError& outError) override;

private:
    std::shared_ptr<utils::IHttpClient> http_;
    ScratchStorage storage_;
    std::shared_ptr<IProgressEvents> events_;
    utils::SessionConfig session_;
};

} // namespace updater
