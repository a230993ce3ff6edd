#pragma once

#include "ScratchStorage.hpp"
#include "TransferStrategy.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace updater
{

// Turns the in-memory payload into the text form ScratchStorage::writeEncoded accepts
using PayloadEncoder = std::function<std::string(std::string_view)>;

// Fallback strategy: the whole body is buffered in memory, encoded, then
// written to scratch storage in one go.
class BufferedTransfer final : public ITransferStrategy
{
public:
    BufferedTransfer(std::shared_ptr<utils::IHttpClient> http, ScratchStorage storage, utils::SessionConfig session,
                     PayloadEncoder encoder = {});

    const char* name() const override { return "buffered"; }

    bool transfer(const TransferRequest& request, std::string& outLocation, UpdateError& outError) override;

private:
    std::shared_ptr<utils::IHttpClient> http_;
    ScratchStorage storage_;
    utils::SessionConfig session_;
    PayloadEncoder encoder_;
};

} // namespace updater
