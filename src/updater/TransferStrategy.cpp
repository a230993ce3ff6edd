#include "TransferStrategy.hpp"

namespace updater
{

float toPercentage(std::uint64_t bytesNow, std::uint64_t bytesTotal)
{
    if (bytesTotal == 0)
    {
        return 0.0f;
    }
    if (bytesNow >= bytesTotal)
    {
        return 100.0f;
    }
    return static_cast<float>(static_cast<double>(bytesNow) / static_cast<double>(bytesTotal) * 100.0);
}

UpdateError transferErrorFromResponse(const utils::HttpResponse& response)
{
    if (response.transport_error == utils::TransportError::Timeout)
    {
        return UpdateError(UpdateErrorKind::Timeout, messages::kTimeout, response.error, 0);
    }

    if (!response.error.empty())
    {
        return UpdateError(UpdateErrorKind::Network, messages::kNetworkError, response.error, 0);
    }

    return UpdateError(UpdateErrorKind::HttpStatus,
                       "Download failed (Status: " + std::to_string(response.status_code) + ")",
                       "HTTP error " + std::to_string(response.status_code), response.status_code);
}

} // namespace updater
