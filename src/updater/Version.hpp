#pragma once

#include "UpdateTypes.hpp"

#include <cstdint>
#include <optional>

namespace updater
{

// True only when the manifest carries a strictly higher release code.
// Equal or lower codes never count as an update.
bool isNewer(std::int64_t manifestCode, std::int64_t currentCode);

// Broadcast notifications are gated with the same comparison: a message
// addressed to a release newer than the running one stays hidden.
bool isBroadcastVisible(std::optional<std::int64_t> broadcastCode, const VersionDescriptor& current);

// Version baked into this build by the build system
VersionDescriptor currentBuildVersion();

} // namespace updater
