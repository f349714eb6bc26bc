// MINTGATE - Sale Stage Clock
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#ifndef MINTGATE_COLLECTION_STAGE_H
#define MINTGATE_COLLECTION_STAGE_H

#include <mintgate/collection/params.h>

#include <optional>
#include <string>

namespace mintgate {
namespace collection {

/// Sale phases in chronological order
enum class SaleStage {
    Idle = 0,
    PresaleOg = 1,
    PresaleWl = 2,
    PublicSale = 3,
};

const char* SaleStageToString(SaleStage stage);
std::optional<SaleStage> ParseSaleStage(const std::string& str);

/**
 * Derive the stage at time `now`.
 *
 * Checks run from the latest stage backwards, so the result is well defined
 * even when publicSaleDate precedes presaleDate. The OG window end saturates
 * instead of wrapping near the top of the timestamp range.
 */
SaleStage GetSaleStage(const CollectionConfig& config, Timestamp now);

/// True when metadata may be revealed at `now`
inline bool IsRevealed(const CollectionConfig& config, Timestamp now) {
    return now >= config.revealDate;
}

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_STAGE_H
