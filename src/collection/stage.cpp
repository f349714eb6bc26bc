// MINTGATE - Sale Stage Clock Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/stage.h>

#include <algorithm>
#include <cctype>

namespace mintgate {
namespace collection {

const char* SaleStageToString(SaleStage stage) {
    switch (stage) {
        case SaleStage::Idle: return "Idle";
        case SaleStage::PresaleOg: return "PresaleOg";
        case SaleStage::PresaleWl: return "PresaleWl";
        case SaleStage::PublicSale: return "PublicSale";
        default: return "Unknown";
    }
}

std::optional<SaleStage> ParseSaleStage(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "idle") return SaleStage::Idle;
    if (lower == "presaleog") return SaleStage::PresaleOg;
    if (lower == "presalewl") return SaleStage::PresaleWl;
    if (lower == "publicsale") return SaleStage::PublicSale;
    return std::nullopt;
}

SaleStage GetSaleStage(const CollectionConfig& config, Timestamp now) {
    if (now >= config.publicSaleDate) {
        return SaleStage::PublicSale;
    }
    if (now >= SaturatingAdd(config.presaleDate, PRESALE_INTERVAL)) {
        return SaleStage::PresaleWl;
    }
    if (now >= config.presaleDate) {
        return SaleStage::PresaleOg;
    }
    return SaleStage::Idle;
}

} // namespace collection
} // namespace mintgate
