#include "escrow/registry/allowlist_registry.hpp"
#include "escrow/domain/engine_error.hpp"

namespace escrow {

namespace {

void requireAsset(const domain::AssetId& asset) {
  if (domain::isNull(asset)) {
    throw EngineError(ErrorKind::Validation, "Invalid asset id");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate and de-duplicate the initial list
// -----------------------------------------------------------------------------
AllowlistRegistry::AllowlistRegistry(
    const std::vector<domain::AssetId>& initial) {
  if (initial.empty()) {
    throw EngineError(ErrorKind::Validation, "Must specify allowed assets");
  }
  for (const auto& asset : initial) {
    requireAsset(asset);
    assets_.insert(asset);
  }
}

bool AllowlistRegistry::isAllowed(const domain::AssetId& asset) const {
  return assets_.contains(asset);
}

const std::vector<domain::AssetId>& AllowlistRegistry::list() const {
  return assets_.values();
}

std::size_t AllowlistRegistry::count() const { return assets_.size(); }

bool AllowlistRegistry::add(const domain::AssetId& asset) {
  requireAsset(asset);
  return assets_.insert(asset);
}

bool AllowlistRegistry::remove(const domain::AssetId& asset) {
  requireAsset(asset);
  return assets_.erase(asset);
}

// -----------------------------------------------------------------------------
// update: validate the whole batch, then apply entry by entry
// -----------------------------------------------------------------------------
std::vector<AllowlistRegistry::Change> AllowlistRegistry::update(
    const std::vector<domain::AssetId>& assets,
    const std::vector<bool>& allowed, std::size_t max_batch) {
  if (assets.size() != allowed.size()) {
    throw EngineError(ErrorKind::Validation, "Arrays length mismatch");
  }
  if (assets.empty()) {
    throw EngineError(ErrorKind::Validation, "Empty arrays");
  }
  if (assets.size() > max_batch) {
    throw EngineError(ErrorKind::Validation, "Batch too large");
  }
  for (const auto& asset : assets) {
    requireAsset(asset);
  }

  std::vector<Change> changes;
  for (std::size_t i = 0; i < assets.size(); ++i) {
    const bool changed =
        allowed[i] ? assets_.insert(assets[i]) : assets_.erase(assets[i]);
    if (changed) {
      changes.emplace_back(assets[i], allowed[i]);
    }
  }
  return changes;
}

}  // namespace escrow
