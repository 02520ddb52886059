#pragma once

#include "escrow/assets/i_asset_transfer.hpp"
#include "escrow/domain/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// AssetBehavior: how an asset in the AssetBook reacts to transfers
// -----------------------------------------------------------------------------
//
//   Standard    Moves exactly what was asked and reports it.
//   Paused      Every transfer throws TransferError.
//   SilentNoop  Reports full success, moves nothing.
//   Refusing    Moves nothing and reports failure (0 / false).
//   Taxed       Debits the sender in full, credits the recipient
//               amount - amount * tax_bps / 10000, reports the full amount.
//               The difference is burned.
// -----------------------------------------------------------------------------
enum class AssetBehavior {
  Standard,
  Paused,
  SilentNoop,
  Refusing,
  Taxed,
};

// Thrown by the AssetBook when a transfer is rejected outright.
class TransferError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// AssetBook: in-memory, transactional IAssetTransfer
// -----------------------------------------------------------------------------
//
// @brief  Simulated asset backend: balances and allowances per asset, with
//         per-asset adversarial behaviours and undoable units.
//
// @details
// The AssetBook stands in for a real asset backend in the executable and in
// the tests. It knows the engine's custody principal (the "operator"):
// transferIn() consumes the allowance a sender granted to the operator, the
// same way a pull transfer against an exchange contract would.
//
// Units:
//   beginUnit() pushes a snapshot of all balances and allowances onto a
//   stack. commitUnit() drops the top snapshot, abortUnit() restores it.
//   Units nest; the engine itself only ever opens one at a time.
//
// Transfer hook:
//   setTransferHook() installs a callback invoked at the start of every
//   transferIn()/transferOut(), before any value moves. Tests use it to
//   call back into the engine from inside a transfer.
//
// Thread model:
//   All state is guarded by one mutex. The transfer hook is invoked without
//   the mutex held, so it may call back into the book.
//
// Ownership:
//   Owned by main() or the test fixture and lent to SwapEngine as
//   IAssetTransfer&.
// -----------------------------------------------------------------------------
class AssetBook final : public IAssetTransfer {
 public:
  using TransferHook = std::function<void(const domain::AssetId&)>;

  explicit AssetBook(domain::PrincipalId operator_id);

  AssetBook(const AssetBook&) = delete;
  AssetBook& operator=(const AssetBook&) = delete;

  // --- Setup ----------------------------------------------------------------
  void mint(const domain::AssetId& asset, const domain::PrincipalId& owner,
            domain::Amount amount);
  void approve(const domain::AssetId& asset, const domain::PrincipalId& owner,
               const domain::PrincipalId& spender, domain::Amount amount);
  void setBehavior(const domain::AssetId& asset, AssetBehavior behavior,
                   std::uint32_t tax_bps = 0);
  void setTransferHook(TransferHook hook);

  const domain::PrincipalId& operatorId() const { return operator_id_; }

  // --- IAssetTransfer -------------------------------------------------------
  domain::Amount balanceOf(const domain::AssetId& asset,
                           const domain::PrincipalId& owner) const override;
  domain::Amount allowance(const domain::AssetId& asset,
                           const domain::PrincipalId& owner,
                           const domain::PrincipalId& spender) const override;
  domain::Amount transferIn(const domain::AssetId& asset,
                            const domain::PrincipalId& from,
                            const domain::PrincipalId& to,
                            domain::Amount amount) override;
  bool transferOut(const domain::AssetId& asset,
                   const domain::PrincipalId& from,
                   const domain::PrincipalId& to,
                   domain::Amount amount) override;

  void beginUnit() override;
  void commitUnit() override;
  void abortUnit() noexcept override;

  std::size_t openUnits() const;

 private:
  using BalanceKey = std::pair<domain::AssetId, domain::PrincipalId>;
  using AllowanceKey =
      std::tuple<domain::AssetId, domain::PrincipalId, domain::PrincipalId>;

  struct Settings {
    AssetBehavior behavior{AssetBehavior::Standard};
    std::uint32_t tax_bps{0};
  };

  struct Snapshot {
    std::map<BalanceKey, domain::Amount> balances;
    std::map<AllowanceKey, domain::Amount> allowances;
  };

  // Applies behaviour and moves value. Caller holds mutex_. Returns the
  // amount reported to the engine.
  domain::Amount move(const domain::AssetId& asset,
                      const domain::PrincipalId& from,
                      const domain::PrincipalId& to, domain::Amount amount);

  Settings settingsFor(const domain::AssetId& asset) const;
  void invokeHook(const domain::AssetId& asset);

  domain::PrincipalId operator_id_;

  mutable std::mutex mutex_;
  std::map<BalanceKey, domain::Amount> balances_;
  std::map<AllowanceKey, domain::Amount> allowances_;
  std::map<domain::AssetId, Settings> settings_;
  std::vector<Snapshot> units_;
  TransferHook hook_;
};

}  // namespace escrow
