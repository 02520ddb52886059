#pragma once

#include "escrow/domain/types.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// IAssetTransfer: the asset backend the engine moves value through
// -----------------------------------------------------------------------------
//
// @brief  Abstract capability that holds balances and moves a quantity of an
//         asset between two principals.
//
// @details
// The engine treats every implementation as untrusted. A transfer may:
//   - throw (any std::exception),
//   - report success without moving anything,
//   - report a different amount than it moved,
//   - deliver less than requested (a taxed asset),
//   - call back into the engine before returning.
//
// SwapEngine therefore never relies on a return value alone: it reads
// balanceOf() before and after each inbound transfer and compares the delta
// with what was asked for.
//
// Custody:
//   The engine holds escrow and fees under a single custody principal at the
//   backend. transferIn() pulls from a principal using the allowance that
//   principal granted to custody; the destination may be custody itself or
//   another principal (the maker, on the buy leg of a fill). transferOut()
//   sends from custody.
//
// Units:
//   beginUnit() opens a backend transaction for one engine call. commitUnit()
//   keeps every transfer made since, abortUnit() reverts them. The engine
//   pairs each beginUnit() with exactly one of the two. abortUnit() runs
//   from destructors during unwinding and must not throw.
//
// Ownership:
//   The caller owns the implementation and passes it to SwapEngine by
//   reference. It must outlive the engine.
// -----------------------------------------------------------------------------
class IAssetTransfer {
 public:
  virtual ~IAssetTransfer() = default;

  virtual domain::Amount balanceOf(const domain::AssetId& asset,
                                   const domain::PrincipalId& owner) const = 0;

  // Amount `owner` allows `spender` to pull through transferIn().
  virtual domain::Amount allowance(const domain::AssetId& asset,
                                   const domain::PrincipalId& owner,
                                   const domain::PrincipalId& spender) const = 0;

  // -------------------------------------------------------------------------
  // transferIn(asset, from, to, amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Pulls `amount` of `asset` from `from` to `to` against the
  //         allowance `from` granted to the custody principal.
  //
  // @return The amount the backend claims to have moved. Zero means failure.
  //         The engine verifies the claim by balance delta.
  // -------------------------------------------------------------------------
  virtual domain::Amount transferIn(const domain::AssetId& asset,
                                    const domain::PrincipalId& from,
                                    const domain::PrincipalId& to,
                                    domain::Amount amount) = 0;

  // -------------------------------------------------------------------------
  // transferOut(asset, from, to, amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Sends `amount` of `asset` held by `from` (the custody principal)
  //         to `to`.
  //
  // @return false on failure. true is verified by balance delta.
  // -------------------------------------------------------------------------
  virtual bool transferOut(const domain::AssetId& asset,
                           const domain::PrincipalId& from,
                           const domain::PrincipalId& to,
                           domain::Amount amount) = 0;

  virtual void beginUnit() = 0;
  virtual void commitUnit() = 0;
  virtual void abortUnit() noexcept = 0;
};

}  // namespace escrow
