/**
 *
 *  @file identity.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_TOKENS_IDENTITY_HPP
#define ANTIFORGERY_TOKENS_IDENTITY_HPP

#include <optional>
#include <string>
#include <vector>

#include <antiforgery/middleware.hpp>
#include <antiforgery/tokens/binary_blob.hpp>

namespace antiforgery::tokens
{
  struct Claim
  {
    std::string type;
    std::string value;
  };

  /**
   * @brief Authenticated caller, as published in request state by the
   * authentication layer.
   *
   * Antiforgery never authenticates; it only reads this value.
   */
  struct Identity
  {
    bool authenticated{false};
    std::string authentication_type{};
    std::string name{};
    std::vector<Claim> claims{};
  };

  /**
   * @brief Identity of the current exchange, or nullptr when anonymous.
   *
   * An Identity in state with authenticated == false counts as anonymous.
   */
  const Identity *current_identity(const Context &ctx) noexcept;

  /**
   * @brief SHA-256 digest of the claims that identify @p identity.
   *
   * Uses the first claim present among "sub", "nameidentifier" and "upn".
   * Without any of them every claim takes part, sorted by type then value, so
   * claim order does not change the digest. Returns std::nullopt when the
   * identity has no claims at all.
   */
  std::optional<BinaryBlob> extract_claim_uid(const Identity &identity);

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_IDENTITY_HPP
