/**
 *
 *  @file token.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_TOKENS_TOKEN_HPP
#define ANTIFORGERY_TOKENS_TOKEN_HPP

#include <cstddef>
#include <optional>
#include <string>

#include <antiforgery/tokens/binary_blob.hpp>

namespace antiforgery::tokens
{
  inline constexpr std::size_t security_token_bits = 128;
  inline constexpr std::size_t claim_uid_bits = 256;

  /**
   * @brief A cookie token or a request token.
   *
   * A request token copies the security token of the cookie token it was
   * derived from and may be bound to the caller identity, either by claim
   * digest or by user name.
   */
  struct AntiforgeryToken
  {
    BinaryBlob security_token;
    bool is_cookie_token{true};

    // request tokens only
    std::optional<BinaryBlob> claim_uid{};
    std::string username{};
    std::string additional_data{};
  };

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_TOKEN_HPP
