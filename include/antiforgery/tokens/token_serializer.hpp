/**
 *
 *  @file token_serializer.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_TOKENS_TOKEN_SERIALIZER_HPP
#define ANTIFORGERY_TOKENS_TOKEN_SERIALIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <antiforgery/tokens/token.hpp>

namespace antiforgery::tokens
{
  /**
   * @brief Token <-> transport string.
   */
  class ITokenSerializer
  {
  public:
    virtual ~ITokenSerializer() = default;

    /** @brief Opaque, cookie and form safe string. */
    virtual std::string serialize(const AntiforgeryToken &token) const = 0;

    /**
     * @brief Parse a string produced by serialize().
     *
     * @throws MalformedTokenError on any input that is not a well formed,
     * authentic serialized token.
     */
    virtual AntiforgeryToken deserialize(std::string_view serialized) const = 0;
  };

  /**
   * @brief HMAC-SHA256 protected binary encoding, base64url on the wire.
   *
   * Layout of the protected payload:
   *
   *   u8  version (0x01)
   *   16  security token
   *   u8  is_cookie_token
   *   -- request tokens only --
   *   u8  is_claims_based
   *   32  claim uid            (claims based)
   *   str username             (otherwise)
   *   str additional data
   *
   * where str is a big endian u32 length followed by the bytes, at most
   * max_field_size of them. The 32 byte MAC over the payload is appended
   * before base64url encoding.
   */
  class DefaultTokenSerializer final : public ITokenSerializer
  {
  public:
    static constexpr std::size_t min_key_size = 16;
    static constexpr std::size_t max_field_size = 4096;

    /**
     * @throws ConfigurationError if the key is shorter than min_key_size.
     */
    explicit DefaultTokenSerializer(std::string key);

    /**
     * @throws std::length_error if the username or additional data is longer
     * than max_field_size, since such a token could not be read back.
     */
    std::string serialize(const AntiforgeryToken &token) const override;
    AntiforgeryToken deserialize(std::string_view serialized) const override;

  private:
    std::string mac(std::string_view payload) const;

    std::string key_;
  };

  std::string b64url_encode(const unsigned char *data, std::size_t len);
  std::optional<std::string> b64url_decode(std::string_view in);

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_TOKEN_SERIALIZER_HPP
