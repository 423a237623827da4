/**
 *
 *  @file binary_blob.hpp
 *  @author Gaspard Kirira
 *
 *  Copyright 2025, Gaspard Kirira.  All rights reserved.
 *  https://github.com/vixcpp/vix
 *  Use of this source code is governed by a MIT license
 *  that can be found in the License file.
 *
 *  Vix.cpp
 */
#ifndef ANTIFORGERY_TOKENS_BINARY_BLOB_HPP
#define ANTIFORGERY_TOKENS_BINARY_BLOB_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace antiforgery::tokens
{
  /**
   * @brief Fixed length byte string compared in constant time.
   *
   * Used for the random security token shared by a cookie/request pair and
   * for claim digests.
   */
  class BinaryBlob
  {
  public:
    /**
     * @brief Fresh random blob of @p bit_length bits from the OpenSSL CSPRNG.
     *
     * @throws std::invalid_argument if bit_length is not a positive multiple of 8.
     * @throws std::runtime_error if the generator fails.
     */
    static BinaryBlob random(std::size_t bit_length);

    /**
     * @brief Wrap existing bytes.
     *
     * @throws std::invalid_argument if data is empty.
     */
    explicit BinaryBlob(std::vector<std::uint8_t> data);

    std::size_t bit_length() const noexcept { return data_.size() * 8; }
    const std::vector<std::uint8_t> &data() const noexcept { return data_; }

    /** @brief Lowercase hex, for diagnostics only. */
    std::string to_hex() const;

    friend bool operator==(const BinaryBlob &a, const BinaryBlob &b) noexcept;
    friend bool operator!=(const BinaryBlob &a, const BinaryBlob &b) noexcept { return !(a == b); }

  private:
    std::vector<std::uint8_t> data_;
  };

} // namespace antiforgery::tokens

#endif // ANTIFORGERY_TOKENS_BINARY_BLOB_HPP
