#include <antiforgery/tokens/binary_blob.hpp>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <utility>

namespace antiforgery::tokens
{
  BinaryBlob BinaryBlob::random(std::size_t bit_length)
  {
    if (bit_length == 0 || bit_length % 8 != 0)
      throw std::invalid_argument("BinaryBlob bit length must be a positive multiple of 8");

    std::vector<std::uint8_t> bytes(bit_length / 8);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
      throw std::runtime_error("RAND_bytes failed to produce a security token");

    return BinaryBlob(std::move(bytes));
  }

  BinaryBlob::BinaryBlob(std::vector<std::uint8_t> data)
      : data_(std::move(data))
  {
    if (data_.empty())
      throw std::invalid_argument("BinaryBlob data must not be empty");
  }

  std::string BinaryBlob::to_hex() const
  {
    static const char *hex = "0123456789abcdef";

    std::string s;
    s.resize(data_.size() * 2);
    for (std::size_t i = 0; i < data_.size(); ++i)
    {
      s[i * 2] = hex[(data_[i] >> 4) & 0xF];
      s[i * 2 + 1] = hex[data_[i] & 0xF];
    }
    return s;
  }

  bool operator==(const BinaryBlob &a, const BinaryBlob &b) noexcept
  {
    if (a.data_.size() != b.data_.size())
      return false;
    return CRYPTO_memcmp(a.data_.data(), b.data_.data(), a.data_.size()) == 0;
  }

} // namespace antiforgery::tokens
