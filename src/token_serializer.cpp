#include <antiforgery/tokens/token_serializer.hpp>
#include <antiforgery/core/errors.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace antiforgery::tokens
{
  namespace
  {
    constexpr std::uint8_t token_version = 0x01;
    constexpr std::size_t mac_size = 32;
    constexpr std::size_t max_field_size = DefaultTokenSerializer::max_field_size;

    void put_u8(std::string &out, std::uint8_t v)
    {
      out.push_back(static_cast<char>(v));
    }

    void put_blob(std::string &out, const BinaryBlob &b)
    {
      out.append(reinterpret_cast<const char *>(b.data().data()), b.data().size());
    }

    void put_str(std::string &out, const std::string &s, const char *field)
    {
      if (s.size() > max_field_size)
        throw std::length_error(std::string("antiforgery token ") + field + " exceeds " +
                                std::to_string(max_field_size) + " bytes");

      const std::uint32_t n = static_cast<std::uint32_t>(s.size());
      put_u8(out, static_cast<std::uint8_t>((n >> 24) & 0xFF));
      put_u8(out, static_cast<std::uint8_t>((n >> 16) & 0xFF));
      put_u8(out, static_cast<std::uint8_t>((n >> 8) & 0xFF));
      put_u8(out, static_cast<std::uint8_t>(n & 0xFF));
      out += s;
    }

    class PayloadReader
    {
    public:
      explicit PayloadReader(std::string_view buf) : buf_(buf) {}

      std::uint8_t u8()
      {
        need(1);
        return static_cast<std::uint8_t>(buf_[pos_++]);
      }

      bool flag()
      {
        const std::uint8_t v = u8();
        if (v > 1)
          throw MalformedTokenError("invalid boolean field");
        return v == 1;
      }

      BinaryBlob blob(std::size_t bits)
      {
        const std::size_t n = bits / 8;
        need(n);
        std::vector<std::uint8_t> bytes(buf_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                        buf_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return BinaryBlob(std::move(bytes));
      }

      std::string str()
      {
        std::uint32_t n = 0;
        for (int i = 0; i < 4; ++i)
          n = (n << 8) | u8();
        if (n > max_field_size)
          throw MalformedTokenError("string field too long");
        need(n);
        std::string s(buf_.substr(pos_, n));
        pos_ += n;
        return s;
      }

      bool at_end() const noexcept { return pos_ == buf_.size(); }

    private:
      void need(std::size_t n) const
      {
        if (buf_.size() - pos_ < n)
          throw MalformedTokenError("truncated payload");
      }

      std::string_view buf_;
      std::size_t pos_{0};
    };

    bool is_b64url_char(char c) noexcept
    {
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
             (c >= '0' && c <= '9') || c == '-' || c == '_';
    }
  } // namespace

  std::string b64url_encode(const unsigned char *data, std::size_t len)
  {
    std::string b64;
    b64.resize(4 * ((len + 2) / 3));

    int out_len = EVP_EncodeBlock(
        reinterpret_cast<unsigned char *>(&b64[0]),
        data,
        static_cast<int>(len));

    b64.resize(static_cast<std::size_t>(out_len));

    for (char &c : b64)
    {
      if (c == '+')
        c = '-';
      else if (c == '/')
        c = '_';
    }
    while (!b64.empty() && b64.back() == '=')
      b64.pop_back();
    return b64;
  }

  std::optional<std::string> b64url_decode(std::string_view in)
  {
    if (in.empty() || in.size() % 4 == 1)
      return std::nullopt;

    std::string b64;
    b64.reserve(in.size() + 3);
    for (char c : in)
    {
      if (!is_b64url_char(c))
        return std::nullopt;
      if (c == '-')
        b64.push_back('+');
      else if (c == '_')
        b64.push_back('/');
      else
        b64.push_back(c);
    }

    std::size_t pad = 0;
    while (b64.size() % 4 != 0)
    {
      b64.push_back('=');
      ++pad;
    }

    std::string out;
    out.resize((b64.size() * 3) / 4);

    int len = EVP_DecodeBlock(
        reinterpret_cast<unsigned char *>(&out[0]),
        reinterpret_cast<const unsigned char *>(b64.data()),
        static_cast<int>(b64.size()));

    if (len < 0 || static_cast<std::size_t>(len) < pad)
      return std::nullopt;

    // EVP_DecodeBlock emits a zero byte per '=' of padding
    out.resize(static_cast<std::size_t>(len) - pad);
    return out;
  }

  DefaultTokenSerializer::DefaultTokenSerializer(std::string key)
      : key_(std::move(key))
  {
    if (key_.size() < min_key_size)
      throw ConfigurationError("DefaultTokenSerializer.key",
                               "The antiforgery signing key must be at least 16 bytes long");
  }

  std::string DefaultTokenSerializer::mac(std::string_view payload) const
  {
    unsigned int out_len = 0;
    unsigned char out[EVP_MAX_MD_SIZE];

    if (!HMAC(EVP_sha256(),
              key_.data(),
              static_cast<int>(key_.size()),
              reinterpret_cast<const unsigned char *>(payload.data()),
              payload.size(),
              out,
              &out_len))
    {
      throw std::runtime_error("HMAC-SHA256 failed while protecting an antiforgery token");
    }

    return std::string(reinterpret_cast<const char *>(out), out_len);
  }

  std::string DefaultTokenSerializer::serialize(const AntiforgeryToken &token) const
  {
    std::string payload;
    payload.reserve(64 + token.username.size() + token.additional_data.size());

    put_u8(payload, token_version);
    put_blob(payload, token.security_token);
    put_u8(payload, token.is_cookie_token ? 1 : 0);

    if (!token.is_cookie_token)
    {
      if (token.claim_uid)
      {
        put_u8(payload, 1);
        put_blob(payload, *token.claim_uid);
      }
      else
      {
        put_u8(payload, 0);
        put_str(payload, token.username, "username");
      }
      put_str(payload, token.additional_data, "additional data");
    }

    std::string sealed = payload + mac(payload);
    return b64url_encode(reinterpret_cast<const unsigned char *>(sealed.data()), sealed.size());
  }

  AntiforgeryToken DefaultTokenSerializer::deserialize(std::string_view serialized) const
  {
    auto raw = b64url_decode(serialized);
    if (!raw)
      throw MalformedTokenError("not base64url");

    if (raw->size() <= mac_size)
      throw MalformedTokenError("too short");

    const std::string_view sealed(*raw);
    const std::string_view payload = sealed.substr(0, sealed.size() - mac_size);
    const std::string_view tag = sealed.substr(sealed.size() - mac_size);

    const std::string expected = mac(payload);
    if (expected.size() != tag.size() ||
        CRYPTO_memcmp(expected.data(), tag.data(), tag.size()) != 0)
      throw MalformedTokenError("authentication failed");

    PayloadReader r(payload);
    if (r.u8() != token_version)
      throw MalformedTokenError("unsupported version");

    AntiforgeryToken token{r.blob(security_token_bits)};
    token.is_cookie_token = r.flag();

    if (!token.is_cookie_token)
    {
      if (r.flag())
        token.claim_uid = r.blob(claim_uid_bits);
      else
        token.username = r.str();
      token.additional_data = r.str();
    }

    if (!r.at_end())
      throw MalformedTokenError("trailing bytes");

    return token;
  }

} // namespace antiforgery::tokens
