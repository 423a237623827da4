#ifndef ANTIFORGERY_HTTP_FORM_HPP
#define ANTIFORGERY_HTTP_FORM_HPP

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <antiforgery/middleware.hpp>

namespace antiforgery::http
{
  enum class FormEncoding
  {
    none,
    urlencoded,
    multipart
  };

  /**
   * @brief Text fields of a form body, first occurrence of a name wins.
   *
   * Decoded once per exchange and kept in request state.
   */
  struct FormBody
  {
    std::unordered_map<std::string, std::string> fields{};
  };

  inline bool iequals_prefix(std::string_view s, std::string_view prefix)
  {
    if (s.size() < prefix.size())
      return false;
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
      if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
        return false;
    }
    return true;
  }

  inline std::string_view strip(std::string_view s)
  {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos)
      return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
  }

  /**
   * @brief Value of a `key=value` parameter in a header such as Content-Type
   * or Content-Disposition. Quotes around the value are removed.
   */
  inline std::optional<std::string> header_param(std::string_view header, std::string_view key)
  {
    std::size_t pos = header.find(';');
    while (pos != std::string_view::npos)
    {
      const std::size_t next = header.find(';', pos + 1);
      std::string_view param = strip(header.substr(pos + 1, next == std::string_view::npos ? std::string_view::npos : next - pos - 1));
      pos = next;

      const std::size_t eq = param.find('=');
      if (eq == std::string_view::npos)
        continue;

      const std::string_view name = strip(param.substr(0, eq));
      if (name.size() != key.size() || !iequals_prefix(name, key))
        continue;

      std::string_view value = strip(param.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        value = value.substr(1, value.size() - 2);
      return std::string(value);
    }
    return std::nullopt;
  }

  inline FormEncoding form_encoding(const Request &req)
  {
    const std::string ct = req.header("content-type");
    if (iequals_prefix(ct, "application/x-www-form-urlencoded"))
      return FormEncoding::urlencoded;
    if (iequals_prefix(ct, "multipart/form-data"))
      return FormEncoding::multipart;
    return FormEncoding::none;
  }

  // Both encodings an HTML <form> can submit.
  inline bool has_form_content_type(const Request &req)
  {
    return form_encoding(req) != FormEncoding::none;
  }

  /**
   * @brief Decode `+` and `%XX` escapes. Malformed escapes are kept as is.
   */
  inline std::string percent_decode(std::string_view in)
  {
    auto nibble = [](char ch) -> int
    {
      if (!std::isxdigit(static_cast<unsigned char>(ch)))
        return -1;
      return std::isdigit(static_cast<unsigned char>(ch)) ? ch - '0' : (std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10);
    };

    std::string out;
    out.reserve(in.size());

    std::size_t i = 0;
    while (i < in.size())
    {
      const char c = in[i];
      if (c == '%' && i + 2 < in.size())
      {
        const int hi = nibble(in[i + 1]);
        const int lo = nibble(in[i + 2]);
        if (hi >= 0 && lo >= 0)
        {
          out += static_cast<char>(hi * 16 + lo);
          i += 3;
          continue;
        }
      }
      out += (c == '+') ? ' ' : c;
      ++i;
    }
    return out;
  }

  inline void decode_urlencoded(std::string_view body, FormBody &form)
  {
    while (!body.empty())
    {
      const std::size_t amp = body.find('&');
      const std::string_view pair = body.substr(0, amp);
      body = (amp == std::string_view::npos) ? std::string_view{} : body.substr(amp + 1);

      if (pair.empty())
        continue;

      const std::size_t eq = pair.find('=');
      std::string key = percent_decode(pair.substr(0, eq));
      if (key.empty())
        continue;

      std::string value = (eq == std::string_view::npos) ? std::string{} : percent_decode(pair.substr(eq + 1));
      form.fields.emplace(std::move(key), std::move(value));
    }
  }

  /**
   * @brief Collect the text parts of a multipart/form-data body.
   *
   * File parts (those with a filename) are skipped; a request token is never
   * uploaded as a file.
   */
  inline void decode_multipart(std::string_view body, std::string_view boundary, FormBody &form)
  {
    if (boundary.empty())
      return;

    const std::string delimiter = "--" + std::string(boundary);
    std::size_t cursor = body.find(delimiter);

    while (cursor != std::string_view::npos)
    {
      std::size_t part_begin = cursor + delimiter.size();
      if (body.substr(part_begin, 2) == "--")
        break; // closing delimiter
      if (body.substr(part_begin, 2) == "\r\n")
        part_begin += 2;

      const std::size_t headers_end = body.find("\r\n\r\n", part_begin);
      if (headers_end == std::string_view::npos)
        break;

      const std::size_t next = body.find(delimiter, headers_end + 4);
      if (next == std::string_view::npos)
        break;

      std::size_t value_end = next;
      if (value_end >= headers_end + 6 && body.substr(value_end - 2, 2) == "\r\n")
        value_end -= 2;

      const std::string_view headers = body.substr(part_begin, headers_end - part_begin);
      const std::string_view value = body.substr(headers_end + 4, value_end - (headers_end + 4));

      std::size_t line_begin = 0;
      while (line_begin <= headers.size())
      {
        const std::size_t line_end = headers.find("\r\n", line_begin);
        const std::string_view line = headers.substr(line_begin, line_end == std::string_view::npos ? std::string_view::npos : line_end - line_begin);

        if (iequals_prefix(line, "content-disposition:"))
        {
          auto name = header_param(line, "name");
          const bool is_file = header_param(line, "filename").has_value();
          if (name && !name->empty() && !is_file)
            form.fields.emplace(std::move(*name), std::string(value));
          break;
        }

        if (line_end == std::string_view::npos)
          break;
        line_begin = line_end + 2;
      }

      cursor = next;
    }
  }

  /**
   * @brief Named text field of the request's form body.
   *
   * @return nullopt when the body is not a form or has no such field.
   */
  inline std::optional<std::string> form_field(Context &ctx, std::string_view name)
  {
    const FormEncoding encoding = form_encoding(ctx.req());
    if (encoding == FormEncoding::none)
      return std::nullopt;

    if (!ctx.try_state<FormBody>())
    {
      FormBody form;
      const std::string body = ctx.req().body();
      if (encoding == FormEncoding::urlencoded)
        decode_urlencoded(body, form);
      else
        decode_multipart(body, header_param(ctx.req().header("content-type"), "boundary").value_or(""), form);
      ctx.set_state<FormBody>(std::move(form));
    }

    const FormBody *form = ctx.try_state<FormBody>();
    if (!form)
      return std::nullopt;

    const auto found = form->fields.find(std::string(name));
    if (found == form->fields.end())
      return std::nullopt;
    return found->second;
  }

} // namespace antiforgery::http

#endif // ANTIFORGERY_HTTP_FORM_HPP
