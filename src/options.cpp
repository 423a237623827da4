#include <antiforgery/options.hpp>
#include <antiforgery/core/errors.hpp>

namespace antiforgery
{
  static std::string setting_name(const std::string &key)
  {
    return "AntiforgeryOptions." + key;
  }

  static void read_string(const nlohmann::json &j, const char *key, std::string &out)
  {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_string())
      throw ConfigurationError(setting_name(key), setting_name(key) + " must be a string");
    out = it->get<std::string>();
  }

  static void read_bool(const nlohmann::json &j, const char *key, bool &out)
  {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_boolean())
      throw ConfigurationError(setting_name(key), setting_name(key) + " must be a boolean");
    out = it->get<bool>();
  }

  void validate_options(const AntiforgeryOptions &opt)
  {
    if (opt.cookie_name.empty())
      throw ConfigurationError(setting_name("cookie_name"), "The antiforgery cookie name must not be empty");

    if (opt.form_field_name.empty())
      throw ConfigurationError(setting_name("form_field_name"), "The antiforgery form field name must not be empty");

    if (opt.header_name && opt.header_name->empty())
      throw ConfigurationError(setting_name("header_name"),
                               "The antiforgery header name must not be empty; use null to disable the header");
  }

  AntiforgeryOptions options_from_json(const nlohmann::json &j)
  {
    if (!j.is_object())
      throw ConfigurationError("AntiforgeryOptions", "Antiforgery configuration must be a JSON object");

    AntiforgeryOptions opt;

    read_string(j, "cookie_name", opt.cookie_name);
    read_string(j, "cookie_path", opt.cookie_path);
    read_string(j, "cookie_domain", opt.cookie_domain);
    read_string(j, "form_field_name", opt.form_field_name);

    if (auto it = j.find("header_name"); it != j.end())
    {
      if (it->is_null())
        opt.header_name.reset();
      else if (it->is_string())
        opt.header_name = it->get<std::string>();
      else
        throw ConfigurationError(setting_name("header_name"), setting_name("header_name") + " must be a string or null");
    }

    read_bool(j, "require_ssl", opt.require_ssl);
    read_bool(j, "suppress_x_frame_options_header", opt.suppress_x_frame_options_header);
    read_bool(j, "identity_binding", opt.identity_binding);
    read_bool(j, "suppress_identity_heuristic_checks", opt.suppress_identity_heuristic_checks);

    validate_options(opt);
    return opt;
  }

} // namespace antiforgery
