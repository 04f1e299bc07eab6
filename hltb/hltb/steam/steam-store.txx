#include <hltb/hltb-log.hxx>

namespace hltb
{
  template <typename C>
  asio::awaitable<catalog_result<std::string>> basic_steam_store<C>::
  fetch_name (steam_app_id id)
  {
    using result = catalog_result<std::string>;

    result r (catalog_status::no_identity_found,
              "no title for app " + std::to_string (id));

    for (const name_source& s: sources_)
    {
      catalog_result<json::value> j (co_await transport_.get_json (s.url (id)));

      if (!j)
      {
        trace << s.name << " has no answer for app " << id << ": " << j.error;
        r = result::failure (j);
        continue;
      }

      if (std::optional<std::string> t = s.title (*j.value, id))
      {
        trace << "app " << id << " is '" << *t << "' per " << s.name;
        co_return result (std::move (*t));
      }

      r = result (catalog_status::no_identity_found,
                  std::string (s.name) + " has no title for app " +
                  std::to_string (id));
    }

    co_return r;
  }
}
