namespace hltb
{
  template <typename S, typename B>
  inline void basic_http_request<S, B>::
  complete (const url_parts& u, const string_type& ua)
  {
    string_type h (u.host);

    if (u.port != (u.secure () ? "443" : "80"))
      h += ':' + u.port;

    set_header ("Host", std::move (h));

    if (!ua.empty () && !headers.contains ("User-Agent"))
      set_header ("User-Agent", ua);
  }
}
