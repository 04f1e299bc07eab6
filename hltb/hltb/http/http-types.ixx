#include <cctype>
#include <algorithm>

namespace hltb
{
  template <typename S>
  inline bool
  header_name_equal (const S& x, const S& y)
  {
    return x.size () == y.size () &&
           std::equal (x.begin (), x.end (), y.begin (),
                       [] (unsigned char a, unsigned char b)
                       {
                         return std::tolower (a) == std::tolower (b);
                       });
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    add (std::move (n), std::move (v));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    std::erase_if (fields_, [&n] (const field_type& f)
                   {
                     return header_name_equal (f.first, n);
                   });
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    for (const field_type& f: fields_)
    {
      if (header_name_equal (f.first, n))
        return f.second;
    }

    return std::nullopt;
  }
}
