namespace hltb
{
  template <typename T>
  inline const fs::path& basic_cache_database<T>::
  path () const noexcept
  {
    return path_;
  }
}
