#include <hltb/cache/cache-database.hxx>

#include <hltb/cache/cache-types-odb.hxx>

namespace hltb
{
  template class basic_cache_database<cache_database_traits<>>;
}
