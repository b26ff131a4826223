/* iteration.ipp
Lazy sequences over the identifiers and records of a store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../iteration.hpp"
#include "../../store.hpp"

QUIRE_V1_NAMESPACE_BEGIN

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence entries_sequence::in_collection(const std::string &collection) &&
{
  std::vector<std::string> components(store_id(collection).components());
  return entries_sequence(std::move(*this).filter([components](const store_id &id) { return id.is_in_collection(components); }));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence entries_sequence::find_by_id_substr(const std::string &s) &&
{
  return entries_sequence(std::move(*this).filter([s](const store_id &id) { return std::string::npos!=id.local_string().find(s); }));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence entries_sequence::find_by_id_startswith(const std::string &s) &&
{
  return entries_sequence(std::move(*this).filter([s](const store_id &id) { return 0==id.local_string().compare(0, s.size(), s); }));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<checkout> entries_sequence::into_retrieve_iter(store &s) &&
{
  store *st=&s;
  return std::move(*this).transform<checkout>([st](store_id &&id) { return st->retrieve(id); });
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<boost::optional<checkout>> entries_sequence::into_get_iter(store &s) &&
{
  store *st=&s;
  return std::move(*this).transform<boost::optional<checkout>>([st](store_id &&id) { return st->get(id); });
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<store_id> entries_sequence::into_delete_iter(store &s) &&
{
  store *st=&s;
  return std::move(*this).transform<store_id>([st](store_id &&id) {
    st->remove(id);
    return std::move(id);
  });
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<checkout> where_header(lazy_sequence<checkout> &&seq, const std::string &path, std::function<bool(const header_value &)> pred)
{
  return std::move(seq).filter([path, pred](const checkout &c) {
    const header_value *v=c.header().read(path);
    return v && pred(*v);
  });
}

QUIRE_V1_NAMESPACE_END
