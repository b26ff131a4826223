/* store_id.ipp
Validated, collection-relative identifiers of stored records
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../store_id.hpp"
#include "../Utility.hpp"
#include "boost/locale/utf.hpp"
#include <algorithm>
#include <cstring>

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  inline void throw_invalid_identifier(const std::string &id, const char *why)
  {
    QUIRE_THROW(store_error(errc::invalid_identifier, "Identifier '"+id+"' "+why, filesystem::path(id)));
  }
  inline bool ends_with(const std::string &s, const char *suffix)
  {
    size_t len=strlen(suffix);
    return s.size()>=len && 0==s.compare(s.size()-len, len, suffix);
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC filesystem::path store_id::normalise(const filesystem::path &local)
{
  std::string s(local.generic_string());
  std::replace(s.begin(), s.end(), '\\', '/');
  if(s.empty())
    detail::throw_invalid_identifier(s, "is empty");
  if('/'==s.front() || local.is_absolute())
    detail::throw_invalid_identifier(s, "is absolute");
  {
    namespace utf = boost::locale::utf;
    const char *p=s.data(), *e=s.data()+s.size();
    while(p!=e)
    {
      utf::code_point c=utf::utf_traits<char>::decode(p, e);
      if(utf::illegal==c || utf::incomplete==c)
        detail::throw_invalid_identifier(s, "is not valid UTF-8");
      if(0==c)
        detail::throw_invalid_identifier(s, "contains a NUL character");
    }
  }
  filesystem::path ret;
  std::string last;
  size_t begin=0;
  while(begin<=s.size())
  {
    size_t end=s.find('/', begin);
    if(std::string::npos==end)
      end=s.size();
    std::string segment(s, begin, end-begin);
    begin=end+1;
    if(segment.empty() || "."==segment)
      continue;
    if(".."==segment)
      detail::throw_invalid_identifier(s, "contains a parent directory traversal");
    // Listings skip hidden names, so a record could never be enumerated
    if('.'==segment.front())
      detail::throw_invalid_identifier(s, "contains a hidden segment");
    ret/=segment;
    last=std::move(segment);
  }
  if(ret.empty())
    detail::throw_invalid_identifier(s, "names the store root");
  if(detail::ends_with(last, QUIRE_LOCKFILE_SUFFIX) || detail::ends_with(last, QUIRE_TEMPFILE_SUFFIX))
    detail::throw_invalid_identifier(s, "ends in a suffix reserved by the store");
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store_id store_id::from_full_path(const filesystem::path &base, const filesystem::path &full)
{
  auto b=base.begin(), f=full.begin();
  for(;;)
  {
    while(b!=base.end() && "."==b->native())
      ++b;
    if(b==base.end() || f==full.end() || *b!=*f)
      break;
    ++b;
    ++f;
  }
  if(b!=base.end())
    detail::throw_invalid_identifier(full.generic_string(), ("does not lie under '"+base.generic_string()+"'").c_str());
  filesystem::path rest;
  for(; f!=full.end(); ++f)
    rest/=*f;
  if(rest.empty())
    detail::throw_invalid_identifier(full.generic_string(), "names the store root");
  return store_id(base, rest);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::vector<std::string> store_id::components() const
{
  std::vector<std::string> ret;
  for(auto &i : _local)
    ret.push_back(i.string());
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store_id store_id::join(const filesystem::path &segment) const
{
  return store_id(validated_t(), _base, normalise(_local/segment));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC filesystem::path store_id::full_path() const
{
  if(!_base)
    detail::throw_invalid_identifier(local_string(), "has no store root to be resolved against");
  return *_base/_local;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool store_id::is_in_collection(const std::string &collection) const
{
  std::vector<std::string> parts;
  size_t begin=0;
  while(begin<collection.size())
  {
    size_t end=collection.find('/', begin);
    if(std::string::npos==end)
      end=collection.size();
    if(end>begin)
      parts.push_back(collection.substr(begin, end-begin));
    begin=end+1;
  }
  return is_in_collection(parts);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool store_id::is_in_collection(const std::vector<std::string> &collection) const
{
  auto i=_local.begin();
  for(auto &c : collection)
  {
    if(i==_local.end() || i->string()!=c)
      return false;
    ++i;
  }
  return true;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store_id make_module_id(const std::string &module, const filesystem::path &name)
{
  return store_id(filesystem::path(module)/name);
}

QUIRE_V1_NAMESPACE_END
