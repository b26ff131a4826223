/* record.ipp
A stored item: a structured header plus free text content
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../record.hpp"
#include "../Utility.hpp"

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::pair<boost::optional<std::string>, std::string> split_record_text(const std::string &bytes)
  {
    static const std::string delimiter(record::delimiter());
    size_t first_end=bytes.find('\n');
    if(0!=bytes.compare(0, std::string::npos==first_end ? bytes.size() : first_end, delimiter))
      return std::make_pair(boost::optional<std::string>(), bytes);
    if(std::string::npos!=first_end)
    {
      // Only the first two delimiter lines from the top can bound the header
      size_t pos=first_end+1;
      for(;;)
      {
        size_t end=bytes.find('\n', pos);
        size_t len=(std::string::npos==end ? bytes.size() : end)-pos;
        if(len==delimiter.size() && 0==bytes.compare(pos, len, delimiter))
        {
          boost::optional<std::string> header(bytes.substr(first_end+1, pos-first_end-1));
          return std::make_pair(std::move(header), std::string::npos==end ? std::string() : bytes.substr(end+1));
        }
        if(std::string::npos==end)
          break;
        pos=end+1;
      }
    }
    QUIRE_THROW(store_error(errc::malformed_record, "Header block is opened but never closed"));
    return std::make_pair(boost::optional<std::string>(), std::string());
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record record::from_bytes(store_id location, const std::string &bytes)
{
  try
  {
    auto parts(detail::split_record_text(bytes));
    record_header header(parts.first ? record_header::parse(*parts.first) : record_header());
    return record(std::move(location), std::move(header), std::move(parts.second));
  }
  catch(const store_error &e)
  {
    if(errc::malformed_record!=e.kind())
      QUIRE_RETHROW;
    filesystem::path where(location.has_base() ? location.full_path() : location.local());
    QUIRE_DEBUG_PRINT("E %s: %s\n", where.generic_string().c_str(), e.what());
    QUIRE_THROW(store_error(errc::malformed_record, "Record '"+location.local_string()+"' is malformed: "+e.what(), where));
  }
  return record(std::move(location));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string record::to_bytes() const
{
  std::string ret(delimiter());
  ret.push_back('\n');
  ret.append(_header.serialize());
  ret.append(delimiter());
  ret.push_back('\n');
  ret.append(_content);
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void record::set_header(record_header header)
{
  header._root[record_header::reserved_name()]=header_value(_header.reserved());
  _header._root.swap(header._root);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void record::tag_module(const std::string &module)
{
  header_table &reserved=_header.reserved();
  auto it=reserved.find("modules");
  if(reserved.end()==it)
    it=reserved.emplace("modules", header_value(header_array())).first;
  auto &modules=it->second.as<header_array>();
  for(auto &m : modules)
    if(m==header_value(module))
      return;
  modules.push_back(header_value(module));
}

QUIRE_V1_NAMESPACE_END
