/* header.ipp
The structured header tree of a record
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../header.hpp"
#include "../Utility.hpp"
#include "boost/lexical_cast.hpp"
#include "boost/locale/utf.hpp"
#include <cctype>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iterator>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  inline bool is_bare_key_char(char c)
  {
    return isalnum((unsigned char) c) || '_'==c || '-'==c;
  }

  // Reads the TOML subset used by record headers
  class header_text_parser
  {
    const std::string &_s;
    size_t _pos, _line;
    header_table _root;

    void fail(const std::string &why) const
    {
      QUIRE_THROW(store_error(errc::malformed_record, "Header line "+std::to_string(_line)+": "+why));
    }
    bool eof() const { return _pos>=_s.size(); }
    char peek(size_t offset=0) const { return _pos+offset<_s.size() ? _s[_pos+offset] : 0; }
    bool starts_with(const char *word) const { return 0==_s.compare(_pos, strlen(word), word); }
    bool at_newline() const { return '\n'==peek() || ('\r'==peek() && '\n'==peek(1)); }
    void consume_newline()
    {
      if('\r'==peek())
        _pos++;
      _pos++;
      _line++;
    }
    void skip_ws()
    {
      while(' '==peek() || '\t'==peek())
        _pos++;
    }
    void skip_comment()
    {
      if('#'==peek())
        while(!eof() && !at_newline())
          _pos++;
    }
    // Whitespace, comments and newlines, as allowed between statements and inside arrays
    void skip_ws_nl()
    {
      for(;;)
      {
        skip_ws();
        skip_comment();
        if(!at_newline())
          return;
        consume_newline();
      }
    }
    void expect_line_end()
    {
      skip_ws();
      skip_comment();
      if(eof())
        return;
      if(!at_newline())
        fail("expected the end of the line");
      consume_newline();
    }

    std::uint32_t parse_hex(size_t digits)
    {
      std::uint32_t ret=0;
      for(size_t n=0; n<digits; n++)
      {
        char c=peek();
        if(!isxdigit((unsigned char) c))
          fail("bad unicode escape");
        ret=ret*16+(isdigit((unsigned char) c) ? c-'0' : (tolower((unsigned char) c)-'a'+10));
        _pos++;
      }
      return ret;
    }
    void append_utf8(std::string &out, std::uint32_t cp)
    {
      namespace utf = boost::locale::utf;
      if(!utf::is_valid_codepoint(cp))
        fail("unicode escape is not a valid code point");
      utf::utf_traits<char>::encode(cp, std::back_inserter(out));
    }
    std::string parse_basic_string()
    {
      _pos++;
      std::string ret;
      for(;;)
      {
        if(eof() || at_newline())
          fail("unterminated string");
        char c=_s[_pos++];
        if('"'==c)
          return ret;
        if('\\'!=c)
        {
          ret.push_back(c);
          continue;
        }
        if(eof())
          fail("unterminated string");
        c=_s[_pos++];
        switch(c)
        {
        case 'b': ret.push_back('\b'); break;
        case 't': ret.push_back('\t'); break;
        case 'n': ret.push_back('\n'); break;
        case 'f': ret.push_back('\f'); break;
        case 'r': ret.push_back('\r'); break;
        case '"': ret.push_back('"'); break;
        case '\\': ret.push_back('\\'); break;
        case 'u': append_utf8(ret, parse_hex(4)); break;
        case 'U': append_utf8(ret, parse_hex(8)); break;
        default:
          fail(std::string("unknown escape sequence \\")+c);
        }
      }
    }
    std::string parse_literal_string()
    {
      _pos++;
      size_t begin=_pos;
      while(!eof() && '\''!=peek() && !at_newline())
        _pos++;
      if('\''!=peek())
        fail("unterminated string");
      std::string ret(_s, begin, _pos-begin);
      _pos++;
      return ret;
    }
    std::string parse_key_segment()
    {
      if('"'==peek())
        return parse_basic_string();
      if('\''==peek())
        return parse_literal_string();
      size_t begin=_pos;
      while(is_bare_key_char(peek()))
        _pos++;
      if(begin==_pos)
        fail("expected a key");
      return _s.substr(begin, _pos-begin);
    }
    std::vector<std::string> parse_key()
    {
      std::vector<std::string> ret;
      for(;;)
      {
        skip_ws();
        ret.push_back(parse_key_segment());
        skip_ws();
        if('.'!=peek())
          return ret;
        _pos++;
      }
    }
    header_value parse_number()
    {
      size_t begin=_pos;
      while(is_bare_key_char(peek()) || '+'==peek() || '.'==peek())
        _pos++;
      std::string token(_s, begin, _pos-begin), digits;
      if(token.empty())
        fail("expected a value");
      for(char c : token)
        if('_'!=c)
          digits.push_back(c);
      if(digits.empty())
        fail("'"+token+"' is not a valid value");
      std::string magnitude(('+'==digits[0] || '-'==digits[0]) ? digits.substr(1) : digits);
      if("inf"==magnitude)
        return header_value('-'==digits[0] ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity());
      if("nan"==magnitude)
        return header_value(std::numeric_limits<double>::quiet_NaN());
      try
      {
        if(std::string::npos==digits.find_first_of(".eE"))
          return header_value(boost::lexical_cast<std::int64_t>(digits));
        return header_value(boost::lexical_cast<double>(digits));
      }
      catch(const boost::bad_lexical_cast &)
      {
      }
      fail("'"+token+"' is not a valid value");
      return header_value();
    }
    header_value parse_array()
    {
      _pos++;
      header_array ret;
      for(;;)
      {
        skip_ws_nl();
        if(']'==peek())
          break;
        ret.push_back(parse_value());
        skip_ws_nl();
        if(','==peek())
        {
          _pos++;
          continue;
        }
        if(']'!=peek())
          fail("expected ',' or ']' in array");
        break;
      }
      _pos++;
      return header_value(std::move(ret));
    }
    header_value parse_inline_table()
    {
      _pos++;
      header_table ret;
      skip_ws();
      if('}'==peek())
      {
        _pos++;
        return header_value(std::move(ret));
      }
      for(;;)
      {
        auto key=parse_key();
        if('='!=peek())
          fail("expected '=' after key");
        _pos++;
        skip_ws();
        insert(ret, key, parse_value());
        skip_ws();
        if(','==peek())
        {
          _pos++;
          continue;
        }
        if('}'!=peek())
          fail("expected ',' or '}' in inline table");
        _pos++;
        return header_value(std::move(ret));
      }
    }
    header_value parse_value()
    {
      char c=peek();
      if('"'==c)
        return header_value(parse_basic_string());
      if('\''==c)
        return header_value(parse_literal_string());
      if('['==c)
        return parse_array();
      if('{'==c)
        return parse_inline_table();
      if(starts_with("true") && !is_bare_key_char(peek(4)))
      {
        _pos+=4;
        return header_value(true);
      }
      if(starts_with("false") && !is_bare_key_char(peek(5)))
      {
        _pos+=5;
        return header_value(false);
      }
      return parse_number();
    }

    // Descends into key[n] of t, creating tables where missing
    header_table &descend(header_table &t, const std::string &key)
    {
      auto it=t.find(key);
      if(t.end()==it)
        it=t.emplace(key, header_table()).first;
      if(auto *sub=it->second.get<header_table>())
        return *sub;
      // An array of tables continues in its most recent element
      if(auto *a=it->second.get<header_array>())
        if(!a->empty())
          if(auto *sub=a->back().get<header_table>())
            return *sub;
      fail("key '"+key+"' is not a table");
      return t;
    }
    void insert(header_table &t, const std::vector<std::string> &key, header_value v)
    {
      header_table *cur=&t;
      for(size_t n=0; n<key.size()-1; n++)
        cur=&descend(*cur, key[n]);
      if(!cur->emplace(key.back(), std::move(v)).second)
        fail("duplicate key '"+key.back()+"'");
    }
    header_table &open_table(const std::vector<std::string> &key)
    {
      header_table *cur=&_root;
      for(auto &k : key)
        cur=&descend(*cur, k);
      return *cur;
    }
    header_table &open_array_table(const std::vector<std::string> &key)
    {
      header_table *cur=&_root;
      for(size_t n=0; n<key.size()-1; n++)
        cur=&descend(*cur, key[n]);
      auto it=cur->find(key.back());
      if(cur->end()==it)
        it=cur->emplace(key.back(), header_array()).first;
      auto *a=it->second.get<header_array>();
      if(!a)
        fail("key '"+key.back()+"' is not an array of tables");
      a->push_back(header_value(header_table()));
      return a->back().as<header_table>();
    }
  public:
    explicit header_text_parser(const std::string &s) : _s(s), _pos(0), _line(1) { }
    header_table parse()
    {
      header_table *current=&_root;
      for(;;)
      {
        skip_ws_nl();
        if(eof())
          break;
        if('['==peek())
        {
          bool array_of_tables='['==peek(1);
          _pos+=array_of_tables ? 2 : 1;
          auto key=parse_key();
          if(array_of_tables)
          {
            if(']'!=peek() || ']'!=peek(1))
              fail("expected ']]'");
            _pos+=2;
          }
          else
          {
            if(']'!=peek())
              fail("expected ']'");
            _pos++;
          }
          expect_line_end();
          current=array_of_tables ? &open_array_table(key) : &open_table(key);
          continue;
        }
        auto key=parse_key();
        if('='!=peek())
          fail("expected '=' after key");
        _pos++;
        skip_ws();
        insert(*current, key, parse_value());
        expect_line_end();
      }
      return std::move(_root);
    }
  };

  inline void write_string(std::string &out, const std::string &s)
  {
    static const char hexdigits[]="0123456789ABCDEF";
    out.push_back('"');
    for(char c : s)
    {
      switch(c)
      {
      case '"': out.append("\\\""); break;
      case '\\': out.append("\\\\"); break;
      case '\b': out.append("\\b"); break;
      case '\t': out.append("\\t"); break;
      case '\n': out.append("\\n"); break;
      case '\f': out.append("\\f"); break;
      case '\r': out.append("\\r"); break;
      default:
        if((unsigned char) c<0x20 || 0x7f==c)
        {
          out.append("\\u00");
          out.push_back(hexdigits[((unsigned char) c)>>4]);
          out.push_back(hexdigits[c & 15]);
        }
        else
          out.push_back(c);
      }
    }
    out.push_back('"');
  }
  inline void write_key(std::string &out, const std::string &key)
  {
    bool bare=!key.empty();
    for(char c : key)
      if(!is_bare_key_char(c))
        bare=false;
    if(bare)
      out.append(key);
    else
      write_string(out, key);
  }
  inline void write_double(std::string &out, double v)
  {
    if(std::isnan(v))
    {
      out.append("nan");
      return;
    }
    if(std::isinf(v))
    {
      out.append(v<0 ? "-inf" : "inf");
      return;
    }
    std::ostringstream s;
    s.imbue(std::locale::classic());
    s << std::setprecision(15) << v;
    if(boost::lexical_cast<double>(s.str())!=v)
    {
      s.str(std::string());
      s << std::setprecision(17) << v;
    }
    std::string text(s.str());
    if(std::string::npos==text.find_first_of(".eE"))
      text.append(".0");
    out.append(text);
  }
  inline void write_inline(std::string &out, const header_value &v)
  {
    switch(v.type())
    {
    case header_type::string:
      write_string(out, v.as<std::string>());
      break;
    case header_type::integer:
      out.append(boost::lexical_cast<std::string>(v.as<std::int64_t>()));
      break;
    case header_type::floating:
      write_double(out, v.as<double>());
      break;
    case header_type::boolean:
      out.append(v.as<bool>() ? "true" : "false");
      break;
    case header_type::array:
    {
      out.push_back('[');
      bool first=true;
      for(auto &i : v.as<header_array>())
      {
        if(!first)
          out.append(", ");
        first=false;
        write_inline(out, i);
      }
      out.push_back(']');
      break;
    }
    case header_type::table:
    {
      auto &t=v.as<header_table>();
      if(t.empty())
      {
        out.append("{}");
        break;
      }
      out.append("{ ");
      bool first=true;
      for(auto &i : t)
      {
        if(!first)
          out.append(", ");
        first=false;
        write_key(out, i.first);
        out.append(" = ");
        write_inline(out, i.second);
      }
      out.append(" }");
      break;
    }
    }
  }
  inline void write_table(std::string &out, const header_table &t, const std::string &prefix)
  {
    for(auto &i : t)
    {
      if(i.second.is_table())
        continue;
      write_key(out, i.first);
      out.append(" = ");
      write_inline(out, i.second);
      out.push_back('\n');
    }
    for(auto &i : t)
    {
      if(!i.second.is_table())
        continue;
      std::string path(prefix);
      if(!path.empty())
        path.push_back('.');
      write_key(path, i.first);
      if(!out.empty())
        out.push_back('\n');
      out.append("["+path+"]\n");
      write_table(out, i.second.as<header_table>(), path);
    }
  }

  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC header_table parse_header_text(const std::string &text)
  {
    return header_text_parser(text).parse();
  }

  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string serialize_header_text(const header_table &table)
  {
    std::string ret;
    write_table(ret, table, std::string());
    return ret;
  }

  // One step of a dotted header path
  struct header_path_segment
  {
    std::string key;
    bool is_index;
    size_t index;
  };
  inline std::vector<header_path_segment> split_header_path(const std::string &path)
  {
    std::vector<header_path_segment> ret;
    size_t begin=0;
    for(;;)
    {
      size_t end=path.find('.', begin);
      if(std::string::npos==end)
        end=path.size();
      std::string segment(path, begin, end-begin);
      if(segment.empty())
        QUIRE_THROW(std::invalid_argument("Header path '"+path+"' contains an empty segment"));
      header_path_segment s;
      s.is_index=false;
      s.index=0;
      if('['==segment.front() && ']'==segment.back() && segment.size()>2)
      {
        s.is_index=true;
        try
        {
          s.index=boost::lexical_cast<size_t>(segment.substr(1, segment.size()-2));
        }
        catch(const boost::bad_lexical_cast &)
        {
          QUIRE_THROW(std::invalid_argument("Header path '"+path+"' has a malformed array index "+segment));
        }
      }
      else
        s.key=std::move(segment);
      ret.push_back(std::move(s));
      if(end==path.size())
        return ret;
      begin=end+1;
    }
  }
  // Follows segments [0, count) from root. Returns false if something along the way is missing.
  // On success *out is the value reached, or null for the root table itself.
  inline bool walk_header_path(const header_table &root, const std::vector<header_path_segment> &segments, size_t count, const header_value **out)
  {
    const header_value *cur=nullptr;
    for(size_t n=0; n<count; n++)
    {
      auto &s=segments[n];
      if(s.is_index)
      {
        auto *a=cur ? cur->get<header_array>() : nullptr;
        if(!a || s.index>=a->size())
          return false;
        cur=&(*a)[s.index];
      }
      else
      {
        auto *t=cur ? cur->get<header_table>() : &root;
        if(!t)
          return false;
        auto it=t->find(s.key);
        if(t->end()==it)
          return false;
        cur=&it->second;
      }
    }
    *out=cur;
    return true;
  }
  inline void check_not_reserved(const std::vector<header_path_segment> &segments, const std::string &path)
  {
    if(!segments.front().is_index && segments.front().key==record_header::reserved_name())
      QUIRE_THROW(store_error(errc::reserved_namespace, "Header path '"+path+"' lies in the namespace reserved by the store"));
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record_header::record_header()
{
  header_table reserved;
  reserved.emplace("version", header_value(QUIRE_VERSION_STRING));
  _root.emplace(reserved_name(), header_value(std::move(reserved)));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC header_table &record_header::reserved()
{
  return _root[reserved_name()].as<header_table>();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record_header record_header::parse(const std::string &text)
{
  record_header ret;
  header_table parsed(detail::parse_header_text(text));
  auto it=parsed.find(reserved_name());
  if(parsed.end()==it)
    parsed.emplace(reserved_name(), ret._root[reserved_name()]);
  else
  {
    auto *reserved=it->second.get<header_table>();
    if(!reserved)
      QUIRE_THROW(store_error(errc::malformed_record, std::string("Header key '")+reserved_name()+"' is not a table"));
    auto version=reserved->find("version");
    if(reserved->end()==version)
      reserved->emplace("version", header_value(QUIRE_VERSION_STRING));
    else if(!version->second.is_string())
      QUIRE_THROW(store_error(errc::malformed_record, std::string("Header key '")+reserved_name()+".version' is not a string"));
    auto modules=reserved->find("modules");
    if(reserved->end()!=modules)
    {
      auto *a=modules->second.get<header_array>();
      if(!a)
        QUIRE_THROW(store_error(errc::malformed_record, std::string("Header key '")+reserved_name()+".modules' is not an array"));
      for(auto &m : *a)
        if(!m.is_string())
          QUIRE_THROW(store_error(errc::malformed_record, std::string("Header key '")+reserved_name()+".modules' holds something other than strings"));
    }
  }
  ret._root=std::move(parsed);
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string record_header::serialize() const
{
  return detail::serialize_header_text(_root);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC const header_value *record_header::read(const std::string &path) const
{
  auto segments(detail::split_header_path(path));
  const header_value *ret=nullptr;
  if(!detail::walk_header_path(_root, segments, segments.size(), &ret))
    return nullptr;
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC header_value *record_header::read_mut(const std::string &path)
{
  auto segments(detail::split_header_path(path));
  detail::check_not_reserved(segments, path);
  const header_value *ret=nullptr;
  if(!detail::walk_header_path(_root, segments, segments.size(), &ret))
    return nullptr;
  return const_cast<header_value *>(ret);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<header_value> record_header::set(const std::string &path, header_value value)
{
  auto segments(detail::split_header_path(path));
  detail::check_not_reserved(segments, path);
  header_value *cur=nullptr;
  for(size_t n=0; n<segments.size(); n++)
  {
    auto &s=segments[n];
    bool last=(n==segments.size()-1);
    if(s.is_index)
    {
      auto *a=cur ? cur->get<header_array>() : nullptr;
      if(!a)
        QUIRE_THROW(std::invalid_argument("Header path '"+path+"' indexes into something which is not an array"));
      if(s.index>a->size())
        QUIRE_THROW(std::invalid_argument("Header path '"+path+"' indexes past the end of an array"));
      if(s.index==a->size())
      {
        // Appending
        if(last)
        {
          a->push_back(std::move(value));
          return boost::none;
        }
        a->push_back(header_value(header_table()));
      }
      cur=&(*a)[s.index];
    }
    else
    {
      auto *t=cur ? cur->get<header_table>() : &_root;
      if(!t)
        QUIRE_THROW(std::invalid_argument("Header path '"+path+"' runs through a value which is not a table"));
      auto it=t->find(s.key);
      if(t->end()==it)
      {
        if(last)
        {
          t->emplace(s.key, std::move(value));
          return boost::none;
        }
        it=t->emplace(s.key, header_value(header_table())).first;
      }
      cur=&it->second;
    }
  }
  boost::optional<header_value> ret(std::move(*cur));
  *cur=std::move(value);
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<header_value> record_header::remove(const std::string &path)
{
  auto segments(detail::split_header_path(path));
  detail::check_not_reserved(segments, path);
  const header_value *parent=nullptr;
  if(!detail::walk_header_path(_root, segments, segments.size()-1, &parent))
    return boost::none;
  auto &s=segments.back();
  if(s.is_index)
  {
    auto *a=parent ? const_cast<header_value *>(parent)->get<header_array>() : nullptr;
    if(!a || s.index>=a->size())
      return boost::none;
    boost::optional<header_value> ret(std::move((*a)[s.index]));
    a->erase(a->begin()+s.index);
    return ret;
  }
  auto *t=parent ? const_cast<header_value *>(parent)->get<header_table>() : &_root;
  if(!t)
    return boost::none;
  auto it=t->find(s.key);
  if(t->end()==it)
    return boost::none;
  boost::optional<header_value> ret(std::move(it->second));
  t->erase(it);
  return ret;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string record_header::version() const
{
  auto *v=read(std::string(reserved_name())+".version");
  return (v && v->is_string()) ? v->as<std::string>() : std::string();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::vector<std::string> record_header::modules() const
{
  std::vector<std::string> ret;
  auto *v=read(std::string(reserved_name())+".modules");
  if(v && v->is_array())
    for(auto &m : v->as<header_array>())
      if(m.is_string())
        ret.push_back(m.as<std::string>());
  return ret;
}

QUIRE_V1_NAMESPACE_END
