/* record.hpp
A stored item: a structured header plus free text content
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_RECORD_HPP
#define QUIRE_RECORD_HPP

#include "header.hpp"
#include "store_id.hpp"
#include <utility>

QUIRE_V1_NAMESPACE_BEGIN

/*! \class record
\brief The in-memory form of one stored item

On disk a record is UTF-8 text. If its first line is exactly `---` a header block
follows, closed by the next line which is exactly `---`; everything after that line is
the content, byte for byte. Any later `---` lines belong to the content. A file whose
first line is not `---` is all content and gets a default header.

\qexample{record_example}
*/
class QUIRE_DECL record
{
  store_id _location;
  record_header _header;
  std::string _content;
public:
  //! The delimiter line opening and closing a header block, without its newline
  static const char *delimiter() noexcept { return "---"; }

  //! Constructs an empty record with a default header
  explicit record(store_id location) : _location(std::move(location)) { }
  record(store_id location, record_header header, std::string content) : _location(std::move(location)), _header(std::move(header)), _content(std::move(content)) { }

  /*! Parses stored bytes. Throws store_error(errc::malformed_record) if a header block is
  opened but never closed, or if its text does not parse.
  */
  static QUIRE_HEADERS_ONLY_MEMFUNC_SPEC record from_bytes(store_id location, const std::string &bytes);
  //! Serialises to the stored form. Round-trips byte for byte with from_bytes() for canonical input.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC std::string to_bytes() const;

  //! The id of this record
  const store_id &location() const noexcept { return _location; }
  //! The header
  const record_header &header() const noexcept { return _header; }
  //! \overload
  record_header &header() noexcept { return _header; }
  //! The content
  const std::string &content() const noexcept { return _content; }
  //! Replaces the content
  void set_content(std::string content) { _content=std::move(content); }
  //! Replaces every header key outside the reserved table, which keeps its current version and modules
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void set_header(record_header header);

  //! Adds \em module to the owning modules in the reserved header table, if not already there
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void tag_module(const std::string &module);

  //! Header and content equality. The location is not compared.
  bool operator==(const record &o) const { return _header==o._header && _content==o._content; }
  bool operator!=(const record &o) const { return !(*this==o); }
};

namespace detail
{
  //! Splits stored bytes into header text (empty optional if there is no header block) and content
  QUIRE_HEADERS_ONLY_FUNC_SPEC std::pair<boost::optional<std::string>, std::string> split_record_text(const std::string &bytes);
}

QUIRE_V1_NAMESPACE_END

#if QUIRE_HEADERS_ONLY == 1
#include "detail/impl/record.ipp"
#endif

#endif
