/* iteration.hpp
Lazy sequences over the identifiers and records of a store
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#ifndef QUIRE_ITERATION_HPP
#define QUIRE_ITERATION_HPP

#include "header.hpp"
#include "store_id.hpp"
#include "boost/outcome.hpp"
#include "boost/exception_ptr.hpp"
#include "boost/iterator/iterator_facade.hpp"
#include "boost/optional.hpp"
#include <functional>
#include <memory>
#include <vector>

QUIRE_V1_NAMESPACE_BEGIN

class store;
class checkout;

//! The item type of every sequence: a value, an error code or a captured exception
template<class T> using outcome = BOOST_OUTCOME_V2_NAMESPACE::outcome<T>;

namespace detail
{
  template<class T> inline outcome<T> make_value_outcome(T &&v)
  {
    return outcome<T>(BOOST_OUTCOME_V2_NAMESPACE::in_place_type<T>, std::move(v));
  }
  //! Captures the exception currently being handled
  template<class T> inline outcome<T> make_exception_outcome()
  {
    return outcome<T>(BOOST_OUTCOME_V2_NAMESPACE::in_place_type<boost::exception_ptr>, boost::current_exception());
  }
  //! Rewraps the failure of \em o as a failure of another item type
  template<class U, class T> inline outcome<U> forward_failure(const outcome<T> &o)
  {
    if(o.has_exception())
      return outcome<U>(BOOST_OUTCOME_V2_NAMESPACE::in_place_type<boost::exception_ptr>, o.exception());
    return outcome<U>(BOOST_OUTCOME_V2_NAMESPACE::in_place_type<error_code>, o.error());
  }
}

/*! \class lazy_sequence
\brief A finite, single pass sequence of outcome<T> computed on demand

A failure is just another item: one bad item never ends the sequence, and the
combinators pass failures through untouched. The combinators consume the sequence
they are called on. Exceptions thrown while producing an item are captured into it.
*/
template<class T> class lazy_sequence
{
public:
  typedef outcome<T> item_type;
  typedef std::function<boost::optional<item_type>()> source_type;
private:
  source_type _source;
  boost::optional<item_type> _current;
  void advance() { _current=next(); }
public:
  class iterator : public boost::iterator_facade<iterator, item_type, boost::single_pass_traversal_tag>
  {
    friend class boost::iterator_core_access;
    lazy_sequence *_seq;
    void increment()
    {
      _seq->advance();
      if(!_seq->_current)
        _seq=nullptr;
    }
    bool equal(const iterator &o) const { return _seq==o._seq; }
    item_type &dereference() const { return *_seq->_current; }
  public:
    iterator() : _seq(nullptr) { }
    explicit iterator(lazy_sequence *seq) : _seq(seq) { }
  };

  //! Constructs an empty sequence
  lazy_sequence() { }
  //! Constructs a sequence drawing items from \em source until it returns an empty optional
  explicit lazy_sequence(source_type source) : _source(std::move(source)) { }
  lazy_sequence(lazy_sequence &&o) noexcept : _source(std::move(o._source)), _current(std::move(o._current)) { o._source=nullptr; }
  lazy_sequence &operator=(lazy_sequence &&o) noexcept
  {
    _source=std::move(o._source);
    _current=std::move(o._current);
    o._source=nullptr;
    return *this;
  }
  lazy_sequence(const lazy_sequence &)=delete;
  lazy_sequence &operator=(const lazy_sequence &)=delete;

  //! Produces the next item, or an empty optional at the end
  boost::optional<item_type> next()
  {
    if(!_source)
      return boost::none;
    boost::optional<item_type> ret;
    try
    {
      ret=_source();
    }
    catch(...)
    {
      ret=detail::make_exception_outcome<T>();
    }
    if(!ret)
      _source=nullptr;
    return ret;
  }
  //! Starts the single pass. Only one iteration of a sequence is possible.
  iterator begin()
  {
    advance();
    return iterator(_current ? this : nullptr);
  }
  iterator end() { return iterator(); }

  //! Drains the sequence into a vector, throwing the first failure met
  std::vector<T> collect() &&
  {
    std::vector<T> ret;
    while(auto i=next())
      ret.push_back(std::move(i->value()));
    return ret;
  }
  //! Keeps the values satisfying \em pred and every failure
  lazy_sequence filter(std::function<bool(const T &)> pred) &&
  {
    auto src=std::make_shared<lazy_sequence>(std::move(*this));
    return lazy_sequence([src, pred]() -> boost::optional<item_type> {
      while(auto i=src->next())
      {
        if(!i->has_value() || pred(i->value()))
          return i;
      }
      return boost::none;
    });
  }
  //! Maps values through \em f, whose exceptions become failure items
  template<class U> lazy_sequence<U> transform(std::function<U(T &&)> f) &&
  {
    auto src=std::make_shared<lazy_sequence>(std::move(*this));
    return lazy_sequence<U>([src, f]() -> boost::optional<outcome<U>> {
      auto i=src->next();
      if(!i)
        return boost::none;
      if(!i->has_value())
        return detail::forward_failure<U>(*i);
      return detail::make_value_outcome<U>(f(std::move(i->value())));
    });
  }
};

/*! \class entries_sequence
\brief The identifiers of the records in a store, in backend order

Paths which are not valid identifiers arrive as failure items carrying
errc::invalid_identifier. The into_*_iter() adaptors turn identifiers into
records of the given store.
*/
class QUIRE_DECL entries_sequence : public lazy_sequence<store_id>
{
public:
  entries_sequence() { }
  explicit entries_sequence(lazy_sequence<store_id> &&o) : lazy_sequence<store_id>(std::move(o)) { }
  //! Keeps ids whose first segments are \em collection
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence in_collection(const std::string &collection) &&;
  //! Keeps ids whose local path contains \em s
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence find_by_id_substr(const std::string &s) &&;
  //! Keeps ids whose local path starts with \em s
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence find_by_id_startswith(const std::string &s) &&;
  //! Checks out every record. Each checkout must be released before its record can be checked out again.
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<checkout> into_retrieve_iter(store &s) &&;
  //! As into_retrieve_iter(), with records deleted in the meantime yielding an empty optional
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<boost::optional<checkout>> into_get_iter(store &s) &&;
  //! Deletes every record, yielding the ids deleted
  QUIRE_HEADERS_ONLY_MEMFUNC_SPEC lazy_sequence<store_id> into_delete_iter(store &s) &&;
};

//! Keeps the checkouts whose header has a value at \em path satisfying \em pred. Failures pass through.
QUIRE_HEADERS_ONLY_FUNC_SPEC lazy_sequence<checkout> where_header(lazy_sequence<checkout> &&seq, const std::string &path, std::function<bool(const header_value &)> pred);

QUIRE_V1_NAMESPACE_END

#endif
