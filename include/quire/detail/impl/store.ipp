/* store.ipp
The entry store and its checkout handles
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../store.hpp"
#include "../Utility.hpp"
#include "boost/smart_ptr/detail/spinlock.hpp"
#include <sstream>
#include <stdexcept>
#include <unordered_set>

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  // The roots of every store open in this process, keyed by backend::registry_key()
  struct store_registry
  {
    static boost::detail::spinlock &lock()
    {
      static boost::detail::spinlock l=BOOST_DETAIL_SPINLOCK_INIT;
      return l;
    }
    static std::unordered_set<std::string> &roots()
    {
      static std::unordered_set<std::string> r;
      return r;
    }
    static void add(const std::string &key, const filesystem::path &root)
    {
      boost::detail::spinlock::scoped_lock g(lock());
      if(!roots().insert(key).second)
        QUIRE_THROW(store_error(errc::store_in_use, "Store root '"+root.generic_string()+"' is already open in this process", root));
    }
    static void remove(const std::string &key)
    {
      boost::detail::spinlock::scoped_lock g(lock());
      roots().erase(key);
    }
  };

  inline entries_sequence make_entries_sequence(const backend_ptr &backend, const filesystem::path &root, const filesystem::path &dir)
  {
    std::shared_ptr<path_enumerator> walk(backend->list(dir));
    return entries_sequence(lazy_sequence<store_id>([walk, root]() -> boost::optional<outcome<store_id>> {
      filesystem::path p;
      if(!walk->next(p))
        return boost::none;
      return make_value_outcome<store_id>(store_id::from_full_path(root, p));
    }));
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot &checkout::slot() const
{
  if(!_slot)
    QUIRE_THROW(std::logic_error("Use of an empty checkout"));
  return *_slot;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void checkout::release_noexcept() noexcept
{
  if(!_slot)
    return;
  // Take a copy of the id, release() empties us
  std::string id(_slot->rec.location().local_string());
  try
  {
    release();
  }
  catch(const std::exception &e)
  {
    std::ostringstream s;
    s << "write-back of '" << id << "' failed, entry left dirty. ";
    detail::output_exception_info(s, e);
    detail::print_fatal_exception_message_to_stderr(s.str().c_str());
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout &checkout::operator=(checkout &&o) noexcept
{
  if(this!=&o)
  {
    release_noexcept();
    _cache=std::move(o._cache);
    _slot=std::move(o._slot);
    _lock=std::move(o._lock);
  }
  return *this;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout::~checkout()
{
  release_noexcept();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void checkout::commit()
{
  slot();
  _cache->check_in(_slot, false);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void checkout::release()
{
  if(!_slot)
    return;
  std::shared_ptr<entry_cache> cache(std::move(_cache));
  cache_slot_ptr slot(std::move(_slot));
  // The os lock goes only after the write completes or fails
  std::unique_ptr<record_lock> lock(std::move(_lock));
  cache->check_in(slot, true);
  QUIRE_DEBUG_PRINT("C %s released\n", slot->rec.location().local_string().c_str());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store::store(filesystem::path root, store_flags flags, backend_ptr backend, size_t cache_capacity) : _root(std::move(root)), _flags(flags), _backend(std::move(backend))
{
  if(!_backend)
    _backend=make_filesystem_backend(!!(_flags & store_flags::always_sync));
  _backend->open_root(_root, !!(_flags & store_flags::create));
  _registry_key=_backend->registry_key(_root);
  detail::store_registry::add(_registry_key, _root);
  auto unregister=detail::Undoer([this]{ detail::store_registry::remove(_registry_key); });
  // The root stays registered until the cache goes, which outstanding checkouts keep alive
  std::unique_ptr<entry_cache> cache(detail::make_unique<entry_cache>(_backend, _root, cache_capacity));
  std::string key(_registry_key);
  _cache=std::shared_ptr<entry_cache>(cache.release(), [key](entry_cache *c) {
    delete c;
    detail::store_registry::remove(key);
    QUIRE_DEBUG_PRINT("S released %s\n", key.c_str());
  });
  unregister.dismiss();
  QUIRE_DEBUG_PRINT("S opened %s\n", _registry_key.c_str());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC store::~store()
{
  try
  {
    _cache->flush_all();
  }
  catch(const std::exception &e)
  {
    std::ostringstream s;
    s << "flush of store '" << _root.generic_string() << "' on close failed. ";
    detail::output_exception_info(s, e);
    detail::print_fatal_exception_message_to_stderr(s.str().c_str());
  }
  QUIRE_DEBUG_PRINT("S closed %s\n", _registry_key.c_str());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout store::make_checkout(cache_slot_ptr slot)
{
  auto cancel=detail::Undoer([&]{ _cache->cancel_checkout(slot); });
  std::unique_ptr<record_lock> lock;
  if(!!(_flags & store_flags::os_lockable))
    lock=_backend->lock_record(_root/slot->rec.location().local());
  cancel.dismiss();
  return checkout(_cache, std::move(slot), std::move(lock));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout store::create(const store_id &id)
{
  return make_checkout(_cache->checkout_new(id));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC checkout store::retrieve(const store_id &id)
{
  return make_checkout(_cache->checkout(id));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC boost::optional<checkout> store::get(const store_id &id)
{
  try
  {
    return retrieve(id);
  }
  catch(const store_error &e)
  {
    if(errc::not_found!=e.kind())
      QUIRE_RETHROW;
  }
  return boost::none;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::update(checkout &c)
{
  if(c._cache!=_cache)
    QUIRE_THROW(std::invalid_argument("The checkout was not made by this store"));
  c.commit();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::remove(const store_id &id)
{
  _cache->remove(id);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool store::exists(const store_id &id) const
{
  return _cache->exists(id);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::move_by_id(const store_id &from, const store_id &to)
{
  _cache->rename(from, to);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::save_to(const checkout &c, const store_id &to)
{
  _cache->save_as(c.get(), to);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence store::entries() const
{
  return detail::make_entries_sequence(_backend, _root, _root);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entries_sequence store::entries(const std::string &collection) const
{
  store_id where(collection);
  return detail::make_entries_sequence(_backend, _root, _root/where.local());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::flush()
{
  _cache->flush_all();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void store::flush_cache()
{
  _cache->flush_all();
  _cache->evict_clean();
}

QUIRE_V1_NAMESPACE_END
