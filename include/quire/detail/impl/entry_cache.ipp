/* entry_cache.ipp
The process-wide owner of loaded records
(C) 2016 the quire developers
File Created: Mar 2016

Distributed under the Boost Software License, Version 1.0.
See accompanying file LICENSE_1_0.txt or copy at
http://www.boost.org/LICENSE_1_0.txt
*/

#include "../../entry_cache.hpp"
#include "../Utility.hpp"
#include <exception>
#include <stdexcept>

QUIRE_V1_NAMESPACE_BEGIN

namespace detail
{
  inline void throw_already_borrowed(const store_id &id, const filesystem::path &where)
  {
    QUIRE_THROW(store_error(errc::already_borrowed, "Record '"+id.local_string()+"' is already checked out", where));
  }
  inline void throw_already_exists(const store_id &id, const filesystem::path &where)
  {
    QUIRE_THROW(store_error(errc::already_exists, "Record '"+id.local_string()+"' already exists", where));
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC entry_cache::entry_cache(backend_ptr backend, filesystem::path root, size_t capacity) : _backend(std::move(backend)), _root(std::move(root)), _capacity(capacity)
{
  if(!_backend)
    QUIRE_THROW(std::invalid_argument("entry_cache needs a backend"));
}

// Called with _lock held
QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr entry_cache::load(const store_id &id)
{
  filesystem::path where(full_path(id));
  auto slot=std::make_shared<cache_slot>(record::from_bytes(id.with_base(_root), _backend->read(where)));
  // Compare against the canonical form so a hand written file is not rewritten merely by reading it
  slot->persisted=slot->rec.to_bytes();
  slot->has_persisted=true;
  _slots.emplace(id.without_base(), slot);
  QUIRE_DEBUG_PRINT("L %s\n", where.generic_string().c_str());
  return slot;
}

// Called with _lock held. A directory of records blocks a record of the same name.
QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::occupied(const filesystem::path &where) const
{
  return _backend->exists(where) || _backend->is_directory(where);
}

// Called with _lock held. On failure the slot is unchanged and so stays dirty.
QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::write(cache_slot &slot, const std::string &bytes)
{
  filesystem::path where(full_path(slot.rec.location()));
  _backend->write(where, bytes);
  slot.persisted=bytes;
  slot.has_persisted=true;
  slot.dirty=false;
  QUIRE_DEBUG_PRINT("W %s (%u bytes)\n", where.generic_string().c_str(), (unsigned) bytes.size());
}

// Called with _lock held
QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::shrink()
{
  if(!_capacity)
    return;
  for(auto it=_slots.begin(); it!=_slots.end() && _slots.size()>_capacity;)
  {
    if(!it->second->dirty && !it->second->borrowed)
      it=_slots.erase(it);
    else
      ++it;
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t entry_cache::size() const
{
  std::lock_guard<std::mutex> g(_lock);
  return _slots.size();
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::contains(const store_id &id) const
{
  std::lock_guard<std::mutex> g(_lock);
  return _slots.count(id)!=0;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::is_borrowed(const store_id &id) const
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  return _slots.end()!=it && it->second->borrowed;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::is_dirty(const store_id &id) const
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  return _slots.end()!=it && it->second->dirty;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::exists(const store_id &id) const
{
  std::lock_guard<std::mutex> g(_lock);
  return _slots.count(id)!=0 || _backend->exists(full_path(id));
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr entry_cache::get_or_load(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  if(_slots.end()!=it)
    return it->second;
  return load(id);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::mark_dirty(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  if(_slots.end()==it)
    QUIRE_THROW(store_error(errc::not_found, "Record '"+id.local_string()+"' is not loaded", full_path(id)));
  it->second->dirty=true;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::flush(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  if(_slots.end()==it || !it->second->dirty || it->second->borrowed)
    return false;
  write(*it->second, it->second->rec.to_bytes());
  return true;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::flush_all()
{
  std::lock_guard<std::mutex> g(_lock);
  std::exception_ptr first;
  for(auto &i : _slots)
  {
    cache_slot &slot=*i.second;
    if(!slot.dirty || slot.borrowed)
      continue;
    try
    {
      write(slot, slot.rec.to_bytes());
    }
    catch(const std::exception &e)
    {
      QUIRE_DEBUG_PRINT("E flush of %s failed: %s\n", i.first.local_string().c_str(), e.what());
      (void) e;
      if(!first)
        first=std::current_exception();
    }
  }
  if(first)
    std::rethrow_exception(first);
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC bool entry_cache::evict(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  auto it=_slots.find(id);
  if(_slots.end()==it || it->second->dirty || it->second->borrowed)
    return false;
  _slots.erase(it);
  return true;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC size_t entry_cache::evict_clean()
{
  std::lock_guard<std::mutex> g(_lock);
  size_t count=0;
  for(auto it=_slots.begin(); it!=_slots.end();)
  {
    if(!it->second->dirty && !it->second->borrowed)
    {
      it=_slots.erase(it);
      ++count;
    }
    else
      ++it;
  }
  return count;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::remove(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  filesystem::path where(full_path(id));
  auto it=_slots.find(id);
  if(_slots.end()!=it && it->second->borrowed)
    detail::throw_already_borrowed(id, where);
  bool on_backend=_backend->exists(where);
  if(!on_backend && _slots.end()==it)
    QUIRE_THROW(store_error(errc::not_found, "Record '"+id.local_string()+"' not found", where));
  if(on_backend)
    _backend->remove(where);
  if(_slots.end()!=it)
    _slots.erase(it);
  QUIRE_DEBUG_PRINT("D %s\n", where.generic_string().c_str());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr entry_cache::checkout(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  cache_slot_ptr slot;
  auto it=_slots.find(id);
  if(_slots.end()!=it)
  {
    if(it->second->borrowed)
      detail::throw_already_borrowed(id, full_path(id));
    slot=it->second;
  }
  else
    slot=load(id);
  slot->borrowed=true;
  return slot;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC cache_slot_ptr entry_cache::checkout_new(const store_id &id)
{
  std::lock_guard<std::mutex> g(_lock);
  filesystem::path where(full_path(id));
  auto it=_slots.find(id);
  if(_slots.end()!=it)
  {
    if(it->second->borrowed)
      detail::throw_already_borrowed(id, where);
    detail::throw_already_exists(id, where);
  }
  if(occupied(where))
    detail::throw_already_exists(id, where);
  auto slot=std::make_shared<cache_slot>(record(id.with_base(_root)));
  slot->dirty=true;
  slot->borrowed=true;
  _slots.emplace(id.without_base(), slot);
  return slot;
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::check_in(const cache_slot_ptr &slot, bool release)
{
  // Only the borrower touches rec, so serialising needs no lock
  std::string bytes(slot->rec.to_bytes());
  std::lock_guard<std::mutex> g(_lock);
  auto unborrow=detail::Undoer([&]{ if(release) slot->borrowed=false; });
  if(!slot->has_persisted || bytes!=slot->persisted)
    slot->dirty=true;
  if(slot->dirty)
    write(*slot, bytes);
  unborrow.dismiss();
  if(release)
  {
    slot->borrowed=false;
    shrink();
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::cancel_checkout(const cache_slot_ptr &slot)
{
  std::lock_guard<std::mutex> g(_lock);
  slot->borrowed=false;
  if(!slot->has_persisted)
  {
    auto it=_slots.find(slot->rec.location());
    if(_slots.end()!=it && it->second==slot)
      _slots.erase(it);
  }
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::rename(const store_id &from, const store_id &to)
{
  std::lock_guard<std::mutex> g(_lock);
  filesystem::path src(full_path(from)), dest(full_path(to));
  auto f=_slots.find(from);
  if(_slots.end()!=f && f->second->borrowed)
    detail::throw_already_borrowed(from, src);
  if(_slots.count(to) || occupied(dest))
    detail::throw_already_exists(to, dest);
  if(_slots.end()!=f && f->second->dirty)
    write(*f->second, f->second->rec.to_bytes());
  _backend->rename(src, dest);
  if(_slots.end()!=f)
    _slots.erase(f);
  QUIRE_DEBUG_PRINT("R %s -> %s\n", src.generic_string().c_str(), dest.generic_string().c_str());
}

QUIRE_HEADERS_ONLY_MEMFUNC_SPEC void entry_cache::save_as(const record &rec, const store_id &to)
{
  std::lock_guard<std::mutex> g(_lock);
  filesystem::path dest(full_path(to));
  if(_slots.count(to) || occupied(dest))
    detail::throw_already_exists(to, dest);
  record copy(to.with_base(_root), rec.header(), rec.content());
  _backend->write(dest, copy.to_bytes());
}

QUIRE_V1_NAMESPACE_END
