#include "test_functions.hpp"

QUIRE_AUTO_TEST_CASE(entry_cache_works, "Tests that the entry cache loads lazily, writes only changes and keeps failed writes dirty", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=std::make_shared<failing_backend>();
  const filesystem::path root("/cache");
  b->write(root/"a", "---\ntitle = \"a\"\n\n[quire]\nversion = \"" QUIRE_VERSION_STRING "\"\n---\nA");
  b->write(root/"bad", "---\nunclosed\n");
  // Lacks the [quire] table, so its canonical form differs
  const std::string handwritten("---\ntitle = \"s\"\n---\nS");
  b->write(root/"handwritten", handwritten);
  const size_t initial_writes=b->write_count();
  entry_cache cache(b, root);
  BOOST_CHECK(cache.size()==0);

  std::cout << "Checking lazy loading" << std::endl;
  auto a=cache.get_or_load("a");
  BOOST_CHECK(cache.size()==1);
  BOOST_CHECK(a->rec.content()=="A");
  BOOST_CHECK(a->rec.location().has_base() && a->rec.location().full_path()==root/"a");
  BOOST_CHECK(!a->dirty && !a->borrowed && a->has_persisted);
  BOOST_CHECK(cache.get_or_load("a")==a);
  QUIRE_CHECK_ERRC(cache.get_or_load("missing"), errc::not_found);
  QUIRE_CHECK_ERRC(cache.get_or_load("bad"), errc::malformed_record);
  BOOST_CHECK(cache.size()==1);
  BOOST_CHECK(!cache.contains("missing"));

  std::cout << "Checking non canonical files are not rewritten by reading" << std::endl;
  {
    const size_t writes=b->write_count();
    auto held=cache.checkout("handwritten");
    BOOST_CHECK(held->rec.header().read("title")->as<std::string>()=="s");
    BOOST_CHECK(!held->dirty);
    cache.check_in(held, true);
    BOOST_CHECK(b->write_count()==writes);
    BOOST_CHECK(b->read(root/"handwritten")==handwritten);
    BOOST_CHECK(cache.evict("handwritten"));
  }

  std::cout << "Checking flushes write only dirty entries" << std::endl;
  BOOST_CHECK(!cache.flush("a"));
  BOOST_CHECK(!cache.flush("not-loaded"));
  BOOST_CHECK(b->write_count()==initial_writes);
  a->rec.set_content("A2");
  cache.mark_dirty("a");
  BOOST_CHECK(cache.is_dirty("a"));
  BOOST_CHECK(cache.flush("a"));
  BOOST_CHECK(!cache.is_dirty("a"));
  BOOST_CHECK(b->write_count()==initial_writes+1);
  BOOST_CHECK(!cache.flush("a"));
  cache.flush_all();
  BOOST_CHECK(b->write_count()==initial_writes+1);
  BOOST_CHECK(record::from_bytes("a", b->read(root/"a")).content()=="A2");
  QUIRE_CHECK_ERRC(cache.mark_dirty("not-loaded"), errc::not_found);

  std::cout << "Checking checkout and check in" << std::endl;
  auto held=cache.checkout("a");
  BOOST_CHECK(held==a && a->borrowed);
  QUIRE_CHECK_ERRC(cache.checkout("a"), errc::already_borrowed);
  QUIRE_CHECK_ERRC(cache.checkout_new("a"), errc::already_borrowed);
  QUIRE_CHECK_ERRC(cache.remove("a"), errc::already_borrowed);
  BOOST_CHECK(!cache.evict("a"));
  // Unchanged bytes are never rewritten
  cache.check_in(held, false);
  BOOST_CHECK(b->write_count()==initial_writes+1);
  BOOST_CHECK(a->borrowed);
  held->rec.header().set("title", "changed");
  cache.check_in(held, true);
  BOOST_CHECK(!a->borrowed && !a->dirty);
  BOOST_CHECK(b->write_count()==initial_writes+2);

  std::cout << "Checking a failed write back leaves the entry dirty" << std::endl;
  held=cache.checkout("a");
  held->rec.set_content("A3");
  b->fail_writes=true;
  QUIRE_CHECK_ERRC(cache.check_in(held, true), errc::backend_io);
  BOOST_CHECK(!a->borrowed);
  BOOST_CHECK(cache.is_dirty("a"));
  BOOST_CHECK(!cache.evict("a"));
  QUIRE_CHECK_ERRC(cache.flush_all(), errc::backend_io);
  BOOST_CHECK(cache.is_dirty("a"));
  b->fail_writes=false;
  cache.flush_all();
  BOOST_CHECK(!cache.is_dirty("a"));
  BOOST_CHECK(record::from_bytes("a", b->read(root/"a")).content()=="A3");

  std::cout << "Checking new entries" << std::endl;
  QUIRE_CHECK_ERRC(cache.checkout_new("a"), errc::already_exists);
  auto fresh=cache.checkout_new("n/1");
  BOOST_CHECK(fresh->dirty && fresh->borrowed && !fresh->has_persisted);
  QUIRE_CHECK_ERRC(cache.checkout_new("n/1"), errc::already_borrowed);
  BOOST_CHECK(!b->exists(root/"n"/"1"));
  // Cancelling a never written entry forgets it
  cache.cancel_checkout(fresh);
  BOOST_CHECK(!cache.contains("n/1"));
  fresh=cache.checkout_new("n/1");
  cache.check_in(fresh, true);
  BOOST_CHECK(b->exists(root/"n"/"1"));
  BOOST_CHECK(!fresh->dirty);

  std::cout << "Checking removal and eviction" << std::endl;
  cache.remove("n/1");
  BOOST_CHECK(!cache.contains("n/1"));
  BOOST_CHECK(!b->exists(root/"n"/"1"));
  QUIRE_CHECK_ERRC(cache.remove("n/1"), errc::not_found);
  b->write(root/"c", "C");
  // Removing an entry only on the backend works too
  cache.remove("c");
  BOOST_CHECK(!b->exists(root/"c"));
  BOOST_CHECK(cache.evict("a"));
  BOOST_CHECK(!cache.contains("a"));
  cache.get_or_load("a");
  BOOST_CHECK(cache.evict_clean()==1);
  BOOST_CHECK(cache.size()==0);
}

QUIRE_AUTO_TEST_CASE(entry_cache_capacity_works, "Tests that a bounded entry cache evicts only clean, released entries", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  const filesystem::path root("/bounded");
  for(int n=0; n<5; n++)
    b->write(root/std::to_string(n), "content "+std::to_string(n));
  entry_cache cache(b, root, 2);
  BOOST_CHECK(cache.capacity()==2);
  std::vector<cache_slot_ptr> held;
  for(int n=0; n<4; n++)
    held.push_back(cache.checkout(std::to_string(n)));
  BOOST_CHECK(cache.size()==4);
  // Releasing shrinks back to capacity, but never below the borrowed entries
  cache.check_in(held[0], true);
  BOOST_CHECK(cache.size()==3);
  cache.check_in(held[1], true);
  BOOST_CHECK(cache.size()==2);
  cache.check_in(held[2], true);
  cache.check_in(held[3], true);
  BOOST_CHECK(cache.size()==2);
}

QUIRE_AUTO_TEST_CASE(entry_cache_rename_works, "Tests that entry cache renames and copies respect borrowing and existing records", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  const filesystem::path root("/renames");
  entry_cache cache(b, root);
  auto s=cache.checkout_new("from");
  s->rec.set_content("payload");
  QUIRE_CHECK_ERRC(cache.rename("from", "to"), errc::already_borrowed);
  cache.check_in(s, true);
  b->write(root/"taken", "x");
  QUIRE_CHECK_ERRC(cache.rename("from", "taken"), errc::already_exists);
  QUIRE_CHECK_ERRC(cache.rename("nothing", "elsewhere"), errc::not_found);
  cache.rename("from", "to");
  BOOST_CHECK(!cache.contains("from"));
  BOOST_CHECK(!b->exists(root/"from"));
  BOOST_CHECK(record::from_bytes("to", b->read(root/"to")).content()=="payload");

  record copy(store_id("ignored"), record_header(), "copied");
  cache.save_as(copy, "copy");
  BOOST_CHECK(record::from_bytes("copy", b->read(root/"copy")).content()=="copied");
  QUIRE_CHECK_ERRC(cache.save_as(copy, "copy"), errc::already_exists);
  QUIRE_CHECK_ERRC(cache.save_as(copy, "taken"), errc::already_exists);
}
