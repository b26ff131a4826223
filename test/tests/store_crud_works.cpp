#include "test_functions.hpp"
#include <vector>

QUIRE_AUTO_TEST_CASE(store_crud_works, "Tests that the store creates, retrieves, updates and deletes records", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  store s("/crud", store_flags::create, b);
  BOOST_CHECK(s.path()==filesystem::path("/crud"));
  BOOST_CHECK(s.backend()==b);
  BOOST_CHECK(s.flags()==store_flags::create);
  BOOST_CHECK(!!((store_flags::create|store_flags::os_lockable) & store_flags::os_lockable));
  BOOST_CHECK(!(store_flags::create & store_flags::always_sync));
  BOOST_CHECK(!(store_flags::create & ~store_flags::create));

  std::cout << "Checking create and write back on scope exit" << std::endl;
  {
    auto c=s.create("notes/n1");
    BOOST_CHECK(!!c);
    BOOST_CHECK(c.id()==store_id("notes/n1"));
    c.header().set("title", "x");
    c.set_content("hello");
    BOOST_CHECK(b->write_count()==0);
  }
  BOOST_CHECK(b->write_count()==1);
  BOOST_CHECK(b->read("/crud/notes/n1")==
    "---\n"
    "title = \"x\"\n"
    "\n"
    "[quire]\n"
    "version = \"" QUIRE_VERSION_STRING "\"\n"
    "---\n"
    "hello");
  BOOST_CHECK(s.exists("notes/n1"));

  std::cout << "Checking retrieve sees what was written" << std::endl;
  {
    auto r=s.retrieve("notes/n1");
    BOOST_CHECK(r->header().read("title")->as<std::string>()=="x");
    BOOST_CHECK(r.content()=="hello");
    BOOST_CHECK((*r).content()=="hello");
  }
  // Nothing changed so nothing was written
  BOOST_CHECK(b->write_count()==1);
  s.flush();
  BOOST_CHECK(b->write_count()==1);

  std::cout << "Checking create refuses to clobber" << std::endl;
  QUIRE_CHECK_ERRC(s.create("notes/n1"), errc::already_exists);
  b->write("/crud/notes/external", "made elsewhere");
  QUIRE_CHECK_ERRC(s.create("notes/external"), errc::already_exists);
  BOOST_CHECK(s.retrieve("notes/external").content()=="made elsewhere");
  // Reading a hand written file leaves it byte for byte as it was
  BOOST_CHECK(b->write_count()==2);
  BOOST_CHECK(b->read("/crud/notes/external")=="made elsewhere");
  QUIRE_CHECK_ERRC(s.create("../escape"), errc::invalid_identifier);

  std::cout << "Checking commit writes without releasing" << std::endl;
  {
    auto r=s.retrieve("notes/n1");
    r.set_content("hello again");
    r.commit();
    BOOST_CHECK(b->write_count()==3);
    QUIRE_CHECK_ERRC(s.retrieve("notes/n1"), errc::already_borrowed);
    r.set_content("and again");
    s.update(r);
    BOOST_CHECK(b->write_count()==4);
  }
  BOOST_CHECK(b->write_count()==4);
  BOOST_CHECK(record::from_bytes("notes/n1", b->read("/crud/notes/n1")).content()=="and again");

  std::cout << "Checking explicit release" << std::endl;
  {
    auto r=s.retrieve("notes/n1");
    r.set_content("released");
    r.release();
    BOOST_CHECK(!r);
    BOOST_CHECK_THROW(r.content(), std::logic_error);
    BOOST_CHECK_NO_THROW(r.release());
    auto again=s.retrieve("notes/n1");
    BOOST_CHECK(again.content()=="released");
  }

  std::cout << "Checking moving a checkout keeps one holder" << std::endl;
  {
    auto r=s.retrieve("notes/n1");
    checkout moved(std::move(r));
    BOOST_CHECK(!r);
    BOOST_CHECK(!!moved);
    QUIRE_CHECK_ERRC(s.retrieve("notes/n1"), errc::already_borrowed);
    auto other=s.retrieve("notes/external");
    other=std::move(moved);
    // The record other held was released by the assignment
    BOOST_CHECK_NO_THROW(s.retrieve("notes/external"));
    BOOST_CHECK(other.id()==store_id("notes/n1"));
  }

  std::cout << "Checking get" << std::endl;
  {
    auto g=s.get("notes/n1");
    BOOST_REQUIRE(g);
    BOOST_CHECK(g->content()=="released");
  }
  BOOST_CHECK(!s.get("notes/none"));
  {
    auto held=s.retrieve("notes/n1");
    QUIRE_CHECK_ERRC(s.get("notes/n1"), errc::already_borrowed);
  }

  std::cout << "Checking delete" << std::endl;
  {
    auto held=s.retrieve("notes/n1");
    QUIRE_CHECK_ERRC(s.remove("notes/n1"), errc::already_borrowed);
  }
  s.remove("notes/n1");
  BOOST_CHECK(!s.exists("notes/n1"));
  BOOST_CHECK(!b->exists("/crud/notes/n1"));
  QUIRE_CHECK_ERRC(s.retrieve("notes/n1"), errc::not_found);
  QUIRE_CHECK_ERRC(s.remove("notes/n1"), errc::not_found);
  // A deleted record can be created afresh
  {
    auto c=s.create("notes/n1");
    BOOST_CHECK(c.content().empty());
  }
  BOOST_CHECK(s.exists("notes/n1"));
}

QUIRE_AUTO_TEST_CASE(store_move_and_save_works, "Tests that records can be renamed and copied to new ids", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=make_inmemory_backend();
  store s("/moves", store_flags::create, b);
  {
    auto c=s.create("inbox/1");
    c.header().set("subject", "hi");
    c.set_content("body");
  }
  s.move_by_id("inbox/1", "archive/2019/1");
  BOOST_CHECK(!s.exists("inbox/1"));
  QUIRE_CHECK_ERRC(s.retrieve("inbox/1"), errc::not_found);
  {
    auto r=s.retrieve("archive/2019/1");
    BOOST_CHECK(r->header().read("subject")->as<std::string>()=="hi");
    QUIRE_CHECK_ERRC(s.move_by_id("archive/2019/1", "elsewhere"), errc::already_borrowed);

    std::cout << "Checking save_to copies the current state" << std::endl;
    r.set_content("edited");
    s.save_to(r, "archive/2019/1-copy");
    QUIRE_CHECK_ERRC(s.save_to(r, "archive/2019/1-copy"), errc::already_exists);
  }
  BOOST_CHECK(s.retrieve("archive/2019/1-copy").content()=="edited");
  BOOST_CHECK(s.retrieve("archive/2019/1").content()=="edited");
  QUIRE_CHECK_ERRC(s.move_by_id("archive/2019/1", "archive/2019/1-copy"), errc::already_exists);
  QUIRE_CHECK_ERRC(s.move_by_id("nothing", "anything"), errc::not_found);

  std::cout << "Checking a replaced header keeps the owning modules" << std::endl;
  {
    auto c=s.retrieve("archive/2019/1-copy");
    c->tag_module("mail");
    c.set_header(record_header::parse("subject = \"replaced\"\n"));
  }
  auto kept=s.retrieve("archive/2019/1-copy");
  BOOST_CHECK(kept.header().modules()==std::vector<std::string>({"mail"}));
  BOOST_CHECK(kept.header().read("subject")->as<std::string>()=="replaced");
}

QUIRE_AUTO_TEST_CASE(store_write_back_failure, "Tests that a failed write back on release keeps the record dirty for the next flush", 10)
{
  using namespace QUIRE_V1_NAMESPACE;
  auto b=std::make_shared<failing_backend>();
  store s("/failing", store_flags::create, b);
  {
    auto c=s.create("x");
    c.set_content("v1");
  }
  b->fail_writes=true;
  {
    auto r=s.retrieve("x");
    r.set_content("v2");
    QUIRE_CHECK_ERRC(r.release(), errc::backend_io);
    BOOST_CHECK(!r);
  }
  BOOST_CHECK(s.cache()->is_dirty("x"));
  {
    auto r=s.retrieve("x");
    r.set_content("v3");
    std::cout << "Expect a write-back failure message on stderr:" << std::endl;
  }
  BOOST_CHECK(s.cache()->is_dirty("x"));
  QUIRE_CHECK_ERRC(s.flush(), errc::backend_io);
  b->fail_writes=false;
  s.flush();
  BOOST_CHECK(!s.cache()->is_dirty("x"));
  BOOST_CHECK(record::from_bytes("x", b->read("/failing/x")).content()=="v3");
  s.flush_cache();
  BOOST_CHECK(s.cache_size()==0);
}

QUIRE_AUTO_TEST_CASE(store_directory_ids, "Tests that an id naming a directory of records is neither readable nor creatable", 20)
{
  using namespace QUIRE_V1_NAMESPACE;
  scratch_dir dir;
  std::vector<std::pair<filesystem::path, backend_ptr>> roots={
    { filesystem::path("/dirs"), make_inmemory_backend() },
    { dir.path, make_filesystem_backend() }
  };
  for(auto &r : roots)
  {
    std::cout << "Checking directory ids under " << r.first << std::endl;
    store s(r.first, store_flags::create, r.second);
    {
      auto c=s.create("diary/2019/05/01");
      c.set_content("a day");
    }
    {
      auto c=s.create("loose");
      c.set_content("not filed");
    }
    QUIRE_CHECK_ERRC(s.retrieve("diary"), errc::not_found);
    BOOST_CHECK(!s.get("diary/2019"));
    BOOST_CHECK(!s.exists("diary"));
    QUIRE_CHECK_ERRC(s.create("diary"), errc::already_exists);
    QUIRE_CHECK_ERRC(s.move_by_id("loose", "diary/2019"), errc::already_exists);
    {
      auto c=s.retrieve("loose");
      QUIRE_CHECK_ERRC(s.save_to(c, "diary/2019/05"), errc::already_exists);
    }
    // Nothing was left behind to break later write backs
    BOOST_CHECK_NO_THROW(s.flush());
    BOOST_CHECK(s.retrieve("diary/2019/05/01").content()=="a day");
    BOOST_CHECK(s.retrieve("loose").content()=="not filed");
  }
}
