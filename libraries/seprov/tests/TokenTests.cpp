#include <seprov/Token.hpp>

#include "test_util.hpp"

#include <catch2/catch.hpp>

using namespace seprov;
using namespace seprov::test;

TEST_CASE("listingHasLabels")
{
   std::string empty;
   auto        some = listing({"SE_83000044"});
   auto        all  = listing({"SE_83000044", "SE_83000045"});

   std::vector<std::string> wanted{"SE_83000044", "SE_83000045"};
   CHECK(!listingHasLabels(empty, wanted));
   CHECK(!listingHasLabels(some, wanted));
   CHECK(listingHasLabels(all, wanted));
   CHECK(listingHasLabels(empty, {}));

   // A label that is a prefix of a listed label matches
   CHECK(listingHasLabels(some, {"SE_8300004"}));
   // A label that extends a listed label does not
   CHECK(!listingHasLabels(listing({"SE_8300004"}), {"SE_83000044"}));
   // Both labels may match the same line
   CHECK(listingHasLabels(some, {"SE_8300004", "SE_83000044"}));
   // Labels split across lines do not match
   CHECK(!listingHasLabels("label: SE_8300\n0044\n", {"SE_83000044"}));
   CHECK(listingHasLabels("label: SE_83000044", {"SE_83000044"}));
}

TEST_CASE("An uninitialized token is initialized once")
{
   TempDirectory dir;
   auto          config = testConfig(dir.path);
   FakeRunner    runner;
   runner.on("--pin 87654321 --list-objects", 1, "error: PKCS11 function C_Login failed\n");
   runner.on("--pin 87654321 --list-objects", 0, "");
   TokenManager tokens(config, runner);

   auto& token = tokens.getInitialized();
   CHECK(&tokens.getInitialized() == &token);

   REQUIRE(runner.calls.size() == 3);
   CHECK(runner.calls[1] ==
         std::vector<std::string>{"pkcs11-tool", "--module", "/usr/lib/libckteec.so.0",
                                  "--init-token", "--label", "aktualizr", "--so-pin", "12345678"});
   CHECK(runner.calls[2] == std::vector<std::string>{"pkcs11-tool", "--module",
                                                     "/usr/lib/libckteec.so.0", "--token-label",
                                                     "aktualizr", "--init-pin", "--so-pin",
                                                     "12345678", "--pin", "87654321"});
   CHECK(runner.count("--list-objects") == 1);
}

TEST_CASE("An initialized token is not initialized again")
{
   TempDirectory dir;
   auto          config = testConfig(dir.path);
   FakeRunner    runner;
   TokenManager  tokens(config, runner);

   CHECK(tokens.isInitialized());
   tokens.getInitialized();
   CHECK(runner.mutations() == 0);
}

TEST_CASE("Token initialization failure is fatal")
{
   TempDirectory dir;
   auto          config = testConfig(dir.path);
   FakeRunner    runner;
   runner.on("--list-objects", 1);
   runner.on("--init-pin", 1, "error: PKCS11 function C_InitPIN failed\n");
   TokenManager tokens(config, runner);

   CHECK_THROWS_AS(tokens.getInitialized(), CommandError);
   CHECK(runner.count("--init-token") == 1);
}

TEST_CASE("Token operations")
{
   TempDirectory dir;
   auto          config = testConfig(dir.path);
   config.pin = "1111";

   FakeRunner   runner;
   TokenManager tokens(config, runner);
   auto&        token = tokens.getInitialized();
   runner.calls.clear();

   SECTION("hasLabels lists the token once")
   {
      runner.on("--list-objects", 0, listing({"SE_83000042", "SE_83000043"}));
      CHECK(token.hasLabels({"SE_83000042", "SE_83000043"}));
      CHECK(!token.hasLabels({"SE_83000042", "SE_83000044"}));
      CHECK(runner.calls.size() == 2);
      CHECK(runner.calls[0] == std::vector<std::string>{"pkcs11-tool", "--module",
                                                        "/usr/lib/libckteec.so.0", "--token-label",
                                                        "aktualizr", "--pin", "1111",
                                                        "--list-objects"});
   }
   SECTION("generateKeyPair")
   {
      token.generateKeyPair("01", "SE_83000044");
      REQUIRE(runner.calls.size() == 1);
      CHECK(runner.calls[0] ==
            std::vector<std::string>{"pkcs11-tool", "--module", "/usr/lib/libckteec.so.0",
                                     "--token-label", "aktualizr", "--pin", "1111", "--keypairgen",
                                     "--key-type", "EC:prime256v1", "--id", "01", "--label",
                                     "SE_83000044"});
      runner.on("--keypairgen", 1);
      CHECK_THROWS_AS(token.generateKeyPair("01", "SE_83000044"), CommandError);
   }
}
