#include <doctest/doctest.h>
#include "auth.h"

TEST_CASE("Default credentials map to their roles") {
  auto auth = StaticCredentialProvider::with_defaults();
  CHECK(auth.authenticate("admin", "admin123").value_or("") == "admin");
  CHECK(auth.authenticate("user", "user123").value_or("") == "user");
}

TEST_CASE("Wrong password and unknown user both fail") {
  auto auth = StaticCredentialProvider::with_defaults();
  CHECK_FALSE(auth.authenticate("admin", "user123").has_value());
  CHECK_FALSE(auth.authenticate("ghost", "admin123").has_value());
  CHECK_FALSE(auth.authenticate("", "").has_value());
}

TEST_CASE("Session tokens are opaque and unique") {
  SessionStore sessions;
  auto a = sessions.create("admin", "admin");
  auto b = sessions.create("admin", "admin");
  CHECK(a.token != b.token);
  CHECK(a.token.rfind("fgs_", 0) == 0);
  CHECK(a.token.size() == 4 + 64);
  CHECK(sessions.size() == 2);
}

TEST_CASE("Sessions are found until destroyed") {
  SessionStore sessions;
  auto created = sessions.create("user", "user");
  auto found = sessions.find(created.token);
  REQUIRE(found.has_value());
  CHECK(found->user == "user");
  CHECK(found->role == "user");
  CHECK_FALSE(found->issuedAt.empty());

  CHECK(sessions.destroy(created.token));
  CHECK_FALSE(sessions.find(created.token).has_value());
  CHECK_FALSE(sessions.destroy(created.token));
  CHECK_FALSE(sessions.find("").has_value());
}
