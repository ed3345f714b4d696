#include "iequal.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK(iequal("", ""));
  CHECK(!iequal("a", ""));
  CHECK(!iequal("", "b"));

  CHECK(iequal("string", "StRiNg"));
  CHECK(!iequal("NOT string", "string"));

  CHECK(iends_with("FooBarBaz", "baz"));

  CHECK(iends_with("Bar", "bar"));

  CHECK(!iends_with("FooBarBaz", "bbaz"));
  CHECK(!iends_with("baz", "FooBarBaz"));

  CHECK(iends_with("LOCALHOST.", "localhost."));

  CHECK_EQ(to_lower("ABC@Def.GHI"), "abc@def.ghi");
  CHECK_EQ(to_lower(""), "");
  CHECK_EQ(to_lower("already.lower"), "already.lower");
}
