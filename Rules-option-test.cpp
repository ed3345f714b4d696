#include "Rules-option.hpp"

#include <sstream>

#include <glog/logging.h>

using Rules::find_option;
using Rules::Option;
using Rules::option_kind;
using Rules::option_str;

int main(int argc, char* argv[])
{
  CHECK(test(Option::bad, Option::route));
  CHECK(test(Option::bad, Option::garbage));
  CHECK(!test(Option::bad, Option::quoted));
  CHECK(!test(Option::zero, Option::bad));
  CHECK(test(Option::any, Option::from));

  CHECK(*find_option(option_kind::address, "resolves") == Option::domain_valid);
  CHECK(*find_option(option_kind::address, "baddom") == Option::domain_invalid);
  CHECK(*find_option(option_kind::address, "unknown")
        == Option::domain_tempfail);
  CHECK(*find_option(option_kind::helo, "ip") == Option::ip);
  CHECK(*find_option(option_kind::dns, "good") == Option::good);

  // Same bit, either name.
  CHECK(*find_option(option_kind::dbl, "helo")
        == *find_option(option_kind::dbl, "ehlo"));

  // Each kind has its own words.
  CHECK(!find_option(option_kind::address, "nodots"));
  CHECK(!find_option(option_kind::helo, "route"));
  CHECK(!find_option(option_kind::dns, "helo"));
  CHECK(!find_option(option_kind::dbl, "nodns"));
  CHECK(!find_option(option_kind::address, ""));

  CHECK_EQ(option_str(option_kind::address, Option::bad), "bad");
  CHECK_EQ(option_str(option_kind::address, Option::bad | Option::quoted),
           "bad,quoted");
  CHECK_EQ(option_str(option_kind::address, Option::route | Option::noat),
           "noat,route");
  CHECK_EQ(option_str(option_kind::helo, Option::ip | Option::myip),
           "ip,myip");
  CHECK_EQ(option_str(option_kind::helo, Option::bareip), "bareip");
  CHECK_EQ(option_str(option_kind::dns, Option::nodns | Option::inconsistent),
           "inconsistent,nodns");
  CHECK_EQ(option_str(option_kind::dbl, Option::host | Option::from), "from,host");
  CHECK_EQ(option_str(option_kind::dbl, Option::any), "any");
  CHECK_EQ(option_str(option_kind::dbl, Option::ehlo), "helo");

  // Every name reads back as itself.
  for (auto word : {"unqualified", "route", "quoted", "noat", "garbage", "bad",
                    "resolves", "baddom", "unknown"}) {
    CHECK_EQ(option_str(option_kind::address,
                        *find_option(option_kind::address, word)),
             word);
  }

  std::ostringstream os;
  os << (Option::none | Option::nodots);
  CHECK_EQ(os.str(), "none|nodots");

  std::ostringstream zero;
  zero << Option::zero;
  CHECK_EQ(zero.str(), "zero");
}
