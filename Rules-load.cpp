#include <gflags/gflags.h>
namespace gflags {
}

DEFINE_string(rules, "", "comma separated list of rule files");
DEFINE_bool(nostdrules, false, "don't add the standard rules");
DEFINE_bool(reject_message, false, "reject every message at the end of DATA");
DEFINE_string(fromreject, "", "file of MAIL FROM addresses to reject");
DEFINE_string(toaccept, "", "file of the only RCPT TO addresses to accept");
DEFINE_string(heloreject, "", "file of HELO names to reject");

#include "Rules-load.hpp"

#include "Rules-parse.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Rules {

Config config_from_flags()
{
  Config config;

  config.std_rules      = !FLAGS_nostdrules;
  config.reject_message = FLAGS_reject_message;
  config.fromreject     = FLAGS_fromreject;
  config.toaccept       = FLAGS_toaccept;
  config.heloreject     = FLAGS_heloreject;

  if (!FLAGS_rules.empty()) {
    boost::split(config.files, FLAGS_rules, boost::is_any_of(","));
    config.files.erase(std::remove(begin(config.files), end(config.files), ""),
                       end(config.files));
  }

  return config;
}

namespace {
std::string generated_rules(Config const& config)
{
  std::string text;

  if (config.std_rules) {
    text += "reject from-has bad,route\n";
    text += "reject to-has bad,route\n";
    text += "reject helo-has none\n";
  }

  if (config.reject_message)
    text += "@message reject all\n";

  if (!config.fromreject.empty()) {
    text += fmt::format("reject from {}\n",
                        quote_arg("file:" + config.fromreject));
  }
  if (!config.toaccept.empty()) {
    text += fmt::format("reject not to {}\n",
                        quote_arg("file:" + config.toaccept));
  }
  if (!config.heloreject.empty()) {
    text += fmt::format("@from reject helo {}\n",
                        quote_arg("file:" + config.heloreject));
  }

  return text;
}
} // namespace

Ruleset build(Config const& config)
{
  Ruleset ruleset{parse(generated_rules(config), "<built-in>")};

  for (auto const& file : config.files)
    ruleset.append(parse_file(file));

  return ruleset;
}

Ruleset load_or_stall(Config const& config)
{
  try {
    return build(config);
  }
  catch (parse_error const& e) {
    // Rules are loaded for every connection, say it once.
    static std::mutex            mtx;
    static std::set<std::string> logged;

    std::lock_guard<std::mutex> lock(mtx);
    if (logged.insert(e.what()).second)
      LOG(ERROR) << e.what();
  }

  return Ruleset{parse("stall all", "<fail-safe>")};
}

} // namespace Rules
